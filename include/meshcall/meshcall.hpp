/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_MESHCALL_H
#define MESHCALL_MESHCALL_H

#include "common.hpp"
#include "global.hpp"

#include "configuration.hpp"
#include "error.hpp"
#include "events.hpp"
#include "mediadevices.hpp"
#include "mediastream.hpp"
#include "negotiation.hpp"
#include "participant.hpp"
#include "peertransport.hpp"
#include "recorder.hpp"
#include "session.hpp"
#include "signaling.hpp"
#include "stats.hpp"

// Concrete implementations
#include "datachanneltransport.hpp"
#include "filecapture.hpp"
#include "websocketsignaling.hpp"

#endif
