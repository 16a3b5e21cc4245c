/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_PARTICIPANT_H
#define MESHCALL_PARTICIPANT_H

#include "common.hpp"
#include "mediastream.hpp"

#include <iostream>

namespace meshcall {

enum class ConnectionState { New, Connecting, Connected, Disconnected, Failed, Closed };

enum class NetworkQuality { Excellent, Good, Fair, Poor, Critical };

enum class MediaType { Camera, Screen, Audio };

struct Participant {
	string id;
	string userId;
	string name = "Unknown";
	std::map<string, shared_ptr<MediaStream>> streams; // keyed by stream id
	bool audioEnabled = true;
	bool videoEnabled = true;
	bool screenSharing = false;
	ConnectionState connectionState = ConnectionState::New;
	NetworkQuality networkQuality = NetworkQuality::Good;
};

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::ConnectionState state);
MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::NetworkQuality quality);
MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::MediaType type);

#endif
