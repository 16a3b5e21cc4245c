/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_ERROR_H
#define MESHCALL_ERROR_H

#include "common.hpp"

#include <iostream>
#include <stdexcept>

namespace meshcall {

enum class ErrorCode {
	PermissionDenied,
	DeviceNotFound,
	MediaError,
	SignalingError,
	PeerConnectionFailed,
	RecordingError,
	NetworkError,
	Timeout,
	Unknown
};

class MESHCALL_CPP_EXPORT CallError : public std::runtime_error {
public:
	CallError(ErrorCode code, const string &message);

	ErrorCode code() const { return mCode; }

	// Peer the error relates to, if any
	optional<string> participantId;

private:
	ErrorCode mCode;
};

MESHCALL_CPP_EXPORT string errorCodeToString(ErrorCode code);

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::ErrorCode code);

#endif
