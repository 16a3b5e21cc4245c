/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "error.hpp"

namespace meshcall {

CallError::CallError(ErrorCode code, const string &message)
    : std::runtime_error(message), mCode(code) {}

string errorCodeToString(ErrorCode code) {
	switch (code) {
	case ErrorCode::PermissionDenied:
		return "PERMISSION_DENIED";
	case ErrorCode::DeviceNotFound:
		return "DEVICE_NOT_FOUND";
	case ErrorCode::MediaError:
		return "MEDIA_ERROR";
	case ErrorCode::SignalingError:
		return "SIGNALING_ERROR";
	case ErrorCode::PeerConnectionFailed:
		return "PEER_CONNECTION_FAILED";
	case ErrorCode::RecordingError:
		return "RECORDING_ERROR";
	case ErrorCode::NetworkError:
		return "NETWORK_ERROR";
	case ErrorCode::Timeout:
		return "TIMEOUT";
	default:
		return "UNKNOWN";
	}
}

} // namespace meshcall

std::ostream &operator<<(std::ostream &out, meshcall::ErrorCode code) {
	return out << meshcall::errorCodeToString(code);
}
