/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "participant.hpp"

std::ostream &operator<<(std::ostream &out, meshcall::ConnectionState state) {
	using State = meshcall::ConnectionState;
	const char *str;
	switch (state) {
	case State::New:
		str = "new";
		break;
	case State::Connecting:
		str = "connecting";
		break;
	case State::Connected:
		str = "connected";
		break;
	case State::Disconnected:
		str = "disconnected";
		break;
	case State::Failed:
		str = "failed";
		break;
	case State::Closed:
		str = "closed";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}

std::ostream &operator<<(std::ostream &out, meshcall::NetworkQuality quality) {
	using Quality = meshcall::NetworkQuality;
	const char *str;
	switch (quality) {
	case Quality::Excellent:
		str = "excellent";
		break;
	case Quality::Good:
		str = "good";
		break;
	case Quality::Fair:
		str = "fair";
		break;
	case Quality::Poor:
		str = "poor";
		break;
	case Quality::Critical:
		str = "critical";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}

std::ostream &operator<<(std::ostream &out, meshcall::MediaType type) {
	using Type = meshcall::MediaType;
	const char *str;
	switch (type) {
	case Type::Camera:
		str = "camera";
		break;
	case Type::Screen:
		str = "screen";
		break;
	case Type::Audio:
		str = "audio";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}
