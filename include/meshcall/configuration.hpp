/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_CONFIGURATION_H
#define MESHCALL_CONFIGURATION_H

#include "common.hpp"

#include <vector>

namespace meshcall {

struct MESHCALL_CPP_EXPORT IceServer {
	enum class Type { Stun, Turn };
	enum class RelayType { TurnUdp, TurnTcp, TurnTls };

	// Parses stun:, turn: and turns: URLs
	IceServer(const string &url);

	// STUN
	IceServer(string hostname_, uint16_t port_);

	// TURN
	IceServer(string hostname_, uint16_t port_, string username_, string password_,
	          RelayType relayType_ = RelayType::TurnUdp);

	string url() const;

	string hostname;
	uint16_t port;
	Type type;
	string username;
	string password;
	RelayType relayType;
};

// Public STUN servers, plus a TURN server from MESHCALL_TURN_URL if set
MESHCALL_CPP_EXPORT std::vector<IceServer> DefaultIceServers();

template <typename T> struct Range {
	optional<T> min;
	optional<T> ideal;
	optional<T> max;
};

struct VideoConstraints {
	Range<int> width;
	Range<int> height;
	Range<int> frameRate;
	string facingMode = "user";
	optional<string> deviceId;
};

struct AudioConstraints {
	bool echoCancellation = true;
	bool noiseSuppression = true;
	bool autoGainControl = true;
	optional<int> sampleRate;
	optional<int> channelCount;
	optional<string> deviceId;
};

// An unset member means the kind is not requested
struct MediaConstraints {
	optional<VideoConstraints> video;
	optional<AudioConstraints> audio;
};

MESHCALL_CPP_EXPORT MediaConstraints DefaultMediaConstraints(bool video, bool audio);

struct ScreenShareOptions {
	enum class DisplaySurface { Monitor, Window, Browser };
	enum class Cursor { Always, Motion, Never };

	DisplaySurface displaySurface = DisplaySurface::Monitor;
	Cursor cursor = Cursor::Always;
	bool audio = false;
};

struct RecordingOptions {
	optional<string> mimeType;
	optional<unsigned int> videoBitsPerSecond;
	optional<unsigned int> audioBitsPerSecond;
	bool recordCamera = true;
	bool recordAudio = true;
	bool recordScreen = false;
	std::vector<string> remoteStreams; // stream ids of remote participants
};

struct CallConfig {
	string roomId;
	string userId;
	string displayName;
	bool video = true;
	bool audio = true;
	std::vector<IceServer> iceServers = DefaultIceServers();
	optional<MediaConstraints> mediaConstraints; // derived from video/audio if unset
	std::chrono::milliseconds statsInterval = std::chrono::seconds(2);
	std::chrono::milliseconds recordingTimeslice = std::chrono::seconds(1);
	size_t maxParticipants = 0; // 0 means unlimited
};

} // namespace meshcall

#endif
