/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_MEDIA_DEVICES_H
#define MESHCALL_MEDIA_DEVICES_H

#include "common.hpp"
#include "configuration.hpp"
#include "mediastream.hpp"

namespace meshcall {

struct DeviceInfo {
	enum class Kind { VideoInput, AudioInput, ScreenInput };

	string deviceId;
	Kind kind;
	string label;
};

// Capture capability. Implementations report failures with CallError using
// PermissionDenied, DeviceNotFound or MediaError.
class MESHCALL_CPP_EXPORT MediaDevices {
public:
	virtual ~MediaDevices() = default;

	virtual std::vector<DeviceInfo> enumerateDevices() = 0;

	// Camera and microphone
	virtual shared_ptr<MediaStream> getUserMedia(const MediaConstraints &constraints) = 0;

	// Screen capture, the video track ends by itself when the user stops sharing
	virtual shared_ptr<MediaStream> getDisplayMedia(const ScreenShareOptions &options) = 0;

	// Opens a single capture track on a specific device
	virtual shared_ptr<MediaTrack> openDevice(MediaKind kind, const string &deviceId) = 0;
};

} // namespace meshcall

#endif
