/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_FILE_CAPTURE_H
#define MESHCALL_FILE_CAPTURE_H

#include "common.hpp"
#include "mediadevices.hpp"

namespace meshcall {

namespace impl {
class FileCapture;
}

// Capture devices playing numbered sample files, "sample-0.h264", "sample-1.h264"...
// for video (length-prefixed NAL units) and "sample-0.opus"... for audio.
class MESHCALL_CPP_EXPORT FileCaptureDevices final : public MediaDevices {
public:
	struct Source {
		string directory;
		unsigned int samplesPerSecond;
		bool loop = true;
	};

	struct Configuration {
		optional<Source> camera;
		optional<Source> microphone;
		optional<Source> screen;
	};

	FileCaptureDevices(Configuration config);
	~FileCaptureDevices();

	std::vector<DeviceInfo> enumerateDevices() override;
	shared_ptr<MediaStream> getUserMedia(const MediaConstraints &constraints) override;
	shared_ptr<MediaStream> getDisplayMedia(const ScreenShareOptions &options) override;
	shared_ptr<MediaTrack> openDevice(MediaKind kind, const string &deviceId) override;

	// Stops every running capture
	void stopAll();

private:
	shared_ptr<MediaTrack> startCapture(const Source &source, MediaKind kind, const string &label,
	                                    const string &deviceId);

	const Configuration mConfig;
	std::vector<shared_ptr<impl::FileCapture>> mCaptures;
	std::mutex mMutex;
};

} // namespace meshcall

#endif
