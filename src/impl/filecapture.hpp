/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_FILE_CAPTURE_H
#define MESHCALL_IMPL_FILE_CAPTURE_H

#include "common.hpp"
#include "init.hpp"
#include "mediastream.hpp"

#include "meshcall/filecapture.hpp"

#include <atomic>

namespace meshcall::impl {

// Feeds a track with numbered sample files, paced on the thread pool
class FileCapture final : public std::enable_shared_from_this<FileCapture> {
public:
	using Source = FileCaptureDevices::Source;

	FileCapture(Source source, shared_ptr<MediaTrack> track);
	~FileCapture();

	void start();
	void stop();
	bool isRunning() const;

	shared_ptr<MediaTrack> track() const { return mTrack; }

	// Rewrites length-prefixed NAL units with Annex-B start codes
	static binary LengthPrefixedToAnnexB(const binary &sample);

private:
	void tick();
	optional<binary> loadNextSample();

	const init_token mInitToken = Init::Instance().token();
	const Source mSource;
	const string mExtension;
	const std::chrono::microseconds mSampleDuration;
	const shared_ptr<MediaTrack> mTrack;

	int mCounter = -1;
	std::chrono::microseconds mSampleTime;
	clock::time_point mNextTime;
	std::atomic<bool> mRunning = false;
};

} // namespace meshcall::impl

#endif
