/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_RECORDER_H
#define MESHCALL_IMPL_RECORDER_H

#include "common.hpp"
#include "meshcall/recorder.hpp"
#include "periodictimer.hpp"

#include <mutex>

namespace meshcall::impl {

struct RecordingResult {
	binary blob;
	string mimeType;
};

// Feeds the tracks of a composite stream to an encoder and buffers the encoded
// data in chunks of one timeslice
class Recorder final : public std::enable_shared_from_this<Recorder> {
public:
	Recorder(shared_ptr<MediaEncoderFactory> factory, std::chrono::milliseconds timeslice);
	~Recorder();

	// Returns the chosen mime type, throws CallError with RecordingError
	string start(const RecordingOptions &options, shared_ptr<MediaStream> stream);

	// Return false if not applicable in the current state
	bool pause();
	bool resume();

	// Returns nullopt if inactive
	optional<RecordingResult> stop();

	RecordingState state() const;
	size_t chunkCount() const;

private:
	void feed(MediaKind kind, const string &trackId, const binary &frame,
	          std::chrono::microseconds timestamp);
	void tick();
	void flush(); // mMutex must be locked
	void detach();

	struct Source {
		shared_ptr<MediaTrack> track;
		MediaTrack::SinkId sinkId;
	};

	const shared_ptr<MediaEncoderFactory> mFactory;
	const std::chrono::milliseconds mTimeslice;

	RecordingState mState = RecordingState::Inactive;
	string mMimeType;
	unique_ptr<MediaEncoder> mEncoder;
	unique_ptr<PeriodicTimer> mTimer;
	std::vector<Source> mSources;
	std::vector<binary> mChunks;

	mutable std::mutex mMutex;
};

} // namespace meshcall::impl

#endif
