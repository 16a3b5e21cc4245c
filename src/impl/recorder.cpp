/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "recorder.hpp"
#include "internals.hpp"

#include "error.hpp"

#include <numeric>

namespace meshcall::impl {

Recorder::Recorder(shared_ptr<MediaEncoderFactory> factory, std::chrono::milliseconds timeslice)
    : mFactory(std::move(factory)), mTimeslice(timeslice) {}

Recorder::~Recorder() {
	try {
		stop();
	} catch (const std::exception &e) {
		PLOG_WARNING << "Failed to stop recording: " << e.what();
	}
}

string Recorder::start(const RecordingOptions &options, shared_ptr<MediaStream> stream) {
	std::unique_lock lock(mMutex);
	if (mState != RecordingState::Inactive)
		throw CallError(ErrorCode::RecordingError, "Recording already in progress");

	if (!stream || stream->empty())
		throw CallError(ErrorCode::RecordingError, "Nothing to record");

	if (!mFactory)
		throw CallError(ErrorCode::RecordingError, "No media encoder available");

	auto mimeType = ChooseMimeType(*mFactory, options.mimeType);
	if (!mimeType)
		throw CallError(ErrorCode::RecordingError, "No supported recording format");

	try {
		mEncoder = mFactory->create(*mimeType, options);
	} catch (const std::exception &e) {
		throw CallError(ErrorCode::RecordingError,
		                string("Unable to create the media encoder: ") + e.what());
	}

	mMimeType = *mimeType;
	mChunks.clear();
	mState = RecordingState::Recording;

	for (const auto &track : stream->tracks()) {
		const auto kind = track->kind();
		const auto trackId = track->id();
		auto sinkId = track->addSink([weak_this = weak_from_this(), kind, trackId](
		                                 const binary &frame, std::chrono::microseconds timestamp) {
			if (auto self = weak_this.lock())
				self->feed(kind, trackId, frame, timestamp);
		});
		mSources.push_back({track, sinkId});
	}

	mTimer = std::make_unique<PeriodicTimer>(mTimeslice, weak_bind(&Recorder::tick, this));
	mTimer->start();

	PLOG_INFO << "Recording " << mSources.size() << " tracks as " << mMimeType;
	return mMimeType;
}

bool Recorder::pause() {
	std::lock_guard lock(mMutex);
	if (mState != RecordingState::Recording)
		return false;

	PLOG_DEBUG << "Recording paused";
	mState = RecordingState::Paused;
	return true;
}

bool Recorder::resume() {
	std::lock_guard lock(mMutex);
	if (mState != RecordingState::Paused)
		return false;

	PLOG_DEBUG << "Recording resumed";
	mState = RecordingState::Recording;
	return true;
}

optional<RecordingResult> Recorder::stop() {
	unique_ptr<PeriodicTimer> timer;
	{
		std::lock_guard lock(mMutex);
		if (mState == RecordingState::Inactive)
			return nullopt;

		timer = std::move(mTimer);
	}

	// The tick takes the lock
	if (timer)
		timer->stop();

	std::lock_guard lock(mMutex);
	if (mState == RecordingState::Inactive)
		return nullopt;

	detach();
	flush();

	RecordingResult result;
	result.mimeType = std::move(mMimeType);
	const size_t size = std::accumulate(
	    mChunks.begin(), mChunks.end(), size_t(0),
	    [](size_t total, const binary &chunk) { return total + chunk.size(); });
	result.blob.reserve(size);
	for (const auto &chunk : mChunks)
		result.blob.insert(result.blob.end(), chunk.begin(), chunk.end());

	mChunks.clear();
	mEncoder.reset();
	mState = RecordingState::Inactive;

	PLOG_INFO << "Recording stopped, " << result.blob.size() << " bytes";
	return result;
}

RecordingState Recorder::state() const {
	std::lock_guard lock(mMutex);
	return mState;
}

size_t Recorder::chunkCount() const {
	std::lock_guard lock(mMutex);
	return mChunks.size();
}

void Recorder::feed(MediaKind kind, const string &trackId, const binary &frame,
                    std::chrono::microseconds timestamp) {
	std::lock_guard lock(mMutex);
	if (mState != RecordingState::Recording || !mEncoder)
		return;

	try {
		mEncoder->encode(kind, trackId, frame, timestamp);
	} catch (const std::exception &e) {
		PLOG_WARNING << "Failed to encode frame of track \"" << trackId << "\": " << e.what();
	}
}

void Recorder::tick() {
	std::lock_guard lock(mMutex);
	flush();
}

void Recorder::flush() {
	if (!mEncoder)
		return;

	auto chunk = mEncoder->flush();
	if (chunk.empty())
		return;

	PLOG_VERBOSE << "Recorded chunk of " << chunk.size() << " bytes";
	mChunks.push_back(std::move(chunk));
}

void Recorder::detach() {
	for (const auto &source : mSources)
		source.track->removeSink(source.sinkId);

	mSources.clear();
}

} // namespace meshcall::impl
