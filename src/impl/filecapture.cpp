/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "filecapture.hpp"
#include "internals.hpp"
#include "threadpool.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace meshcall::impl {

FileCapture::FileCapture(Source source, shared_ptr<MediaTrack> track)
    : mSource(std::move(source)), mExtension(track->kind() == MediaKind::Video ? ".h264" : ".opus"),
      mSampleDuration(std::chrono::microseconds(1000 * 1000 / std::max(1u, mSource.samplesPerSecond))),
      mTrack(std::move(track)), mSampleTime(0) {}

FileCapture::~FileCapture() { stop(); }

void FileCapture::start() {
	if (mRunning.exchange(true))
		return;

	PLOG_DEBUG << "Starting file capture from " << mSource.directory << " on track \""
	           << mTrack->id() << "\"";
	mCounter = -1;
	mSampleTime = std::chrono::microseconds::zero();
	mNextTime = clock::now();
	ThreadPool::Instance().schedule(mNextTime, weak_bind(&FileCapture::tick, this));
}

void FileCapture::stop() {
	if (mRunning.exchange(false))
		PLOG_DEBUG << "Stopped file capture on track \"" << mTrack->id() << "\"";
}

bool FileCapture::isRunning() const { return mRunning; }

void FileCapture::tick() {
	if (!mRunning)
		return;

	if (!mTrack->isLive()) {
		stop();
		return;
	}

	auto sample = loadNextSample();
	if (!sample) {
		PLOG_INFO << "End of file capture on track \"" << mTrack->id() << "\"";
		stop();
		mTrack->end();
		return;
	}

	if (mTrack->kind() == MediaKind::Video)
		mTrack->deliver(LengthPrefixedToAnnexB(*sample), mSampleTime);
	else
		mTrack->deliver(*sample, mSampleTime);

	mSampleTime += mSampleDuration;
	mNextTime += mSampleDuration;
	ThreadPool::Instance().schedule(mNextTime, weak_bind(&FileCapture::tick, this));
}

optional<binary> FileCapture::loadNextSample() {
	string url = mSource.directory + "/sample-" + std::to_string(++mCounter) + mExtension;
	std::ifstream file(url, std::ios_base::binary);
	if (!file) {
		if (mSource.loop && mCounter > 0) {
			mCounter = -1;
			return loadNextSample();
		}
		return nullopt;
	}

	std::vector<char> contents((std::istreambuf_iterator<char>(file)),
	                           std::istreambuf_iterator<char>());
	auto *b = reinterpret_cast<const byte *>(contents.data());
	return binary(b, b + contents.size());
}

binary FileCapture::LengthPrefixedToAnnexB(const binary &sample) {
	static const binary startCode = {byte{0}, byte{0}, byte{0}, byte{1}};

	binary result;
	result.reserve(sample.size());
	size_t i = 0;
	while (i + 4 <= sample.size()) {
		uint32_t length = std::to_integer<uint32_t>(sample[i]) << 24 |
		                  std::to_integer<uint32_t>(sample[i + 1]) << 16 |
		                  std::to_integer<uint32_t>(sample[i + 2]) << 8 |
		                  std::to_integer<uint32_t>(sample[i + 3]);
		size_t begin = i + 4;
		size_t end = begin + length;
		if (end > sample.size()) {
			PLOG_WARNING << "Truncated NAL unit in sample, expected " << length << " bytes";
			break;
		}

		result.insert(result.end(), startCode.begin(), startCode.end());
		result.insert(result.end(), sample.begin() + begin, sample.begin() + end);
		i = end;
	}
	return result;
}

} // namespace meshcall::impl
