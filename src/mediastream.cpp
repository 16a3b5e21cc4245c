/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "mediastream.hpp"

#include "impl/internals.hpp"

#include <algorithm>

namespace meshcall {

MediaTrack::MediaTrack(string id, MediaKind kind, string label, string deviceId)
    : mId(std::move(id)), mKind(kind), mLabel(std::move(label)), mDeviceId(std::move(deviceId)) {}

MediaTrack::~MediaTrack() {}

bool MediaTrack::enabled() const {
	std::lock_guard lock(mMutex);
	return mEnabled;
}

void MediaTrack::setEnabled(bool enabled) {
	std::lock_guard lock(mMutex);
	mEnabled = enabled;
}

MediaTrack::ReadyState MediaTrack::readyState() const {
	std::lock_guard lock(mMutex);
	return mReadyState;
}

void MediaTrack::stop() {
	std::lock_guard lock(mMutex);
	if (mReadyState == ReadyState::Ended)
		return;

	PLOG_VERBOSE << "Stopping " << mKind << " track \"" << mId << "\"";
	mReadyState = ReadyState::Ended;
	mSinks.clear();
}

void MediaTrack::end() {
	{
		std::lock_guard lock(mMutex);
		if (mReadyState == ReadyState::Ended)
			return;

		PLOG_DEBUG << "Track \"" << mId << "\" ended";
		mReadyState = ReadyState::Ended;
		mSinks.clear();
	}
	mEndedCallback();
}

void MediaTrack::onEnded(std::function<void()> callback) { mEndedCallback = std::move(callback); }

MediaTrack::SinkId MediaTrack::addSink(FrameCallback callback) {
	std::lock_guard lock(mMutex);
	SinkId id = mNextSinkId++;
	mSinks.emplace(id, std::move(callback));
	return id;
}

void MediaTrack::removeSink(SinkId id) {
	std::lock_guard lock(mMutex);
	mSinks.erase(id);
}

void MediaTrack::deliver(const binary &frame, std::chrono::microseconds timestamp) {
	std::vector<FrameCallback> sinks;
	{
		std::lock_guard lock(mMutex);
		if (!mEnabled || mReadyState == ReadyState::Ended)
			return;

		sinks.reserve(mSinks.size());
		for (const auto &[id, sink] : mSinks)
			sinks.push_back(sink);
	}

	for (const auto &sink : sinks) {
		try {
			sink(frame, timestamp);
		} catch (const std::exception &e) {
			PLOG_WARNING << "Frame sink of track \"" << mId << "\" failed: " << e.what();
		}
	}
}

MediaStream::MediaStream(string id) : mId(std::move(id)) {}

std::vector<shared_ptr<MediaTrack>> MediaStream::tracks() const {
	std::lock_guard lock(mMutex);
	return mTracks;
}

std::vector<shared_ptr<MediaTrack>> MediaStream::audioTracks() const {
	std::lock_guard lock(mMutex);
	std::vector<shared_ptr<MediaTrack>> result;
	std::copy_if(mTracks.begin(), mTracks.end(), std::back_inserter(result),
	             [](const auto &track) { return track->kind() == MediaKind::Audio; });
	return result;
}

std::vector<shared_ptr<MediaTrack>> MediaStream::videoTracks() const {
	std::lock_guard lock(mMutex);
	std::vector<shared_ptr<MediaTrack>> result;
	std::copy_if(mTracks.begin(), mTracks.end(), std::back_inserter(result),
	             [](const auto &track) { return track->kind() == MediaKind::Video; });
	return result;
}

shared_ptr<MediaTrack> MediaStream::track(const string &trackId) const {
	std::lock_guard lock(mMutex);
	auto it = std::find_if(mTracks.begin(), mTracks.end(),
	                       [&](const auto &track) { return track->id() == trackId; });
	return it != mTracks.end() ? *it : nullptr;
}

void MediaStream::addTrack(shared_ptr<MediaTrack> track) {
	std::lock_guard lock(mMutex);
	auto it = std::find(mTracks.begin(), mTracks.end(), track);
	if (it == mTracks.end())
		mTracks.push_back(std::move(track));
}

bool MediaStream::removeTrack(const string &trackId) {
	std::lock_guard lock(mMutex);
	auto it = std::find_if(mTracks.begin(), mTracks.end(),
	                       [&](const auto &track) { return track->id() == trackId; });
	if (it == mTracks.end())
		return false;

	mTracks.erase(it);
	return true;
}

bool MediaStream::empty() const {
	std::lock_guard lock(mMutex);
	return mTracks.empty();
}

void MediaStream::stop() {
	for (const auto &track : tracks())
		track->stop();
}

} // namespace meshcall

std::ostream &operator<<(std::ostream &out, meshcall::MediaKind kind) {
	return out << (kind == meshcall::MediaKind::Audio ? "audio" : "video");
}
