/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "mediapipeline.hpp"
#include "internals.hpp"

#include "error.hpp"

#include <sstream>
#include <utility>

namespace meshcall::impl {

template <typename F> auto MediaPipeline::capture(F &&f) -> decltype(f()) {
	try {
		return f();
	} catch (const CallError &) {
		throw;
	} catch (const std::exception &e) {
		throw CallError(ErrorCode::MediaError, e.what());
	}
}

MediaPipeline::MediaPipeline(string localUserId, shared_ptr<MediaDevices> devices,
                             shared_ptr<PeerManager> peers, Hooks hooks)
    : mLocalUserId(std::move(localUserId)), mDevices(std::move(devices)), mPeers(std::move(peers)),
      mHooks(std::move(hooks)) {}

MediaPipeline::~MediaPipeline() { releaseAll(); }

shared_ptr<MediaStream> MediaPipeline::acquireLocalStream(const MediaConstraints &constraints) {
	std::lock_guard lock(mMutex);
	if (mLocalStream) {
		PLOG_WARNING << "Local stream already acquired";
		return mLocalStream;
	}

	if (!mDevices)
		throw CallError(ErrorCode::DeviceNotFound, "No media devices available");

	auto stream = capture([&]() { return mDevices->getUserMedia(constraints); });
	PLOG_INFO << "Acquired local stream " << stream->id() << " with " << stream->tracks().size()
	          << " tracks";

	mLocalStream = stream;
	for (const auto &track : stream->tracks())
		mPeers->attachTrack(track, stream->id());

	const MediaType type = stream->videoTracks().empty() ? MediaType::Audio : MediaType::Camera;
	mHooks.emit(StreamAddedEvent{stream, type, true, nullopt});
	return stream;
}

bool MediaPipeline::toggleAudio(optional<bool> enabled) { return toggle(MediaKind::Audio, enabled); }

bool MediaPipeline::toggleVideo(optional<bool> enabled) { return toggle(MediaKind::Video, enabled); }

bool MediaPipeline::toggle(MediaKind kind, optional<bool> enabled) {
	std::lock_guard lock(mMutex);
	auto tracks = mLocalStream ? (kind == MediaKind::Audio ? mLocalStream->audioTracks()
	                                                       : mLocalStream->videoTracks())
	                           : std::vector<shared_ptr<MediaTrack>>{};
	if (tracks.empty()) {
		PLOG_WARNING << "No local " << kind << " track to toggle";
		return false;
	}

	const bool state = enabled.value_or(!tracks.front()->enabled());
	for (const auto &track : tracks)
		track->setEnabled(state);

	PLOG_INFO << "Local " << kind << " " << (state ? "enabled" : "disabled");

	std::ostringstream type;
	type << kind;
	broadcast(state ? signaling::TrackEnabled : signaling::TrackDisabled,
	          {{"participantId", mLocalUserId}, {"type", type.str()}, {"enabled", state}});

	mHooks.emit(TrackToggledEvent{kind, state, nullopt});
	return state;
}

shared_ptr<MediaStream> MediaPipeline::startScreenShare(const ScreenShareOptions &options) {
	std::lock_guard lock(mMutex);
	if (mScreenStream) {
		PLOG_WARNING << "Screen share already running";
		return mScreenStream;
	}

	if (!mDevices)
		throw CallError(ErrorCode::DeviceNotFound, "No media devices available");

	auto stream = capture([&]() { return mDevices->getDisplayMedia(options); });
	auto videoTracks = stream->videoTracks();
	if (videoTracks.empty()) {
		stream->stop();
		throw CallError(ErrorCode::MediaError, "Screen capture has no video track");
	}

	auto screenTrack = videoTracks.front();
	mScreenStream = stream;

	if (mPeers->hasLocalTrack(MediaKind::Video))
		mPeers->replaceTrack(MediaKind::Video, screenTrack);
	else
		mPeers->attachTrack(screenTrack, stream->id());

	// The user may stop sharing from the capture side
	screenTrack->onEnded([weak_this = weak_from_this()]() {
		auto self = weak_this.lock();
		if (!self || !self->mHooks.post)
			return;

		self->mHooks.post([weak_this]() {
			if (auto self = weak_this.lock()) {
				PLOG_INFO << "Screen capture ended";
				self->stopScreenShare();
			}
		});
	});

	PLOG_INFO << "Screen share started";
	broadcast(signaling::ScreenShareStart, {{"participantId", mLocalUserId}});
	mHooks.emit(ScreenShareStartedEvent{nullopt, stream});
	return stream;
}

void MediaPipeline::stopScreenShare() {
	std::lock_guard lock(mMutex);
	if (!mScreenStream)
		return;

	auto stream = std::exchange(mScreenStream, nullptr);
	for (const auto &track : stream->tracks())
		track->onEnded(nullptr);

	stream->stop();

	// Restore the camera in place, nothing to send if there is none
	auto camera = localTrack(MediaKind::Video);
	mPeers->replaceTrack(MediaKind::Video, camera && camera->isLive() ? camera : nullptr);

	PLOG_INFO << "Screen share stopped";
	broadcast(signaling::ScreenShareEnd, {{"participantId", mLocalUserId}});
	mHooks.emit(ScreenShareEndedEvent{nullopt});
}

bool MediaPipeline::isScreenSharing() const {
	std::lock_guard lock(mMutex);
	return mScreenStream != nullptr;
}

void MediaPipeline::switchDevice(MediaKind kind, const string &deviceId) {
	std::lock_guard lock(mMutex);
	if (!mLocalStream)
		throw CallError(ErrorCode::MediaError, "No local stream to switch devices on");

	if (!mDevices)
		throw CallError(ErrorCode::DeviceNotFound, "No media devices available");

	auto track = capture([&]() { return mDevices->openDevice(kind, deviceId); });
	auto previous = localTrack(kind);
	if (previous)
		track->setEnabled(previous->enabled());

	// While sharing the screen, the camera only comes back on stop
	const bool sending = !(kind == MediaKind::Video && mScreenStream);
	if (sending) {
		if (mPeers->hasLocalTrack(kind))
			mPeers->replaceTrack(kind, track);
		else
			mPeers->attachTrack(track, mLocalStream->id());
	}

	if (previous) {
		mLocalStream->removeTrack(previous->id());
		previous->stop();
	}
	mLocalStream->addTrack(track);

	PLOG_INFO << "Switched local " << kind << " to device \"" << deviceId << "\"";
}

void MediaPipeline::releaseAll() {
	std::lock_guard lock(mMutex);
	if (mScreenStream) {
		for (const auto &track : mScreenStream->tracks())
			track->onEnded(nullptr);

		mScreenStream->stop();
		mScreenStream.reset();
	}

	if (mLocalStream) {
		PLOG_DEBUG << "Releasing local stream " << mLocalStream->id();
		mLocalStream->stop();
		mLocalStream.reset();
	}
}

shared_ptr<MediaStream> MediaPipeline::localStream() const {
	std::lock_guard lock(mMutex);
	return mLocalStream;
}

shared_ptr<MediaStream> MediaPipeline::screenStream() const {
	std::lock_guard lock(mMutex);
	return mScreenStream;
}

shared_ptr<MediaTrack> MediaPipeline::localTrack(MediaKind kind) const {
	if (!mLocalStream)
		return nullptr;

	auto tracks = kind == MediaKind::Audio ? mLocalStream->audioTracks() : mLocalStream->videoTracks();
	return !tracks.empty() ? tracks.front() : nullptr;
}

void MediaPipeline::broadcast(const string &event, const json &payload) {
	if (!mHooks.broadcast)
		return;

	try {
		mHooks.broadcast(event, payload);
	} catch (const std::exception &e) {
		PLOG_WARNING << "Unable to broadcast " << event << ": " << e.what();
	}
}

} // namespace meshcall::impl
