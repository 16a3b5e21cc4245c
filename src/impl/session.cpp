/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "session.hpp"
#include "internals.hpp"

#include "error.hpp"
#include "meshcall/datachanneltransport.hpp"

#include <stdexcept>

namespace meshcall::impl {

template <typename F> auto Session::report(F &&f) -> decltype(f()) {
	try {
		return f();
	} catch (const CallError &e) {
		emit(ErrorEvent{e.code(), e.what(), nullopt});
		throw;
	}
}

Session::Session(CallConfig config, SessionDependencies dependencies)
    : mConfig(std::move(config)), mSignaling(std::move(dependencies.signaling)),
      mTransports(dependencies.transports ? std::move(dependencies.transports)
                                          : std::make_shared<DataChannelTransportFactory>()),
      mDevices(std::move(dependencies.devices)),
      mEncoders(dependencies.encoders ? std::move(dependencies.encoders)
                                      : std::make_shared<ElementaryStreamEncoderFactory>()),
      mProcessor(std::make_shared<Processor>()) {

	if (!mSignaling)
		throw std::invalid_argument("A signaling channel is required");

	if (mConfig.roomId.empty())
		throw std::invalid_argument("Room id is empty");

	if (mConfig.userId.empty())
		throw std::invalid_argument("User id is empty");

	PLOG_VERBOSE << "Creating session for " << mConfig.userId << " in room " << mConfig.roomId;
}

Session::~Session() {
	PLOG_VERBOSE << "Destroying session";
	try {
		cleanup();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

void Session::init() {
	auto weak_this = weak_from_this();
	auto emitter = [weak_this](Event event) {
		if (auto self = weak_this.lock())
			self->emit(std::move(event));
	};
	auto poster = [weak_this](std::function<void()> task) {
		if (auto self = weak_this.lock())
			self->post(std::move(task));
	};
	auto broadcaster = [weak_this](const string &event, const json &payload) {
		if (auto self = weak_this.lock())
			self->broadcast(event, payload);
	};

	PeerManager::Settings settings;
	settings.roomId = mConfig.roomId;
	settings.localUserId = mConfig.userId;
	settings.iceServers = mConfig.iceServers;
	settings.maxParticipants = mConfig.maxParticipants;
	mPeers = std::make_shared<PeerManager>(std::move(settings), mTransports,
	                                       PeerManager::Hooks{broadcaster, emitter, poster});

	mMedia = std::make_shared<MediaPipeline>(mConfig.userId, mDevices, mPeers,
	                                         MediaPipeline::Hooks{broadcaster, emitter, poster});

	mRecorder = std::make_shared<Recorder>(mEncoders, mConfig.recordingTimeslice);

	mStats = std::make_shared<StatsMonitor>(mPeers, mConfig.statsInterval, poster, emitter);

	mSignaling->onMessage([weak_this](string event, json payload) {
		auto self = weak_this.lock();
		if (!self)
			return;

		self->post([weak_this, event = std::move(event), payload = std::move(payload)]() {
			if (auto self = weak_this.lock())
				self->mPeers->handleSignal(event, payload);
		});
	});
}

void Session::initialize() {
	checkOpen();
	if (mInitialized) {
		PLOG_WARNING << "Session already initialized";
		return;
	}

	PLOG_INFO << "Joining room " << mConfig.roomId << " as " << mConfig.userId;
	report([this]() {
		try {
			if (mConfig.video || mConfig.audio) {
				auto constraints = mConfig.mediaConstraints.value_or(
				    DefaultMediaConstraints(mConfig.video, mConfig.audio));
				mMedia->acquireLocalStream(constraints);
			}

			mSignaling->connect(mConfig.roomId);

			broadcast(signaling::CallStart, {{"participant", presence()}});

			mStats->start();

		} catch (const CallError &) {
			throw;
		} catch (const std::exception &e) {
			throw CallError(ErrorCode::Unknown, e.what());
		}
	});

	mInitialized = true;
	PLOG_INFO << "Joined room " << mConfig.roomId;
}

void Session::cleanup() {
	if (mClosed.exchange(true))
		return;

	PLOG_INFO << "Leaving room " << mConfig.roomId;

	// Every step runs even if a previous one failed
	auto step = [](const char *name, const std::function<void()> &func) {
		try {
			func();
		} catch (const std::exception &e) {
			PLOG_WARNING << "Cleanup step \"" << name << "\" failed: " << e.what();
		}
	};

	step("recording", [this]() {
		if (auto result = mRecorder->stop())
			emit(RecordingStoppedEvent{std::move(result->blob), std::move(result->mimeType)});
	});

	step("local media", [this]() { mMedia->releaseAll(); });

	step("connections", [this]() { mPeers->closeAll(); });

	step("stats", [this]() { mStats->stop(); });

	step("announcement", [this]() {
		if (mInitialized && mSignaling->isConnected())
			broadcast(signaling::CallEnd, {{"participantId", mConfig.userId}});
	});

	step("signaling", [this]() {
		mSignaling->onMessage(nullptr);
		mSignaling->disconnect();
	});

	// Pending events are delivered before the listener is released
	step("listeners", [this]() {
		mProcessor->enqueue([weak_this = weak_from_this()]() {
			if (auto self = weak_this.lock())
				self->mEventCallback = nullptr;
		});
		if (!mProcessor->isCurrent())
			mProcessor->join();
	});
}

bool Session::toggleAudio(optional<bool> enabled) {
	checkOpen();
	return mMedia->toggleAudio(enabled);
}

bool Session::toggleVideo(optional<bool> enabled) {
	checkOpen();
	return mMedia->toggleVideo(enabled);
}

void Session::startScreenShare(const ScreenShareOptions &options) {
	checkOpen();
	report([&]() { mMedia->startScreenShare(options); });
}

void Session::stopScreenShare() {
	checkOpen();
	mMedia->stopScreenShare();
}

bool Session::isScreenSharing() const { return mMedia->isScreenSharing(); }

void Session::switchDevice(MediaKind kind, const string &deviceId) {
	checkOpen();
	report([&]() { mMedia->switchDevice(kind, deviceId); });
}

void Session::startRecording(const RecordingOptions &options) {
	checkOpen();
	auto mimeType = report([&]() { return mRecorder->start(options, compose(options)); });
	emit(RecordingStartedEvent{std::move(mimeType)});
}

void Session::pauseRecording() {
	if (mRecorder->pause())
		emit(RecordingPausedEvent{});
}

void Session::resumeRecording() {
	if (mRecorder->resume())
		emit(RecordingResumedEvent{});
}

void Session::stopRecording() {
	if (auto result = mRecorder->stop())
		emit(RecordingStoppedEvent{std::move(result->blob), std::move(result->mimeType)});
}

RecordingState Session::recordingState() const { return mRecorder->state(); }

shared_ptr<MediaStream> Session::localStream() const { return mMedia->localStream(); }

shared_ptr<MediaStream> Session::screenStream() const { return mMedia->screenStream(); }

std::vector<Participant> Session::getParticipants() const { return mPeers->getParticipants(); }

optional<Participant> Session::getParticipant(const string &participantId) const {
	return mPeers->getParticipant(participantId);
}

void Session::onEvent(std::function<void(const Event &event)> callback) {
	mEventCallback = std::move(callback);
}

void Session::emit(Event event) {
	PLOG_VERBOSE << "Emitting " << eventName(event);
	mProcessor->enqueue([weak_this = weak_from_this(), event = std::move(event)]() {
		if (auto self = weak_this.lock())
			self->mEventCallback(event);
	});
}

void Session::post(std::function<void()> task) {
	mProcessor->enqueue([weak_this = weak_from_this(), task = std::move(task)]() {
		auto self = weak_this.lock();
		if (!self || self->mClosed)
			return;

		task();
	});
}

void Session::broadcast(const string &event, const json &payload) {
	if (!mSignaling->isConnected())
		throw CallError(ErrorCode::SignalingError, "Signaling channel is not connected");

	mSignaling->send(event, payload);
}

json Session::presence() const {
	auto stream = mMedia->localStream();
	auto enabled = [&stream](MediaKind kind) {
		if (!stream)
			return false;

		auto tracks = kind == MediaKind::Audio ? stream->audioTracks() : stream->videoTracks();
		return !tracks.empty() && tracks.front()->enabled();
	};

	return {{"id", mConfig.userId},
	        {"userId", mConfig.userId},
	        {"name", mConfig.displayName},
	        {"audioEnabled", enabled(MediaKind::Audio)},
	        {"videoEnabled", enabled(MediaKind::Video)},
	        {"screenSharing", mMedia->isScreenSharing()}};
}

shared_ptr<MediaStream> Session::compose(const RecordingOptions &options) const {
	auto composite = std::make_shared<MediaStream>("recording-" + mConfig.roomId);

	if (auto local = mMedia->localStream()) {
		if (options.recordCamera)
			for (const auto &track : local->videoTracks())
				composite->addTrack(track);

		if (options.recordAudio)
			for (const auto &track : local->audioTracks())
				composite->addTrack(track);
	}

	if (options.recordScreen) {
		if (auto screen = mMedia->screenStream())
			for (const auto &track : screen->tracks())
				composite->addTrack(track);
		else
			PLOG_WARNING << "Screen recording requested while not sharing";
	}

	if (!options.remoteStreams.empty()) {
		auto participants = mPeers->getParticipants();
		for (const auto &streamId : options.remoteStreams) {
			bool found = false;
			for (const auto &participant : participants) {
				auto it = participant.streams.find(streamId);
				if (it == participant.streams.end())
					continue;

				for (const auto &track : it->second->tracks())
					composite->addTrack(track);

				found = true;
				break;
			}

			if (!found)
				PLOG_WARNING << "Remote stream " << streamId << " not found, not recorded";
		}
	}

	return composite;
}

void Session::checkOpen() const {
	if (mClosed)
		throw std::logic_error("Session is closed");
}

} // namespace meshcall::impl
