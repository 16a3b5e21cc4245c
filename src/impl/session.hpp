/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_SESSION_H
#define MESHCALL_IMPL_SESSION_H

#include "common.hpp"
#include "mediapipeline.hpp"
#include "meshcall/session.hpp"
#include "peermanager.hpp"
#include "processor.hpp"
#include "recorder.hpp"
#include "statsmonitor.hpp"

#include <atomic>

namespace meshcall::impl {

class Session final : public std::enable_shared_from_this<Session> {
public:
	Session(CallConfig config, SessionDependencies dependencies);
	~Session();

	// Wires the components, must be called once the session is owned by a shared_ptr
	void init();

	void initialize();
	void cleanup();

	const CallConfig &config() const { return mConfig; }

	bool toggleAudio(optional<bool> enabled);
	bool toggleVideo(optional<bool> enabled);

	void startScreenShare(const ScreenShareOptions &options);
	void stopScreenShare();
	bool isScreenSharing() const;

	void switchDevice(MediaKind kind, const string &deviceId);

	void startRecording(const RecordingOptions &options);
	void pauseRecording();
	void resumeRecording();
	void stopRecording();
	RecordingState recordingState() const;

	shared_ptr<MediaStream> localStream() const;
	shared_ptr<MediaStream> screenStream() const;

	std::vector<Participant> getParticipants() const;
	optional<Participant> getParticipant(const string &participantId) const;

	void onEvent(std::function<void(const Event &event)> callback);

	void emit(Event event);

private:
	void post(std::function<void()> task);
	void broadcast(const string &event, const json &payload);
	json presence() const;
	shared_ptr<MediaStream> compose(const RecordingOptions &options) const;
	void checkOpen() const;

	// Publishes a CallError on the event channel before rethrowing it
	template <typename F> auto report(F &&f) -> decltype(f());

	const CallConfig mConfig;
	const shared_ptr<SignalingChannel> mSignaling;
	const shared_ptr<PeerTransportFactory> mTransports;
	const shared_ptr<MediaDevices> mDevices;
	const shared_ptr<MediaEncoderFactory> mEncoders;

	const shared_ptr<Processor> mProcessor;
	shared_ptr<PeerManager> mPeers;
	shared_ptr<MediaPipeline> mMedia;
	shared_ptr<Recorder> mRecorder;
	shared_ptr<StatsMonitor> mStats;

	std::atomic<bool> mInitialized = false;
	std::atomic<bool> mClosed = false;

	synchronized_callback<const Event &> mEventCallback;
};

} // namespace meshcall::impl

#endif
