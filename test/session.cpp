/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "fakes.hpp"
#include "test.hpp"

#include <thread>

using namespace meshcall;
using namespace fakes;
using std::chrono::milliseconds;

namespace {

struct Client {
	shared_ptr<FakeSignaling> signaling;
	shared_ptr<FakeTransportFactory> transports;
	shared_ptr<FakeMediaDevices> devices;
	EventLog events;
	unique_ptr<Session> session;

	shared_ptr<FakeTransport> transport() const {
		auto all = transports->transports();
		return !all.empty() ? all.back() : nullptr;
	}

	shared_ptr<MediaTrack> camera() const {
		auto stream = session->localStream();
		return stream && !stream->videoTracks().empty() ? stream->videoTracks().front() : nullptr;
	}

	shared_ptr<MediaTrack> sentVideo() const {
		for (const auto &sender : transport()->senders())
			if (sender->kind() == MediaKind::Video)
				return sender->track();
		return nullptr;
	}
};

unique_ptr<Client> makeClient(shared_ptr<SignalingHub> hub, const string &roomId,
                              const string &userId,
                              milliseconds statsInterval = std::chrono::seconds(2)) {
	auto client = std::make_unique<Client>();
	client->signaling = std::make_shared<FakeSignaling>(hub, userId);
	client->transports = std::make_shared<FakeTransportFactory>();
	client->devices = std::make_shared<FakeMediaDevices>();

	CallConfig config;
	config.roomId = roomId;
	config.userId = userId;
	config.displayName = "User " + userId;
	config.statsInterval = statsInterval;
	config.recordingTimeslice = milliseconds(20);

	SessionDependencies dependencies;
	dependencies.signaling = client->signaling;
	dependencies.transports = client->transports;
	dependencies.devices = client->devices;

	client->session = std::make_unique<Session>(config, dependencies);
	client->session->onEvent(client->events.callback());
	return client;
}

bool connected(const Client &client) {
	auto transport = client.transport();
	return transport && transport->state() == ConnectionState::Connected;
}

template <typename T> bool hasRemote(const EventLog &events, const string &participantId) {
	for (const auto &event : events.all<T>())
		if (event.participantId == participantId)
			return true;
	return false;
}

} // namespace

TestResult test_room_scenario() {
	auto hub = std::make_shared<SignalingHub>();
	auto u2 = makeClient(hub, "room-42", "u2");
	auto u1 = makeClient(hub, "room-42", "u1");

	// u2 is in the room, u1 joins: u2 receives the announcement and is polite
	u2->session->initialize();
	u1->session->initialize();

	if (!u1->events.waitFor<PeerConnectedEvent>(1, milliseconds(5000)) ||
	    !u2->events.waitFor<PeerConnectedEvent>(1, milliseconds(5000)))
		return TestResult(false, "Peers did not connect");

	auto log = hub->log();
	auto firstOffer = std::find_if(log.begin(), log.end(), [](const SignalingHub::Record &r) {
		return r.event == signaling::Offer;
	});
	if (firstOffer == log.end() || firstOffer->sender != "u2")
		return TestResult(false, "The polite side should make the first offer");

	if (!u1->events.waitFor<StreamAddedEvent>(2, milliseconds(5000)))
		return TestResult(false, "Remote stream was not added");

	std::this_thread::sleep_for(milliseconds(100));
	const size_t offers = hub->count(signaling::Offer);
	const size_t negotiations = u1->events.count<NegotiationEvent>();

	auto camera = u1->camera();
	if (!camera)
		return TestResult(false, "No local camera track");

	if (u1->session->toggleVideo(false) || camera->enabled())
		return TestResult(false, "Video was not disabled");

	if (!waitUntil([&]() {
		    auto p = u2->session->getParticipant("u1");
		    return p && !p->videoEnabled;
	    }))
		return TestResult(false, "Remote side did not see video disabled");

	if (!u1->session->toggleVideo(true) || !camera->enabled())
		return TestResult(false, "Video was not enabled");

	if (!waitUntil([&]() {
		    auto p = u2->session->getParticipant("u1");
		    return p && p->videoEnabled;
	    }))
		return TestResult(false, "Remote side did not see video enabled");

	std::this_thread::sleep_for(milliseconds(100));
	if (hub->count(signaling::Offer) != offers ||
	    u1->events.count<NegotiationEvent>() != negotiations)
		return TestResult(false, "Toggling video caused a renegotiation");

	if (u1->session->localStream()->videoTracks().size() != 1 || u1->sentVideo() != camera)
		return TestResult(false, "Toggling video replaced the track");

	auto toggles = u2->events.all<TrackToggledEvent>();
	if (toggles.size() != 2 || toggles[0].enabled || !toggles[1].enabled ||
	    toggles[0].participantId != "u1" || toggles[0].kind != MediaKind::Video)
		return TestResult(false, "Remote toggle events are wrong");

	return TestResult(true);
}

TestResult test_screen_share() {
	auto hub = std::make_shared<SignalingHub>();
	auto u2 = makeClient(hub, "room-share", "u2");
	auto u1 = makeClient(hub, "room-share", "u1");
	u2->session->initialize();
	u1->session->initialize();

	if (!waitUntil([&]() { return connected(*u1) && connected(*u2); }))
		return TestResult(false, "Peers did not connect");

	std::this_thread::sleep_for(milliseconds(100));
	const size_t offers = hub->count(signaling::Offer);
	const size_t created = u1->transports->createdCount() + u2->transports->createdCount();
	const size_t stateChanges = u1->events.count<ConnectionStateEvent>() +
	                            u2->events.count<ConnectionStateEvent>();
	auto camera = u1->camera();

	u1->session->startScreenShare();
	auto screen = u1->session->screenStream();
	if (!screen || !u1->session->isScreenSharing())
		return TestResult(false, "Screen share did not start");

	if (u1->sentVideo() != screen->videoTracks().front())
		return TestResult(false, "Screen track is not sent");

	if (!waitUntil([&]() { return hasRemote<ScreenShareStartedEvent>(u2->events, "u1"); }))
		return TestResult(false, "Remote side was not notified of the screen share");

	auto remote = u2->session->getParticipant("u1");
	if (!remote || !remote->screenSharing)
		return TestResult(false, "Remote participant is not flagged as sharing");

	u1->session->stopScreenShare();
	if (u1->sentVideo() != camera || screen->videoTracks().front()->isLive())
		return TestResult(false, "Camera was not restored");

	if (!waitUntil([&]() { return hasRemote<ScreenShareEndedEvent>(u2->events, "u1"); }))
		return TestResult(false, "Remote side was not notified of the end of the screen share");

	// Stopping from the capture side runs the same path
	u1->session->startScreenShare();
	u1->session->screenStream()->videoTracks().front()->end();
	if (!waitUntil([&]() { return !u1->session->isScreenSharing(); }))
		return TestResult(false, "Ended screen track did not stop the screen share");

	if (u1->sentVideo() != camera)
		return TestResult(false, "Camera was not restored after the capture ended");

	std::this_thread::sleep_for(milliseconds(100));
	if (!connected(*u1) || !connected(*u2))
		return TestResult(false, "Screen share disturbed the connections");

	if (hub->count(signaling::Offer) != offers ||
	    u1->transports->createdCount() + u2->transports->createdCount() != created ||
	    u1->events.count<ConnectionStateEvent>() + u2->events.count<ConnectionStateEvent>() !=
	        stateChanges)
		return TestResult(false, "Screen share caused a renegotiation");

	return TestResult(true);
}

TestResult test_recording() {
	auto hub = std::make_shared<SignalingHub>();
	auto u1 = makeClient(hub, "room-rec", "u1");
	u1->session->initialize();

	if (u1->session->recordingState() != RecordingState::Inactive)
		return TestResult(false, "Recorder should start inactive");

	// No-ops out of state
	u1->session->stopRecording();
	u1->session->pauseRecording();
	u1->session->resumeRecording();

	u1->session->startRecording();
	if (u1->session->recordingState() != RecordingState::Recording)
		return TestResult(false, "Recording did not start");

	try {
		u1->session->startRecording();
		return TestResult(false, "Started a recording twice");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::RecordingError)
			return TestResult(false, "Wrong error for a double start");
	}

	auto camera = u1->camera();
	const binary frame = {byte{0}, byte{0}, byte{0}, byte{1}, byte{0x65}, byte{1}, byte{2}, byte{3}};
	for (int i = 0; i < 3; ++i)
		camera->deliver(frame, std::chrono::microseconds(i * 33333));

	std::this_thread::sleep_for(milliseconds(50)); // a few timeslices

	u1->session->pauseRecording();
	camera->deliver(frame, std::chrono::microseconds(100000));
	try {
		u1->session->startRecording();
		return TestResult(false, "Started a recording while paused");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::RecordingError)
			return TestResult(false, "Wrong error for a start while paused");
	}

	u1->session->pauseRecording();
	u1->session->resumeRecording();
	u1->session->resumeRecording();
	camera->deliver(frame, std::chrono::microseconds(133333));

	u1->session->stopRecording();
	u1->session->stopRecording();
	if (u1->session->recordingState() != RecordingState::Inactive)
		return TestResult(false, "Recording did not stop");

	if (!u1->events.waitFor<RecordingStoppedEvent>(1, milliseconds(2000)))
		return TestResult(false, "No recording was emitted");

	std::this_thread::sleep_for(milliseconds(50));
	auto stopped = u1->events.all<RecordingStoppedEvent>();
	if (stopped.size() != 1 || stopped[0].mimeType != "video/h264")
		return TestResult(false, "Wrong recording events");

	if (stopped[0].blob.size() != 4 * frame.size())
		return TestResult(false, "Recording holds " + std::to_string(stopped[0].blob.size()) +
		                             " bytes, expected " + std::to_string(4 * frame.size()));

	if (u1->events.count<RecordingStartedEvent>() != 1 ||
	    u1->events.count<RecordingPausedEvent>() != 1 ||
	    u1->events.count<RecordingResumedEvent>() != 1)
		return TestResult(false, "Wrong recording state events");

	// Failures are also published on the event channel
	size_t errors = 0;
	for (const auto &error : u1->events.all<ErrorEvent>())
		if (error.code == ErrorCode::RecordingError)
			++errors;
	if (errors != 2)
		return TestResult(false, "Recording errors were not published");

	RecordingOptions nothing;
	nothing.recordCamera = false;
	nothing.recordAudio = false;
	try {
		u1->session->startRecording(nothing);
		return TestResult(false, "Started recording nothing");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::RecordingError)
			return TestResult(false, "Wrong error for an empty recording");
	}

	return TestResult(true);
}

TestResult test_mime_type_choice() {
	class WebmFactory final : public MediaEncoderFactory {
	public:
		bool isTypeSupported(const string &mimeType) const override {
			return mimeType == "video/webm" || mimeType == "video/mp4";
		}
		unique_ptr<MediaEncoder> create(const string &, const RecordingOptions &) override {
			return nullptr;
		}
	};

	WebmFactory webm;
	if (ChooseMimeType(webm, nullopt) != "video/webm")
		return TestResult(false, "Preferred type was not chosen");

	if (ChooseMimeType(webm, "video/mp4") != "video/mp4")
		return TestResult(false, "Supported requested type was not kept");

	if (ChooseMimeType(webm, "video/ogg") != "video/webm")
		return TestResult(false, "Unsupported requested type did not fall back");

	ElementaryStreamEncoderFactory h264;
	if (ChooseMimeType(h264, nullopt) != "video/h264")
		return TestResult(false, "Elementary stream type was not chosen");

	if (PreferredMimeTypes().front() != "video/webm;codecs=vp9,opus")
		return TestResult(false, "Wrong preferred type");

	return TestResult(true);
}

TestResult test_media_errors() {
	auto hub = std::make_shared<SignalingHub>();
	auto u1 = makeClient(hub, "room-errors", "u1");

	u1->devices->failure = ErrorCode::PermissionDenied;
	try {
		u1->session->initialize();
		return TestResult(false, "Initialized without media access");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::PermissionDenied)
			return TestResult(false, "Wrong error for a denied capture");
	}

	if (!u1->events.waitFor<ErrorEvent>(1, milliseconds(2000)) ||
	    u1->events.all<ErrorEvent>().front().code != ErrorCode::PermissionDenied)
		return TestResult(false, "Denied capture was not published");

	u1->devices->failure.reset();
	u1->session->initialize();

	auto camera = u1->camera();
	u1->session->toggleVideo(false);
	u1->session->switchDevice(MediaKind::Video, "fake-camera-2");
	auto switched = u1->camera();
	if (!switched || switched == camera || camera->isLive() || switched->enabled() ||
	    switched->deviceId() != "fake-camera-2")
		return TestResult(false, "Device switch did not replace the camera");

	try {
		u1->session->switchDevice(MediaKind::Audio, "missing");
		return TestResult(false, "Switched to a missing device");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::DeviceNotFound)
			return TestResult(false, "Wrong error for a missing device");
	}

	u1->devices->failure = ErrorCode::MediaError;
	try {
		u1->session->startScreenShare();
		return TestResult(false, "Screen share started without capture");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::MediaError || u1->session->isScreenSharing())
			return TestResult(false, "Wrong state after a failed screen share");
	}

	if (!u1->session->localStream() || !switched->isLive())
		return TestResult(false, "A local failure released the local stream");

	return TestResult(true);
}

TestResult test_session_cleanup() {
	auto hub = std::make_shared<SignalingHub>();
	auto u2 = makeClient(hub, "room-cleanup", "u2");
	auto u1 = makeClient(hub, "room-cleanup", "u1", milliseconds(50));
	u2->session->initialize();
	u1->session->initialize();

	if (!waitUntil([&]() { return connected(*u1) && connected(*u2); }))
		return TestResult(false, "Peers did not connect");

	u1->session->startScreenShare();
	u1->session->startRecording();
	if (!u1->events.waitFor<StatsEvent>(1, milliseconds(2000)))
		return TestResult(false, "No stats were published");

	auto local = u1->session->localStream();
	auto screen = u1->session->screenStream();

	u1->session->cleanup();
	try {
		u1->session->cleanup();
	} catch (const std::exception &e) {
		return TestResult(false, string("Second cleanup threw: ") + e.what());
	}

	for (const auto &track : local->tracks())
		if (track->isLive())
			return TestResult(false, "A local track is still live");

	if (screen->videoTracks().front()->isLive())
		return TestResult(false, "The screen track is still live");

	if (u1->session->recordingState() != RecordingState::Inactive ||
	    u1->events.count<RecordingStoppedEvent>() != 1)
		return TestResult(false, "Recording was not stopped");

	if (u1->events.count<PeerDisconnectedEvent>() != 1 || !u1->session->getParticipants().empty())
		return TestResult(false, "Connections were not closed");

	if (u1->transport()->state() != ConnectionState::Closed)
		return TestResult(false, "Transport was not closed");

	if (hub->count(signaling::CallEnd, "u1") != 1 || u1->signaling->isConnected())
		return TestResult(false, "Leaving was not announced");

	// No interval remains
	const size_t stats = u1->events.count<StatsEvent>();
	std::this_thread::sleep_for(milliseconds(200));
	if (u1->events.count<StatsEvent>() != stats)
		return TestResult(false, "Stats kept running after cleanup");

	if (!u2->events.waitFor<PeerDisconnectedEvent>(1, milliseconds(2000)) ||
	    !u2->session->getParticipants().empty())
		return TestResult(false, "Remote side did not drop the participant");

	try {
		u1->session->toggleAudio();
		return TestResult(false, "Session is usable after cleanup");
	} catch (const std::logic_error &) {
		// expected
	}

	return TestResult(true);
}
