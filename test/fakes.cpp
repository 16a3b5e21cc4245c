/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "fakes.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace fakes {

void SignalingHub::subscribe(const string &roomId, shared_ptr<FakeSignaling> channel) {
	std::lock_guard lock(mMutex);
	mRooms[roomId].push_back(channel);
}

void SignalingHub::unsubscribe(FakeSignaling *channel) {
	std::lock_guard lock(mMutex);
	for (auto &[roomId, channels] : mRooms)
		channels.erase(std::remove_if(channels.begin(), channels.end(),
		                              [channel](const weak_ptr<FakeSignaling> &weak) {
			                              auto locked = weak.lock();
			                              return !locked || locked.get() == channel;
		                              }),
		               channels.end());
}

void SignalingHub::publish(FakeSignaling *sender, const string &event, const json &payload) {
	std::vector<shared_ptr<FakeSignaling>> recipients;
	{
		std::lock_guard lock(mMutex);
		mLog.push_back({sender->userId(), event, payload});
		for (const auto &[roomId, channels] : mRooms) {
			bool member = false;
			for (const auto &weak : channels)
				if (auto channel = weak.lock(); channel && channel.get() == sender)
					member = true;

			if (!member)
				continue;

			for (const auto &weak : channels)
				if (auto channel = weak.lock(); channel && channel.get() != sender)
					recipients.push_back(channel);
		}
	}

	for (const auto &recipient : recipients)
		recipient->deliver(event, payload);
}

std::vector<SignalingHub::Record> SignalingHub::log() const {
	std::lock_guard lock(mMutex);
	return mLog;
}

size_t SignalingHub::count(const string &event, const string &sender) const {
	std::lock_guard lock(mMutex);
	return std::count_if(mLog.begin(), mLog.end(), [&](const Record &record) {
		return record.event == event && (sender.empty() || record.sender == sender);
	});
}

FakeSignaling::FakeSignaling(shared_ptr<SignalingHub> hub, string userId)
    : mHub(std::move(hub)), mUserId(std::move(userId)) {}

FakeSignaling::~FakeSignaling() { mHub->unsubscribe(this); }

void FakeSignaling::connect(const string &roomId) {
	if (failConnect)
		throw CallError(ErrorCode::SignalingError, "Subscription refused");

	mHub->subscribe(roomId, shared_from_this());
	mConnected = true;
}

void FakeSignaling::send(const string &event, const json &payload) {
	if (!mConnected)
		throw CallError(ErrorCode::SignalingError, "Not connected");

	mHub->publish(this, event, payload);
}

void FakeSignaling::disconnect() {
	mConnected = false;
	mHub->unsubscribe(this);
}

bool FakeSignaling::isConnected() const { return mConnected; }

void FakeSignaling::deliver(const string &event, const json &payload) {
	triggerMessage(event, payload);
}

FakeSender::FakeSender(MediaKind kind, shared_ptr<MediaTrack> track)
    : mKind(kind), mTrack(std::move(track)) {}

shared_ptr<MediaTrack> FakeSender::track() const {
	std::lock_guard lock(mMutex);
	return mTrack;
}

void FakeSender::replaceTrack(shared_ptr<MediaTrack> track) {
	std::lock_guard lock(mMutex);
	mTrack = std::move(track);
	++mReplaceCount;
}

int FakeSender::replaceCount() const {
	std::lock_guard lock(mMutex);
	return mReplaceCount;
}

FakeTransport::FakeTransport(string name) : mName(std::move(name)) {}

shared_ptr<RtpSender> FakeTransport::addTrack(shared_ptr<MediaTrack> track,
                                              const string &streamId) {
	std::lock_guard lock(mMutex);
	if (mState == ConnectionState::Closed)
		throw std::logic_error("Transport is closed");

	auto sender = std::make_shared<FakeSender>(track->kind(), track);
	mTracks.push_back({sender, streamId});
	if (mSignalingState == SignalingState::Stable)
		triggerNegotiationNeeded();

	return sender;
}

std::vector<shared_ptr<RtpSender>> FakeTransport::senders() const {
	std::lock_guard lock(mMutex);
	std::vector<shared_ptr<RtpSender>> result;
	for (const auto &local : mTracks)
		result.push_back(local.sender);
	return result;
}

SessionDescription FakeTransport::setLocalDescription(SessionDescription::Type type) {
	std::lock_guard lock(mMutex);
	if (mState == ConnectionState::Closed)
		throw std::logic_error("Transport is closed");

	if (type == SessionDescription::Type::Offer) {
		if (mSignalingState != SignalingState::Stable &&
		    mSignalingState != SignalingState::HaveLocalOffer)
			throw std::logic_error("Unexpected local offer in signaling state");

		mSignalingState = SignalingState::HaveLocalOffer;
		mOfferedTracks = mTracks.size();
		++mOffers;

	} else if (type == SessionDescription::Type::Answer) {
		if (mSignalingState != SignalingState::HaveRemoteOffer)
			throw std::logic_error("Unexpected local answer in signaling state");

		mSignalingState = SignalingState::Stable;
		mNegotiatedTracks = mTracks.size();
		++mAnswers;

	} else {
		throw std::invalid_argument("Unexpected local description type");
	}

	std::ostringstream sdp;
	sdp << "fake " << mName << " " << ++mVersion << "\n";
	for (const auto &local : mTracks) {
		auto track = local.sender->track();
		sdp << "track " << local.sender->kind() << " " << local.streamId << " "
		    << mName << "-" << (track ? track->id() : "none") << "\n";
	}

	SessionDescription description{type, sdp.str()};
	triggerLocalCandidate(IceCandidate{"candidate:1 1 UDP 2122317823 127.0.0.1 5000 typ host", "0"});

	if (mSignalingState == SignalingState::Stable)
		settle();

	return description;
}

void FakeTransport::setRemoteDescription(const SessionDescription &description) {
	std::lock_guard lock(mMutex);
	if (mState == ConnectionState::Closed)
		throw std::logic_error("Transport is closed");

	if (description.type == SessionDescription::Type::Offer) {
		if (mSignalingState != SignalingState::Stable)
			throw std::logic_error("Unexpected remote offer in signaling state");

		mSignalingState = SignalingState::HaveRemoteOffer;

	} else if (description.type == SessionDescription::Type::Answer) {
		if (mSignalingState != SignalingState::HaveLocalOffer)
			throw std::logic_error("Unexpected remote answer in signaling state");

		mSignalingState = SignalingState::Stable;
		mNegotiatedTracks = mOfferedTracks;

	} else {
		throw std::invalid_argument("Unexpected remote description type");
	}

	mHasRemote = true;

	std::istringstream lines(description.sdp);
	string line;
	while (std::getline(lines, line)) {
		std::istringstream fields(line);
		string tag, kind, streamId, trackId;
		if (!(fields >> tag >> kind >> streamId >> trackId) || tag != "track")
			continue;

		if (!mRemoteTracks.insert(trackId).second)
			continue;

		auto track = std::make_shared<MediaTrack>(
		    trackId, kind == "audio" ? MediaKind::Audio : MediaKind::Video, "remote");
		triggerTrack(track, streamId);
	}

	if (mSignalingState == SignalingState::Stable)
		settle();
}

void FakeTransport::rollback() {
	std::lock_guard lock(mMutex);
	if (mSignalingState != SignalingState::HaveLocalOffer)
		throw std::logic_error("Nothing to roll back");

	mSignalingState = SignalingState::Stable;
	++mRollbacks;
}

void FakeTransport::addIceCandidate(const IceCandidate &candidate) {
	std::lock_guard lock(mMutex);
	if (candidate.candidate.empty())
		throw std::invalid_argument("Empty candidate");

	mCandidates.push_back(candidate);
}

void FakeTransport::restartIce() {
	std::lock_guard lock(mMutex);
	++mRestarts;
}

void FakeTransport::close() {
	std::lock_guard lock(mMutex);
	mState = ConnectionState::Closed;
	mIceState = IceState::Closed;
}

bool FakeTransport::negotiationNeeded() const {
	std::lock_guard lock(mMutex);
	return !mHasRemote || mNegotiatedTracks != mTracks.size();
}

SignalingState FakeTransport::signalingState() const {
	std::lock_guard lock(mMutex);
	return mSignalingState;
}

ConnectionState FakeTransport::state() const {
	std::lock_guard lock(mMutex);
	return mState;
}

IceState FakeTransport::iceState() const {
	std::lock_guard lock(mMutex);
	return mIceState;
}

TransportStats FakeTransport::stats() {
	std::lock_guard lock(mMutex);
	return mStats;
}

void FakeTransport::setStats(TransportStats stats) {
	std::lock_guard lock(mMutex);
	mStats = std::move(stats);
}

void FakeTransport::fail() {
	std::lock_guard lock(mMutex);
	mIceState = IceState::Failed;
	triggerIceStateChange(IceState::Failed);
	mState = ConnectionState::Failed;
	triggerStateChange(ConnectionState::Failed);
}

int FakeTransport::offerCount() const {
	std::lock_guard lock(mMutex);
	return mOffers;
}

int FakeTransport::answerCount() const {
	std::lock_guard lock(mMutex);
	return mAnswers;
}

int FakeTransport::rollbackCount() const {
	std::lock_guard lock(mMutex);
	return mRollbacks;
}

int FakeTransport::restartCount() const {
	std::lock_guard lock(mMutex);
	return mRestarts;
}

size_t FakeTransport::candidateCount() const {
	std::lock_guard lock(mMutex);
	return mCandidates.size();
}

void FakeTransport::settle() {
	if (mState == ConnectionState::New) {
		mState = ConnectionState::Connecting;
		triggerStateChange(mState);
		mIceState = IceState::Connected;
		triggerIceStateChange(mIceState);
		mState = ConnectionState::Connected;
		triggerStateChange(mState);
	}

	if (mNegotiatedTracks != mTracks.size())
		triggerNegotiationNeeded();
}

shared_ptr<PeerTransport> FakeTransportFactory::create(const std::vector<IceServer> &) {
	std::lock_guard lock(mMutex);
	auto transport = std::make_shared<FakeTransport>("t" + std::to_string(mTransports.size()));
	mTransports.push_back(transport);
	return transport;
}

std::vector<shared_ptr<FakeTransport>> FakeTransportFactory::transports() const {
	std::lock_guard lock(mMutex);
	return mTransports;
}

size_t FakeTransportFactory::createdCount() const {
	std::lock_guard lock(mMutex);
	return mTransports.size();
}

std::vector<DeviceInfo> FakeMediaDevices::enumerateDevices() {
	return {{"fake-camera", DeviceInfo::Kind::VideoInput, "Fake camera"},
	        {"fake-microphone", DeviceInfo::Kind::AudioInput, "Fake microphone"},
	        {"fake-screen", DeviceInfo::Kind::ScreenInput, "Fake screen"}};
}

shared_ptr<MediaStream> FakeMediaDevices::getUserMedia(const MediaConstraints &constraints) {
	if (failure)
		throw CallError(*failure, "Capture refused");

	auto stream = std::make_shared<MediaStream>(nextId("stream"));
	if (constraints.video)
		stream->addTrack(std::make_shared<MediaTrack>(nextId("camera"), MediaKind::Video,
		                                              "Fake camera", "fake-camera"));
	if (constraints.audio)
		stream->addTrack(std::make_shared<MediaTrack>(nextId("microphone"), MediaKind::Audio,
		                                              "Fake microphone", "fake-microphone"));
	return stream;
}

shared_ptr<MediaStream> FakeMediaDevices::getDisplayMedia(const ScreenShareOptions &) {
	if (failure)
		throw CallError(*failure, "Capture refused");

	auto stream = std::make_shared<MediaStream>(nextId("screen"));
	stream->addTrack(
	    std::make_shared<MediaTrack>(nextId("display"), MediaKind::Video, "Fake screen", "fake-screen"));
	return stream;
}

shared_ptr<MediaTrack> FakeMediaDevices::openDevice(MediaKind kind, const string &deviceId) {
	if (failure)
		throw CallError(*failure, "Capture refused");

	if (deviceId.rfind("fake-", 0) != 0)
		throw CallError(ErrorCode::DeviceNotFound, "Unknown device " + deviceId);

	return std::make_shared<MediaTrack>(nextId(kind == MediaKind::Audio ? "microphone" : "camera"),
	                                    kind, "Fake device", deviceId);
}

string FakeMediaDevices::nextId(const string &prefix) {
	std::lock_guard lock(mMutex);
	return prefix + "-" + std::to_string(++mCounter);
}

std::function<void(const Event &event)> EventLog::callback() {
	return [this](const Event &event) {
		std::lock_guard lock(mMutex);
		mEvents.push_back(event);
		mCondition.notify_all();
	};
}

std::vector<Event> EventLog::events() const {
	std::lock_guard lock(mMutex);
	return mEvents;
}

bool waitUntil(std::function<bool()> condition, std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (!condition()) {
		if (std::chrono::steady_clock::now() >= deadline)
			return false;

		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return true;
}

std::function<void(const string &, const json &)> ManualLoop::sender(const string &userId) {
	return [this, userId](const string &event, const json &payload) {
		std::lock_guard lock(mMutex);
		mMessages.push_back({userId, event, payload});
		mSent.push_back({userId, event, payload});
	};
}

std::function<void(Event)> ManualLoop::emitter(const string &userId) {
	return [this, userId](Event event) {
		std::lock_guard lock(mMutex);
		mEndpoints[userId].events.push_back(std::move(event));
	};
}

std::function<void(std::function<void()>)> ManualLoop::poster(const string &userId) {
	return [this, userId](std::function<void()> task) {
		std::lock_guard lock(mMutex);
		mEndpoints[userId].tasks.push_back(std::move(task));
	};
}

void ManualLoop::attach(const string &userId,
                        std::function<void(const string &, const json &)> handler) {
	std::lock_guard lock(mMutex);
	mEndpoints[userId].userId = userId;
	mHandlers[userId] = std::move(handler);
}

size_t ManualLoop::runTasks() {
	std::lock_guard lock(mMutex);
	size_t count = 0;
	bool progress = true;
	while (progress) {
		progress = false;
		for (auto &[userId, endpoint] : mEndpoints) {
			if (endpoint.tasks.empty())
				continue;

			auto task = std::move(endpoint.tasks.front());
			endpoint.tasks.pop_front();
			task();
			++count;
			progress = true;
		}
	}
	return count;
}

size_t ManualLoop::deliver() {
	std::lock_guard lock(mMutex);
	std::deque<Message> batch;
	std::swap(batch, mMessages);
	for (const auto &message : batch)
		for (const auto &[userId, handler] : mHandlers)
			if (userId != message.sender)
				handler(message.event, message.payload);

	return batch.size();
}

void ManualLoop::pump() {
	while (runTasks() + deliver() > 0) {
	}
}

size_t ManualLoop::sent(const string &event) const {
	std::lock_guard lock(mMutex);
	return std::count_if(mSent.begin(), mSent.end(),
	                     [&event](const Message &message) { return message.event == event; });
}

} // namespace fakes
