/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "datachanneltransport.hpp"
#include "internals.hpp"

#include <random>
#include <sstream>

namespace meshcall::impl {

namespace {

const uint32_t VideoClockRate = 90 * 1000;
const uint32_t AudioClockRate = 48 * 1000;

ConnectionState toConnectionState(rtc::PeerConnection::State state) {
	using State = rtc::PeerConnection::State;
	switch (state) {
	case State::New:
		return ConnectionState::New;
	case State::Connecting:
		return ConnectionState::Connecting;
	case State::Connected:
		return ConnectionState::Connected;
	case State::Disconnected:
		return ConnectionState::Disconnected;
	case State::Failed:
		return ConnectionState::Failed;
	default:
		return ConnectionState::Closed;
	}
}

IceState toIceState(rtc::PeerConnection::IceState state) {
	using State = rtc::PeerConnection::IceState;
	switch (state) {
	case State::New:
		return IceState::New;
	case State::Checking:
		return IceState::Checking;
	case State::Connected:
		return IceState::Connected;
	case State::Completed:
		return IceState::Completed;
	case State::Failed:
		return IceState::Failed;
	case State::Disconnected:
		return IceState::Disconnected;
	default:
		return IceState::Closed;
	}
}

SignalingState toSignalingState(rtc::PeerConnection::SignalingState state) {
	using State = rtc::PeerConnection::SignalingState;
	switch (state) {
	case State::HaveLocalOffer:
		return SignalingState::HaveLocalOffer;
	case State::HaveRemoteOffer:
		return SignalingState::HaveRemoteOffer;
	case State::HaveLocalPranswer:
		return SignalingState::HaveLocalPranswer;
	case State::HaveRemotePranswer:
		return SignalingState::HaveRemotePranswer;
	default:
		return SignalingState::Stable;
	}
}

rtc::Description::Type toDescriptionType(SessionDescription::Type type) {
	switch (type) {
	case SessionDescription::Type::Offer:
		return rtc::Description::Type::Offer;
	case SessionDescription::Type::Answer:
		return rtc::Description::Type::Answer;
	case SessionDescription::Type::Rollback:
		return rtc::Description::Type::Rollback;
	default:
		return rtc::Description::Type::Unspec;
	}
}

uint32_t randomSsrc() {
	static std::random_device device;
	static std::mutex mutex;
	std::lock_guard lock(mutex);
	std::uniform_int_distribution<uint32_t> dist(1, 0xFFFFFFFE);
	return dist(device);
}

string randomMid(MediaKind kind) {
	std::ostringstream oss;
	oss << kind << "-" << std::hex << randomSsrc();
	return oss.str();
}

} // namespace

DataChannelSender::DataChannelSender(MediaKind kind, shared_ptr<rtc::Track> track,
                                     shared_ptr<rtc::RtpPacketizationConfig> rtpConfig)
    : mKind(kind), mRtcTrack(std::move(track)), mRtpConfig(std::move(rtpConfig)) {}

DataChannelSender::~DataChannelSender() { close(); }

shared_ptr<MediaTrack> DataChannelSender::track() const {
	std::lock_guard lock(mMutex);
	return mTrack;
}

void DataChannelSender::replaceTrack(shared_ptr<MediaTrack> track) {
	if (track && track->kind() != mKind)
		throw std::invalid_argument("Replacement track kind does not match the sender");

	std::lock_guard lock(mMutex);
	if (mTrack && mSinkId)
		mTrack->removeSink(*mSinkId);

	mSinkId.reset();
	mTrack = std::move(track);
	if (!mTrack)
		return;

	PLOG_DEBUG << "Sending " << mKind << " track \"" << mTrack->id() << "\" on mid "
	           << mRtcTrack->mid();

	// The sender keeps its own clock, so the RTP timestamps stay monotonic across sources
	mSinkId = mTrack->addSink(weak_bind(&DataChannelSender::send, this, std::placeholders::_1));
}

void DataChannelSender::close() {
	std::lock_guard lock(mMutex);
	if (mTrack && mSinkId)
		mTrack->removeSink(*mSinkId);

	mSinkId.reset();
	mTrack.reset();
}

void DataChannelSender::send(const binary &frame) {
	if (!mRtcTrack->isOpen())
		return;

	auto elapsed = std::chrono::duration<double>(clock::now() - mStartTime);
	mRtpConfig->timestamp = mRtpConfig->startTimestamp +
	                        mRtpConfig->secondsToTimestamp(elapsed.count());
	try {
		mRtcTrack->send(frame);
	} catch (const std::exception &e) {
		PLOG_WARNING << "Unable to send " << mKind << " frame: " << e.what();
	}
}

DataChannelTransport::DataChannelTransport(rtc::Configuration config, Options options)
    : mOptions(std::move(options)),
      mPeerConnection(std::make_shared<rtc::PeerConnection>(std::move(config))) {}

DataChannelTransport::~DataChannelTransport() {
	try {
		close();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

void DataChannelTransport::init() {
	auto weak_this = weak_from_this();

	mPeerConnection->onLocalCandidate([weak_this](rtc::Candidate candidate) {
		if (auto self = weak_this.lock())
			self->triggerLocalCandidate({string(candidate), candidate.mid()});
	});

	mPeerConnection->onStateChange([weak_this](rtc::PeerConnection::State state) {
		PLOG_DEBUG << "Peer connection state: " << state;
		if (auto self = weak_this.lock())
			self->triggerStateChange(toConnectionState(state));
	});

	mPeerConnection->onIceStateChange([weak_this](rtc::PeerConnection::IceState state) {
		PLOG_DEBUG << "ICE state: " << state;
		if (auto self = weak_this.lock())
			self->triggerIceStateChange(toIceState(state));
	});

	mPeerConnection->onSignalingStateChange([weak_this](rtc::PeerConnection::SignalingState state) {
		PLOG_VERBOSE << "Signaling state: " << state;
		auto self = weak_this.lock();
		if (!self)
			return;

		// Automatic negotiation is disabled, tracks added mid-negotiation are signaled here
		if (state == rtc::PeerConnection::SignalingState::Stable &&
		    self->mPeerConnection->negotiationNeeded())
			self->triggerNegotiationNeeded();
	});

	mPeerConnection->onTrack([weak_this](shared_ptr<rtc::Track> track) {
		if (auto self = weak_this.lock())
			self->handleRemoteTrack(std::move(track));
	});
}

shared_ptr<RtpSender> DataChannelTransport::addTrack(shared_ptr<MediaTrack> track,
                                                     const string &streamId) {
	const uint32_t ssrc = randomSsrc();
	const string mid = randomMid(track->kind());
	const string cname = streamId;

	shared_ptr<rtc::Track> rtcTrack;
	shared_ptr<rtc::RtpPacketizationConfig> rtpConfig;
	shared_ptr<rtc::MediaHandler> packetizer;
	if (track->kind() == MediaKind::Video) {
		rtc::Description::Video media(mid, rtc::Description::Direction::SendOnly);
		media.addH264Codec(mOptions.videoPayloadType);
		media.setBitrate(mOptions.videoBitrate);
		media.addSSRC(ssrc, cname, streamId, track->id());
		rtcTrack = mPeerConnection->addTrack(media);

		rtpConfig = std::make_shared<rtc::RtpPacketizationConfig>(
		    ssrc, cname, uint8_t(mOptions.videoPayloadType),
		    VideoClockRate);
		packetizer = std::make_shared<rtc::H264RtpPacketizer>(
		    rtc::NalUnit::Separator::StartSequence, rtpConfig);
	} else {
		rtc::Description::Audio media(mid, rtc::Description::Direction::SendOnly);
		media.addOpusCodec(mOptions.audioPayloadType);
		media.addSSRC(ssrc, cname, streamId, track->id());
		rtcTrack = mPeerConnection->addTrack(media);

		rtpConfig = std::make_shared<rtc::RtpPacketizationConfig>(
		    ssrc, cname, uint8_t(mOptions.audioPayloadType),
		    AudioClockRate);
		packetizer = std::make_shared<rtc::OpusRtpPacketizer>(rtpConfig);
	}

	packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtpConfig));
	packetizer->addToChain(std::make_shared<rtc::RtcpNackResponder>());
	rtcTrack->setMediaHandler(packetizer);

	auto sender = std::make_shared<DataChannelSender>(track->kind(), rtcTrack, rtpConfig);
	sender->replaceTrack(std::move(track));
	{
		std::lock_guard lock(mMutex);
		mSenders.push_back(sender);
	}

	PLOG_DEBUG << "Added local track on mid " << mid << ", stream " << streamId;
	if (mPeerConnection->signalingState() == rtc::PeerConnection::SignalingState::Stable)
		triggerNegotiationNeeded();

	return sender;
}

std::vector<shared_ptr<RtpSender>> DataChannelTransport::senders() const {
	std::lock_guard lock(mMutex);
	return {mSenders.begin(), mSenders.end()};
}

SessionDescription DataChannelTransport::setLocalDescription(SessionDescription::Type type) {
	mPeerConnection->setLocalDescription(toDescriptionType(type));
	auto description = mPeerConnection->localDescription();
	if (!description)
		throw std::runtime_error("No local description was generated");

	SessionDescription result;
	result.type = SessionDescription::stringToType(description->typeString());
	result.sdp = string(*description);
	return result;
}

void DataChannelTransport::setRemoteDescription(const SessionDescription &description) {
	mPeerConnection->setRemoteDescription(
	    rtc::Description(description.sdp, SessionDescription::typeToString(description.type)));
}

void DataChannelTransport::rollback() {
	mPeerConnection->setLocalDescription(rtc::Description::Type::Rollback);
}

void DataChannelTransport::addIceCandidate(const IceCandidate &candidate) {
	mPeerConnection->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
}

void DataChannelTransport::restartIce() {
	PLOG_WARNING << "ICE restart is not supported by the transport, waiting for the peer";
}

void DataChannelTransport::close() {
	std::vector<shared_ptr<DataChannelSender>> senders;
	{
		std::lock_guard lock(mMutex);
		senders = std::exchange(mSenders, {});
	}

	for (const auto &sender : senders)
		sender->close();

	mPeerConnection->resetCallbacks();
	mPeerConnection->close();
}

bool DataChannelTransport::negotiationNeeded() const {
	return mPeerConnection->negotiationNeeded() || !mPeerConnection->remoteDescription();
}

SignalingState DataChannelTransport::signalingState() const {
	return toSignalingState(mPeerConnection->signalingState());
}

ConnectionState DataChannelTransport::state() const {
	return toConnectionState(mPeerConnection->state());
}

IceState DataChannelTransport::iceState() const { return toIceState(mPeerConnection->iceState()); }

TransportStats DataChannelTransport::stats() {
	TransportStats stats;
	stats.bytesSent = mPeerConnection->bytesSent();
	stats.bytesReceived = mPeerConnection->bytesReceived();
	stats.roundTripTime = mPeerConnection->rtt();
	return stats;
}

string DataChannelTransport::StreamIdFromMedia(const rtc::Description::Media &media) {
	// "msid:<stream> <track>" or "ssrc:<ssrc> msid:<stream> <track>"
	for (const auto &attr : media.attributes()) {
		auto pos = attr.find("msid:");
		if (pos == string::npos)
			continue;

		string value = attr.substr(pos + 5);
		auto end = value.find(' ');
		string streamId = value.substr(0, end);
		if (!streamId.empty() && streamId != "-")
			return streamId;
	}
	return media.mid();
}

void DataChannelTransport::handleRemoteTrack(shared_ptr<rtc::Track> rtcTrack) {
	auto media = rtcTrack->description();
	const MediaKind kind = media.type() == "video" ? MediaKind::Video : MediaKind::Audio;
	const string streamId = StreamIdFromMedia(media);

	PLOG_DEBUG << "Remote " << kind << " track on mid " << rtcTrack->mid() << ", stream "
	           << streamId;

	shared_ptr<rtc::MediaHandler> depacketizer;
	if (kind == MediaKind::Video)
		depacketizer = std::make_shared<rtc::H264RtpDepacketizer>();
	else
		depacketizer = std::make_shared<rtc::OpusRtpDepacketizer>();

	depacketizer->addToChain(std::make_shared<rtc::RtcpReceivingSession>());
	rtcTrack->setMediaHandler(depacketizer);

	auto track = std::make_shared<MediaTrack>(rtcTrack->mid(), kind, "remote " + rtcTrack->mid());
	const auto startTime = clock::now();
	rtcTrack->onMessage(
	    [weak_track = std::weak_ptr(track), startTime](rtc::binary frame) {
		    if (auto track = weak_track.lock())
			    track->deliver(frame, std::chrono::duration_cast<std::chrono::microseconds>(
			                              clock::now() - startTime));
	    },
	    nullptr);

	rtcTrack->onClosed([weak_track = std::weak_ptr(track)]() {
		if (auto track = weak_track.lock())
			track->end();
	});

	// Keep the libdatachannel track alive as long as the media track
	track->onEnded([rtcTrack]() { PLOG_VERBOSE << "Remote track " << rtcTrack->mid() << " ended"; });

	triggerTrack(std::move(track), streamId);
}

} // namespace meshcall::impl
