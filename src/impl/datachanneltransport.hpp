/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_DATACHANNEL_TRANSPORT_H
#define MESHCALL_IMPL_DATACHANNEL_TRANSPORT_H

#include "common.hpp"
#include "peertransport.hpp"

#include "meshcall/datachanneltransport.hpp"

#include <rtc/h264rtpdepacketizer.hpp>
#include <rtc/opusrtppacketizer.hpp>
#include <rtc/rtc.hpp>
#include <rtc/rtpdepacketizer.hpp>

namespace meshcall::impl {

class DataChannelSender final : public RtpSender,
                                public std::enable_shared_from_this<DataChannelSender> {
public:
	DataChannelSender(MediaKind kind, shared_ptr<rtc::Track> track,
	                  shared_ptr<rtc::RtpPacketizationConfig> rtpConfig);
	~DataChannelSender();

	MediaKind kind() const override { return mKind; }
	shared_ptr<MediaTrack> track() const override;
	void replaceTrack(shared_ptr<MediaTrack> track) override;

	void close();

private:
	void send(const binary &frame);

	const MediaKind mKind;
	const shared_ptr<rtc::Track> mRtcTrack;
	const shared_ptr<rtc::RtpPacketizationConfig> mRtpConfig;
	const clock::time_point mStartTime = clock::now();

	shared_ptr<MediaTrack> mTrack;
	optional<MediaTrack::SinkId> mSinkId;
	mutable std::mutex mMutex;
};

class DataChannelTransport final : public PeerTransport,
                                   public std::enable_shared_from_this<DataChannelTransport> {
public:
	using Options = DataChannelTransportFactory::Options;

	DataChannelTransport(rtc::Configuration config, Options options);
	~DataChannelTransport();

	// Registers the libdatachannel callbacks, must be called once owned by a shared_ptr
	void init();

	shared_ptr<RtpSender> addTrack(shared_ptr<MediaTrack> track, const string &streamId) override;
	std::vector<shared_ptr<RtpSender>> senders() const override;

	SessionDescription setLocalDescription(SessionDescription::Type type) override;
	void setRemoteDescription(const SessionDescription &description) override;
	void rollback() override;
	void addIceCandidate(const IceCandidate &candidate) override;
	void restartIce() override;
	void close() override;

	bool negotiationNeeded() const override;
	SignalingState signalingState() const override;
	ConnectionState state() const override;
	IceState iceState() const override;
	TransportStats stats() override;

	// Stream id announced for a remote track, from its msid attribute
	static string StreamIdFromMedia(const rtc::Description::Media &media);

private:
	void handleRemoteTrack(shared_ptr<rtc::Track> track);

	const Options mOptions;
	const shared_ptr<rtc::PeerConnection> mPeerConnection;
	std::vector<shared_ptr<DataChannelSender>> mSenders;
	mutable std::mutex mMutex;
};

} // namespace meshcall::impl

#endif
