/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_PEER_TRANSPORT_H
#define MESHCALL_PEER_TRANSPORT_H

#include "common.hpp"
#include "configuration.hpp"
#include "mediastream.hpp"
#include "participant.hpp"

#include <iostream>

namespace meshcall {

struct SessionDescription {
	enum class Type { Unspec, Offer, Answer, Rollback };

	Type type = Type::Unspec;
	string sdp;

	static Type stringToType(const string &typeString);
	static string typeToString(Type type);
};

struct IceCandidate {
	string candidate;
	string mid;
};

enum class SignalingState {
	Stable,
	HaveLocalOffer,
	HaveRemoteOffer,
	HaveLocalPranswer,
	HaveRemotePranswer
};

enum class IceState { New, Checking, Connected, Completed, Failed, Disconnected, Closed };

// Raw transport counters, all cumulative since the transport was created
struct TransportStats {
	uint64_t bytesSent = 0;
	uint64_t bytesReceived = 0;
	uint64_t packetsSent = 0;
	uint64_t packetsReceived = 0;
	uint64_t packetsLost = 0;
	optional<double> jitter;                                // seconds
	optional<std::chrono::milliseconds> roundTripTime;
	optional<uint64_t> availableOutgoingBitrate;            // bits per second
	optional<uint64_t> availableIncomingBitrate;            // bits per second
};

// Outgoing track slot; the attached track can be swapped without renegotiation
class MESHCALL_CPP_EXPORT RtpSender {
public:
	virtual ~RtpSender() = default;

	virtual MediaKind kind() const = 0;
	virtual shared_ptr<MediaTrack> track() const = 0;
	virtual void replaceTrack(shared_ptr<MediaTrack> track) = 0;
};

// Peer transport primitive. Operations throw on failure. Callbacks may be invoked
// from any thread, including from inside an operation.
class MESHCALL_CPP_EXPORT PeerTransport {
public:
	virtual ~PeerTransport() = default;

	virtual shared_ptr<RtpSender> addTrack(shared_ptr<MediaTrack> track, const string &streamId) = 0;
	virtual std::vector<shared_ptr<RtpSender>> senders() const = 0;

	// Generates and applies a local description of the given type, guessed from the
	// signaling state if unspecified, and returns it
	virtual SessionDescription setLocalDescription(
	    SessionDescription::Type type = SessionDescription::Type::Unspec) = 0;
	virtual void setRemoteDescription(const SessionDescription &description) = 0;
	virtual void rollback() = 0;
	virtual void addIceCandidate(const IceCandidate &candidate) = 0;
	virtual void restartIce() = 0;
	virtual void close() = 0;

	virtual bool negotiationNeeded() const = 0;
	virtual SignalingState signalingState() const = 0;
	virtual ConnectionState state() const = 0;
	virtual IceState iceState() const = 0;
	virtual TransportStats stats() = 0;

	void onNegotiationNeeded(std::function<void()> callback);
	void onLocalCandidate(std::function<void(IceCandidate candidate)> callback);
	void onStateChange(std::function<void(ConnectionState state)> callback);
	void onIceStateChange(std::function<void(IceState state)> callback);
	void onTrack(std::function<void(shared_ptr<MediaTrack> track, string streamId)> callback);

	// Drops every callback, called before close
	void resetCallbacks();

protected:
	void triggerNegotiationNeeded();
	void triggerLocalCandidate(IceCandidate candidate);
	void triggerStateChange(ConnectionState state);
	void triggerIceStateChange(IceState state);
	void triggerTrack(shared_ptr<MediaTrack> track, string streamId);

private:
	synchronized_callback<> mNegotiationNeededCallback;
	synchronized_callback<IceCandidate> mLocalCandidateCallback;
	synchronized_callback<ConnectionState> mStateChangeCallback;
	synchronized_callback<IceState> mIceStateChangeCallback;
	synchronized_callback<shared_ptr<MediaTrack>, string> mTrackCallback;
};

class MESHCALL_CPP_EXPORT PeerTransportFactory {
public:
	virtual ~PeerTransportFactory() = default;

	virtual shared_ptr<PeerTransport> create(const std::vector<IceServer> &iceServers) = 0;
};

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::SignalingState state);
MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::IceState state);

#endif
