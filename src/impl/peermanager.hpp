/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_PEER_MANAGER_H
#define MESHCALL_IMPL_PEER_MANAGER_H

#include "common.hpp"
#include "configuration.hpp"
#include "events.hpp"
#include "negotiation.hpp"
#include "participant.hpp"
#include "peertransport.hpp"
#include "signaling.hpp"

#include <mutex>
#include <unordered_map>

namespace meshcall::impl {

struct PeerConnectionRecord {
	shared_ptr<PeerTransport> transport;
	Participant participant;
	bool polite;
	NegotiationState negotiation = NegotiationState::Idle;
	bool renegotiate = false; // negotiation was needed while busy
	bool connectedOnce = false;
};

// Snapshot of one connection for the stats monitor
struct ConnectionReport {
	string participantId;
	ConnectionState state;
	IceState iceState;
	SignalingState signalingState;
	TransportStats stats;
};

class PeerManager final : public std::enable_shared_from_this<PeerManager> {
public:
	struct Hooks {
		// Publishes on the room channel, may throw
		std::function<void(const string &event, const json &payload)> send;
		std::function<void(Event event)> emit;
		// Runs a task on the session processor
		std::function<void(std::function<void()> task)> post;
	};

	struct Settings {
		string roomId;
		string localUserId;
		std::vector<IceServer> iceServers;
		size_t maxParticipants = 0;
	};

	PeerManager(Settings settings, shared_ptr<PeerTransportFactory> factory, Hooks hooks);
	~PeerManager();

	// Entry point for room events, envelopes for other users are dropped here
	void handleSignal(const string &event, const json &payload);

	optional<Participant> createConnection(const string &participantId, bool polite);
	void handleOffer(const SignalingMessage &message);
	void handleAnswer(const SignalingMessage &message);
	void handleIceCandidate(const SignalingMessage &message);
	bool removeConnection(const string &participantId);
	void closeAll();

	std::vector<Participant> getParticipants() const;
	optional<Participant> getParticipant(const string &participantId) const;
	bool updateParticipant(const string &participantId, std::function<void(Participant &)> update);
	optional<bool> isPolite(const string &participantId) const;
	optional<NegotiationState> negotiationState(const string &participantId) const;
	size_t count() const;

	// Outgoing tracks, attached to every present and future connection
	void attachTrack(shared_ptr<MediaTrack> track, const string &streamId);
	bool hasLocalTrack(MediaKind kind) const;

	// Swaps the outgoing track of a kind on every sender, without renegotiation
	size_t replaceTrack(MediaKind kind, shared_ptr<MediaTrack> track);

	std::vector<ConnectionReport> collectStats();
	void setNetworkQuality(const string &participantId, NetworkQuality quality);

private:
	struct LocalTrack {
		MediaKind kind;
		shared_ptr<MediaTrack> track;
		string streamId;
	};

	PeerConnectionRecord *findRecord(const string &participantId);
	void negotiate(const string &participantId);
	void acceptOffer(PeerConnectionRecord &record, const SessionDescription &offer);
	void settle(PeerConnectionRecord &record);
	void fail(PeerConnectionRecord &record, const std::exception &e);
	void sendMessage(SignalingMessage message);

	void handleLocalCandidate(const string &participantId, IceCandidate candidate);
	void handleStateChange(const string &participantId, ConnectionState state);
	void handleIceStateChange(const string &participantId, IceState state);
	void handleTrack(const string &participantId, shared_ptr<MediaTrack> track, string streamId);
	void handleTrackEnded(const string &participantId, const string &streamId,
	                      const string &trackId);

	void handlePresence(const string &event, const json &payload);

	void emit(Event event);
	void post(std::function<void()> task);

	const Settings mSettings;
	const shared_ptr<PeerTransportFactory> mFactory;
	const Hooks mHooks;

	std::unordered_map<string, PeerConnectionRecord> mRecords;
	std::vector<LocalTrack> mLocalTracks;
	mutable std::recursive_mutex mMutex;
};

} // namespace meshcall::impl

#endif
