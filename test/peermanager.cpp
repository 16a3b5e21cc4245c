/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "fakes.hpp"
#include "impl/peermanager.hpp"
#include "test.hpp"

using namespace meshcall;
using namespace fakes;

namespace {

struct Peer {
	shared_ptr<FakeTransportFactory> factory;
	shared_ptr<impl::PeerManager> manager;

	shared_ptr<FakeTransport> transport() const {
		auto transports = factory->transports();
		return !transports.empty() ? transports.back() : nullptr;
	}
};

Peer makePeer(ManualLoop &loop, const string &userId) {
	impl::PeerManager::Settings settings;
	settings.roomId = "room-1";
	settings.localUserId = userId;

	Peer peer;
	peer.factory = std::make_shared<FakeTransportFactory>();
	peer.manager = std::make_shared<impl::PeerManager>(
	    settings, peer.factory,
	    impl::PeerManager::Hooks{loop.sender(userId), loop.emitter(userId), loop.poster(userId)});

	auto manager = peer.manager;
	loop.attach(userId, [manager](const string &event, const json &payload) {
		manager->handleSignal(event, payload);
	});
	return peer;
}

shared_ptr<MediaTrack> makeTrack(const string &id) {
	return std::make_shared<MediaTrack>(id, MediaKind::Video, "test camera");
}

} // namespace

TestResult test_glare() {
	ManualLoop loop;
	Peer a = makePeer(loop, "u1");
	Peer b = makePeer(loop, "u2");

	a.manager->attachTrack(makeTrack("camera-a"), "stream-a");
	b.manager->attachTrack(makeTrack("camera-b"), "stream-b");

	// A is impolite toward B, B is polite toward A
	a.manager->createConnection("u2", false);
	b.manager->createConnection("u1", true);

	// Both sides raise negotiation-needed before any message crossed
	loop.runTasks();
	if (a.manager->negotiationState("u2") != NegotiationState::Offering ||
	    b.manager->negotiationState("u1") != NegotiationState::Offering)
		return TestResult(false, "Both sides should be offering");

	loop.pump();

	auto ta = a.transport();
	auto tb = b.transport();
	if (ta->state() != ConnectionState::Connected || tb->state() != ConnectionState::Connected)
		return TestResult(false, "Connections did not reach connected");

	if (tb->rollbackCount() != 1 || ta->rollbackCount() != 0)
		return TestResult(false, "Only the polite side should roll back");

	// Exactly one offer was accepted, B's offer was dropped by A
	if (ta->answerCount() != 0 || tb->answerCount() != 1)
		return TestResult(false, "Exactly one offer should be answered");

	if (a.manager->negotiationState("u2") != NegotiationState::Idle ||
	    b.manager->negotiationState("u1") != NegotiationState::Idle)
		return TestResult(false, "Negotiation did not settle");

	auto pa = a.manager->getParticipant("u2");
	auto pb = b.manager->getParticipant("u1");
	if (!pa || pa->streams.count("stream-b") == 0 || !pb || pb->streams.count("stream-a") == 0)
		return TestResult(false, "Remote streams were not received");

	return TestResult(true);
}

TestResult test_polite_tiebreak() {
	ManualLoop loop;
	Peer a = makePeer(loop, "u1");
	Peer b = makePeer(loop, "u2");

	a.manager->attachTrack(makeTrack("camera-a"), "stream-a");
	b.manager->attachTrack(makeTrack("camera-b"), "stream-b");

	// Simultaneous announcements, both sides think they are polite
	a.manager->createConnection("u2", true);
	b.manager->createConnection("u1", true);

	loop.runTasks();
	loop.pump();

	if (a.manager->isPolite("u2") != true || b.manager->isPolite("u1") != false)
		return TestResult(false, "The greater user id should turn impolite");

	if (a.transport()->state() != ConnectionState::Connected ||
	    b.transport()->state() != ConnectionState::Connected)
		return TestResult(false, "Connections did not reach connected");

	if (a.transport()->rollbackCount() != 1 || b.transport()->rollbackCount() != 0)
		return TestResult(false, "Only the side keeping the polite role should roll back");

	return TestResult(true);
}

TestResult test_recipient_filtering() {
	ManualLoop loop;
	Peer a = makePeer(loop, "u1");
	a.manager->createConnection("u2", true);
	loop.runTasks();

	auto transport = a.transport();
	const auto state = a.manager->negotiationState("u2");
	const auto created = a.factory->createdCount();

	SessionDescription offer{SessionDescription::Type::Offer, "fake u2 1\ntrack video s x\n"};
	SignalingMessage message;
	message.type = SignalingMessage::Type::Offer;
	message.from = "u2";
	message.to = "u3";
	message.roomId = "room-1";
	message.data = offer;

	// Addressed to someone else, from a known and from an unknown sender
	a.manager->handleSignal(message.event(), message.toJson());
	message.from = "u9";
	a.manager->handleSignal(message.event(), message.toJson());

	SignalingMessage candidate;
	candidate.type = SignalingMessage::Type::IceCandidate;
	candidate.from = "u2";
	candidate.to = "u3";
	candidate.roomId = "room-1";
	candidate.data = IceCandidate{"candidate:1 1 UDP 1 10.0.0.1 9 typ host", "0"};
	a.manager->handleSignal(candidate.event(), candidate.toJson());

	// Our own presence echoed back
	a.manager->handleSignal(signaling::CallEnd, json{{"participantId", "u1"}});

	loop.runTasks();

	if (a.factory->createdCount() != created || a.manager->count() != 1)
		return TestResult(false, "A connection was created for a foreign message");

	if (a.manager->negotiationState("u2") != state)
		return TestResult(false, "Negotiation state changed for a foreign message");

	if (transport->signalingState() != SignalingState::HaveLocalOffer ||
	    transport->candidateCount() != 0 || transport->answerCount() != 0)
		return TestResult(false, "The transport was touched by a foreign message");

	// Malformed envelopes addressed to us are reported, not applied
	a.manager->handleSignal(signaling::Offer, json{{"to", "u1"}, {"from", "u2"}});
	auto &events = loop.events("u1");
	bool reported = false;
	for (const auto &event : events)
		if (auto error = std::get_if<ErrorEvent>(&event))
			reported |= error->code == ErrorCode::SignalingError;

	if (!reported)
		return TestResult(false, "Malformed message was not reported");

	return TestResult(true);
}

TestResult test_connection_failure() {
	ManualLoop loop;
	Peer a = makePeer(loop, "u1");
	Peer b = makePeer(loop, "u2");
	a.manager->attachTrack(makeTrack("camera-a"), "stream-a");

	a.manager->handleSignal(signaling::CallStart,
	                        json{{"participant", {{"id", "u2"}, {"name", "Bob"}}}});
	loop.pump();

	auto participant = a.manager->getParticipant("u2");
	if (!participant || participant->name != "Bob" ||
	    participant->connectionState != ConnectionState::Connected)
		return TestResult(false, "Announced participant did not connect");

	a.transport()->fail();
	loop.runTasks();

	if (a.transport()->restartCount() != 1)
		return TestResult(false, "ICE failure did not trigger a restart");

	if (a.manager->count() != 0)
		return TestResult(false, "Failed connection was not removed");

	size_t disconnected = 0;
	bool reported = false;
	for (const auto &event : loop.events("u1")) {
		if (std::holds_alternative<PeerDisconnectedEvent>(event))
			++disconnected;
		if (auto error = std::get_if<ErrorEvent>(&event))
			reported |= error->code == ErrorCode::PeerConnectionFailed;
	}

	if (disconnected != 1 || !reported)
		return TestResult(false, "Failure was not surfaced");

	// Unrelated connections are unaffected
	if (b.manager->count() != 1)
		return TestResult(false, "Remote side lost its connection");

	return TestResult(true);
}
