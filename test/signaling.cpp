/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "meshcall/error.hpp"
#include "meshcall/signaling.hpp"
#include "test.hpp"

using namespace meshcall;

namespace {

bool rejects(const json &j) {
	try {
		SignalingMessage::FromJson(j);
		return false;
	} catch (const CallError &e) {
		return e.code() == ErrorCode::SignalingError;
	}
}

} // namespace

TestResult test_signaling_codec() {
	const json offer = json::parse(R"({
		"type": "offer", "from": "u1", "to": "u2", "roomId": "room-42",
		"data": {"type": "offer", "sdp": "v=0", "polite": true}
	})");

	auto message = SignalingMessage::FromJson(offer);
	if (message.type != SignalingMessage::Type::Offer || message.from != "u1" ||
	    message.to != "u2" || message.roomId != "room-42" || !message.polite)
		return TestResult(false, "Offer envelope decoded incorrectly");

	auto description = std::get_if<SessionDescription>(&message.data);
	if (!description || description->sdp != "v=0" ||
	    description->type != SessionDescription::Type::Offer)
		return TestResult(false, "Offer description decoded incorrectly");

	if (message.event() != "webrtc:offer" || message.toJson() != offer)
		return TestResult(false, "Offer envelope encoded incorrectly");

	const json candidate = json::parse(R"({
		"type": "ice-candidate", "from": "u2", "to": "u1", "roomId": "room-42",
		"data": {"candidate": "candidate:1 1 UDP 1 10.0.0.1 9 typ host", "sdpMid": "0"}
	})");

	auto decoded = SignalingMessage::FromJson(candidate);
	auto ice = std::get_if<IceCandidate>(&decoded.data);
	if (!ice || ice->mid != "0" || decoded.event() != "webrtc:ice-candidate")
		return TestResult(false, "Candidate envelope decoded incorrectly");

	// Answers carry no role
	SignalingMessage answer;
	answer.type = SignalingMessage::Type::Answer;
	answer.from = "u2";
	answer.to = "u1";
	answer.roomId = "room-42";
	answer.data = SessionDescription{SessionDescription::Type::Answer, "v=0"};
	if (answer.toJson()["data"].contains("polite"))
		return TestResult(false, "Answer carries a polite flag");

	json mismatched = offer;
	mismatched["data"]["type"] = "answer";
	json unknown = offer;
	unknown["type"] = "bye";
	json missing = offer;
	missing.erase("to");
	json noData = offer;
	noData["data"] = "v=0";

	for (const auto &j : {mismatched, unknown, missing, noData, json("offer"), json::object()})
		if (!rejects(j))
			return TestResult(false, "Malformed envelope accepted: " + j.dump());

	return TestResult(true);
}
