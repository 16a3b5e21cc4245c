/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "signaling.hpp"
#include "error.hpp"

namespace meshcall {

namespace {

string requireString(const json &j, const char *key) {
	auto it = j.find(key);
	if (it == j.end() || !it->is_string())
		throw CallError(ErrorCode::SignalingError,
		                string("Signaling message is missing string field \"") + key + "\"");

	return it->get<string>();
}

SignalingMessage::Type stringToType(const string &type) {
	if (type == "offer")
		return SignalingMessage::Type::Offer;
	if (type == "answer")
		return SignalingMessage::Type::Answer;
	if (type == "ice-candidate")
		return SignalingMessage::Type::IceCandidate;

	throw CallError(ErrorCode::SignalingError, "Unknown signaling message type: " + type);
}

} // namespace

string SignalingMessage::typeToString(Type type) {
	switch (type) {
	case Type::Offer:
		return "offer";
	case Type::Answer:
		return "answer";
	default:
		return "ice-candidate";
	}
}

string SignalingMessage::event() const {
	switch (type) {
	case Type::Offer:
		return signaling::Offer;
	case Type::Answer:
		return signaling::Answer;
	default:
		return signaling::IceCandidate;
	}
}

json SignalingMessage::toJson() const {
	json payload;
	std::visit(overloaded{[&](const SessionDescription &description) {
		                      payload["type"] = SessionDescription::typeToString(description.type);
		                      payload["sdp"] = description.sdp;
		                      if (type == Type::Offer)
			                      payload["polite"] = polite;
	                      },
	                      [&](const meshcall::IceCandidate &candidate) {
		                      payload["candidate"] = candidate.candidate;
		                      payload["sdpMid"] = candidate.mid;
	                      }},
	           data);

	return json{{"type", typeToString(type)},
	            {"from", from},
	            {"to", to},
	            {"roomId", roomId},
	            {"data", std::move(payload)}};
}

SignalingMessage SignalingMessage::FromJson(const json &j) {
	if (!j.is_object())
		throw CallError(ErrorCode::SignalingError, "Signaling message is not an object");

	SignalingMessage message;
	message.type = stringToType(requireString(j, "type"));
	message.from = requireString(j, "from");
	message.to = requireString(j, "to");
	message.roomId = requireString(j, "roomId");

	auto it = j.find("data");
	if (it == j.end() || !it->is_object())
		throw CallError(ErrorCode::SignalingError, "Signaling message has no data");

	const json &data = *it;
	if (message.type == Type::IceCandidate) {
		meshcall::IceCandidate candidate;
		candidate.candidate = requireString(data, "candidate");
		if (auto mid = data.find("sdpMid"); mid != data.end() && mid->is_string())
			candidate.mid = mid->get<string>();

		message.data = std::move(candidate);
		return message;
	}

	SessionDescription description;
	try {
		description.type = SessionDescription::stringToType(requireString(data, "type"));
	} catch (const std::invalid_argument &e) {
		throw CallError(ErrorCode::SignalingError, e.what());
	}
	description.sdp = requireString(data, "sdp");

	auto expected = message.type == Type::Offer ? SessionDescription::Type::Offer
	                                            : SessionDescription::Type::Answer;
	if (description.type != expected)
		throw CallError(ErrorCode::SignalingError,
		                "Description of type " + SessionDescription::typeToString(description.type) +
		                    " in " + typeToString(message.type) + " message");

	if (auto polite = data.find("polite"); polite != data.end() && polite->is_boolean())
		message.polite = polite->get<bool>();

	message.data = std::move(description);
	return message;
}

void SignalingChannel::onMessage(MessageHandler handler) {
	mMessageCallback = std::move(handler);
}

void SignalingChannel::triggerMessage(string event, json payload) {
	mMessageCallback(std::move(event), std::move(payload));
}

} // namespace meshcall
