/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "peertransport.hpp"

#include <stdexcept>

namespace meshcall {

SessionDescription::Type SessionDescription::stringToType(const string &typeString) {
	if (typeString == "offer")
		return Type::Offer;
	if (typeString == "answer")
		return Type::Answer;
	if (typeString == "rollback")
		return Type::Rollback;
	if (typeString.empty() || typeString == "unspec")
		return Type::Unspec;

	throw std::invalid_argument("Unknown session description type: " + typeString);
}

string SessionDescription::typeToString(Type type) {
	switch (type) {
	case Type::Offer:
		return "offer";
	case Type::Answer:
		return "answer";
	case Type::Rollback:
		return "rollback";
	default:
		return "unspec";
	}
}

void PeerTransport::onNegotiationNeeded(std::function<void()> callback) {
	mNegotiationNeededCallback = std::move(callback);
}

void PeerTransport::onLocalCandidate(std::function<void(IceCandidate candidate)> callback) {
	mLocalCandidateCallback = std::move(callback);
}

void PeerTransport::onStateChange(std::function<void(ConnectionState state)> callback) {
	mStateChangeCallback = std::move(callback);
}

void PeerTransport::onIceStateChange(std::function<void(IceState state)> callback) {
	mIceStateChangeCallback = std::move(callback);
}

void PeerTransport::onTrack(
    std::function<void(shared_ptr<MediaTrack> track, string streamId)> callback) {
	mTrackCallback = std::move(callback);
}

void PeerTransport::resetCallbacks() {
	mNegotiationNeededCallback = nullptr;
	mLocalCandidateCallback = nullptr;
	mStateChangeCallback = nullptr;
	mIceStateChangeCallback = nullptr;
	mTrackCallback = nullptr;
}

void PeerTransport::triggerNegotiationNeeded() { mNegotiationNeededCallback(); }

void PeerTransport::triggerLocalCandidate(IceCandidate candidate) {
	mLocalCandidateCallback(std::move(candidate));
}

void PeerTransport::triggerStateChange(ConnectionState state) { mStateChangeCallback(state); }

void PeerTransport::triggerIceStateChange(IceState state) { mIceStateChangeCallback(state); }

void PeerTransport::triggerTrack(shared_ptr<MediaTrack> track, string streamId) {
	mTrackCallback(std::move(track), std::move(streamId));
}

} // namespace meshcall

std::ostream &operator<<(std::ostream &out, meshcall::SignalingState state) {
	using State = meshcall::SignalingState;
	const char *str;
	switch (state) {
	case State::Stable:
		str = "stable";
		break;
	case State::HaveLocalOffer:
		str = "have-local-offer";
		break;
	case State::HaveRemoteOffer:
		str = "have-remote-offer";
		break;
	case State::HaveLocalPranswer:
		str = "have-local-pranswer";
		break;
	case State::HaveRemotePranswer:
		str = "have-remote-pranswer";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}

std::ostream &operator<<(std::ostream &out, meshcall::IceState state) {
	using State = meshcall::IceState;
	const char *str;
	switch (state) {
	case State::New:
		str = "new";
		break;
	case State::Checking:
		str = "checking";
		break;
	case State::Connected:
		str = "connected";
		break;
	case State::Completed:
		str = "completed";
		break;
	case State::Failed:
		str = "failed";
		break;
	case State::Disconnected:
		str = "disconnected";
		break;
	case State::Closed:
		str = "closed";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}
