/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "negotiation.hpp"

namespace meshcall {

NegotiationStep Negotiate(NegotiationState state, NegotiationInput input, bool polite) {
	using State = NegotiationState;
	using Input = NegotiationInput;
	using Action = NegotiationAction;

	if (input == Input::Failure)
		return {State::Idle, Action::None};

	switch (state) {
	case State::Idle:
		switch (input) {
		case Input::NegotiationNeeded:
			return {State::Offering, Action::CreateOffer};
		case Input::RemoteOffer:
			return {State::Idle, Action::AcceptOffer};
		case Input::RemoteAnswer:
			return {State::Idle, Action::RejectAnswer};
		case Input::RemoteCandidate:
			return {State::Idle, Action::AddCandidate};
		default:
			return {State::Idle, Action::None};
		}

	case State::Offering:
		switch (input) {
		case Input::NegotiationNeeded:
			return {State::Offering, Action::Defer};
		case Input::RemoteOffer:
			if (polite)
				return {State::Idle, Action::RollbackAndAcceptOffer};
			else
				return {State::Ignoring, Action::IgnoreOffer};
		case Input::RemoteAnswer:
			return {State::AnswerPending, Action::ApplyAnswer};
		case Input::RemoteCandidate:
			return {State::Offering, Action::AddCandidate};
		default:
			return {State::Offering, Action::None};
		}

	case State::AnswerPending:
		switch (input) {
		case Input::NegotiationNeeded:
			return {State::AnswerPending, Action::Defer};
		case Input::RemoteOffer:
			// Our offer is settled, a new remote offer starts a fresh round
			return {State::Idle, Action::AcceptOffer};
		case Input::RemoteAnswer:
			return {State::AnswerPending, Action::RejectAnswer};
		case Input::RemoteCandidate:
			return {State::AnswerPending, Action::AddCandidate};
		case Input::AnswerApplied:
			return {State::Idle, Action::None};
		default:
			return {State::AnswerPending, Action::None};
		}

	case State::Ignoring:
		switch (input) {
		case Input::NegotiationNeeded:
			return {State::Ignoring, Action::Defer};
		case Input::RemoteOffer:
			return {State::Ignoring, Action::IgnoreOffer};
		case Input::RemoteAnswer:
			return {State::AnswerPending, Action::ApplyAnswer};
		case Input::RemoteCandidate:
			return {State::Ignoring, Action::DropCandidate};
		default:
			return {State::Ignoring, Action::None};
		}

	default:
		return {state, Action::None};
	}
}

bool KeepsPoliteRole(const string &localUserId, const string &remoteUserId) {
	return localUserId < remoteUserId;
}

} // namespace meshcall

std::ostream &operator<<(std::ostream &out, meshcall::NegotiationState state) {
	using State = meshcall::NegotiationState;
	const char *str;
	switch (state) {
	case State::Idle:
		str = "idle";
		break;
	case State::Offering:
		str = "offering";
		break;
	case State::AnswerPending:
		str = "answer-pending";
		break;
	case State::Ignoring:
		str = "ignoring";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}

std::ostream &operator<<(std::ostream &out, meshcall::NegotiationInput input) {
	using Input = meshcall::NegotiationInput;
	const char *str;
	switch (input) {
	case Input::NegotiationNeeded:
		str = "negotiation-needed";
		break;
	case Input::RemoteOffer:
		str = "remote-offer";
		break;
	case Input::RemoteAnswer:
		str = "remote-answer";
		break;
	case Input::RemoteCandidate:
		str = "remote-candidate";
		break;
	case Input::AnswerApplied:
		str = "answer-applied";
		break;
	case Input::Failure:
		str = "failure";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}

std::ostream &operator<<(std::ostream &out, meshcall::NegotiationAction action) {
	using Action = meshcall::NegotiationAction;
	const char *str;
	switch (action) {
	case Action::None:
		str = "none";
		break;
	case Action::CreateOffer:
		str = "create-offer";
		break;
	case Action::Defer:
		str = "defer";
		break;
	case Action::AcceptOffer:
		str = "accept-offer";
		break;
	case Action::RollbackAndAcceptOffer:
		str = "rollback-and-accept-offer";
		break;
	case Action::IgnoreOffer:
		str = "ignore-offer";
		break;
	case Action::ApplyAnswer:
		str = "apply-answer";
		break;
	case Action::RejectAnswer:
		str = "reject-answer";
		break;
	case Action::AddCandidate:
		str = "add-candidate";
		break;
	case Action::DropCandidate:
		str = "drop-candidate";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}
