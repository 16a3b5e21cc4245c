/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_NEGOTIATION_H
#define MESHCALL_NEGOTIATION_H

#include "common.hpp"

#include <iostream>

namespace meshcall {

// Per-connection negotiation state
//   Idle:          nothing in flight
//   Offering:      a local offer is out, waiting for the answer
//   AnswerPending: the remote answer is being applied
//   Ignoring:      like Offering, after a colliding remote offer was dropped
enum class NegotiationState { Idle, Offering, AnswerPending, Ignoring };

enum class NegotiationInput {
	NegotiationNeeded,
	RemoteOffer,
	RemoteAnswer,
	RemoteCandidate,
	AnswerApplied,
	Failure
};

enum class NegotiationAction {
	None,
	CreateOffer,
	Defer,                 // replay negotiation once back to Idle
	AcceptOffer,           // apply the remote offer and answer it
	RollbackAndAcceptOffer,
	IgnoreOffer,
	ApplyAnswer,
	RejectAnswer,          // answer without an outstanding offer
	AddCandidate,
	DropCandidate
};

struct NegotiationStep {
	NegotiationState next;
	NegotiationAction action;
};

// Perfect negotiation transition table. On an offer collision the polite side
// rolls back and accepts, the impolite side ignores the remote offer.
MESHCALL_CPP_EXPORT NegotiationStep Negotiate(NegotiationState state, NegotiationInput input,
                                              bool polite);

// Role tie-break when two polite sides collide: the greater user id turns impolite
MESHCALL_CPP_EXPORT bool KeepsPoliteRole(const string &localUserId, const string &remoteUserId);

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::NegotiationState state);
MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::NegotiationInput input);
MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out,
                                             meshcall::NegotiationAction action);

#endif
