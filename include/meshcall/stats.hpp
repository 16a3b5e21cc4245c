/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_STATS_H
#define MESHCALL_STATS_H

#include "common.hpp"
#include "participant.hpp"
#include "peertransport.hpp"

namespace meshcall {

// Snapshot of one peer connection, recomputed on every poll
struct CallStats {
	std::chrono::system_clock::time_point timestamp;
	ConnectionState connectionState = ConnectionState::New;
	IceState iceConnectionState = IceState::New;
	SignalingState signalingState = SignalingState::Stable;
	uint64_t bytesReceived = 0;
	uint64_t bytesSent = 0;
	uint64_t packetsReceived = 0;
	uint64_t packetsSent = 0;
	uint64_t packetsLost = 0;
	optional<double> jitter;
	optional<std::chrono::milliseconds> roundTripTime;
	optional<uint64_t> availableOutgoingBitrate;
	optional<uint64_t> availableIncomingBitrate;
};

// packetsLost / (packetsReceived + packetsLost), 0 before any packet was received
MESHCALL_CPP_EXPORT double PacketLossRate(const CallStats &stats);

MESHCALL_CPP_EXPORT NetworkQuality GradeNetworkQuality(double packetLossRate,
                                                       std::chrono::milliseconds rtt);

MESHCALL_CPP_EXPORT NetworkQuality GradeNetworkQuality(const CallStats &stats);

} // namespace meshcall

#endif
