/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "stats.hpp"

namespace meshcall {

double PacketLossRate(const CallStats &stats) {
	const uint64_t total = stats.packetsReceived + stats.packetsLost;
	if (total == 0)
		return 0.0;

	return double(stats.packetsLost) / double(total);
}

NetworkQuality GradeNetworkQuality(double packetLossRate, std::chrono::milliseconds rtt) {
	using namespace std::chrono_literals;
	if (packetLossRate < 0.01 && rtt < 150ms)
		return NetworkQuality::Excellent;
	if (packetLossRate < 0.03 && rtt < 300ms)
		return NetworkQuality::Good;
	if (packetLossRate < 0.05 && rtt < 500ms)
		return NetworkQuality::Fair;
	if (packetLossRate < 0.10 && rtt < 1000ms)
		return NetworkQuality::Poor;

	return NetworkQuality::Critical;
}

NetworkQuality GradeNetworkQuality(const CallStats &stats) {
	// An unknown round-trip time counts as zero
	return GradeNetworkQuality(PacketLossRate(stats),
	                           stats.roundTripTime.value_or(std::chrono::milliseconds::zero()));
}

} // namespace meshcall
