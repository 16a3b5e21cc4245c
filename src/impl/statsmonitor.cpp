/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "statsmonitor.hpp"
#include "internals.hpp"

namespace meshcall::impl {

StatsMonitor::StatsMonitor(shared_ptr<PeerManager> peers, std::chrono::milliseconds interval,
                           Post post, Emit emit)
    : mPeers(std::move(peers)), mPost(std::move(post)), mEmit(std::move(emit)),
      mTimer(interval, [this]() { tick(); }) {}

StatsMonitor::~StatsMonitor() { stop(); }

void StatsMonitor::start() {
	if (mRunning.exchange(true))
		return;

	PLOG_DEBUG << "Starting stats monitor, interval " << mTimer.interval().count() << "ms";
	mTimer.start();
}

void StatsMonitor::stop() {
	if (!mRunning.exchange(false))
		return;

	PLOG_DEBUG << "Stopping stats monitor";
	mTimer.stop();
}

bool StatsMonitor::isRunning() const { return mRunning; }

void StatsMonitor::tick() {
	// The poll itself runs on the session processor
	mPost([weak_this = weak_from_this()]() {
		auto self = weak_this.lock();
		if (self && self->mRunning)
			self->poll();
	});
}

void StatsMonitor::poll() {
	for (const auto &report : mPeers->collectStats()) {
		CallStats stats = MakeStats(report);
		NetworkQuality quality = GradeNetworkQuality(stats);

		PLOG_VERBOSE << "Connection to " << report.participantId << ": loss "
		             << PacketLossRate(stats) << ", quality " << quality;

		mPeers->setNetworkQuality(report.participantId, quality);
		mEmit(StatsEvent{report.participantId, std::move(stats), quality});
	}
}

CallStats StatsMonitor::MakeStats(const ConnectionReport &report) {
	const auto &raw = report.stats;
	CallStats stats;
	stats.timestamp = std::chrono::system_clock::now();
	stats.connectionState = report.state;
	stats.iceConnectionState = report.iceState;
	stats.signalingState = report.signalingState;
	stats.bytesReceived = raw.bytesReceived;
	stats.bytesSent = raw.bytesSent;
	stats.packetsReceived = raw.packetsReceived;
	stats.packetsSent = raw.packetsSent;
	stats.packetsLost = raw.packetsLost;
	stats.jitter = raw.jitter;
	stats.roundTripTime = raw.roundTripTime;
	stats.availableOutgoingBitrate = raw.availableOutgoingBitrate;
	stats.availableIncomingBitrate = raw.availableIncomingBitrate;
	return stats;
}

} // namespace meshcall::impl
