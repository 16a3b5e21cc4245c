/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_STATS_MONITOR_H
#define MESHCALL_IMPL_STATS_MONITOR_H

#include "common.hpp"
#include "events.hpp"
#include "peermanager.hpp"
#include "periodictimer.hpp"
#include "stats.hpp"

#include <atomic>

namespace meshcall::impl {

// Polls every connection at a fixed interval and grades its network quality
class StatsMonitor final : public std::enable_shared_from_this<StatsMonitor> {
public:
	using Post = std::function<void(std::function<void()> task)>;
	using Emit = std::function<void(Event event)>;

	StatsMonitor(shared_ptr<PeerManager> peers, std::chrono::milliseconds interval, Post post,
	             Emit emit);
	~StatsMonitor();

	void start();
	void stop(); // no poll starts after it returns
	bool isRunning() const;

	// One polling round over every connection
	void poll();

	static CallStats MakeStats(const ConnectionReport &report);

private:
	void tick();

	const shared_ptr<PeerManager> mPeers;
	const Post mPost;
	const Emit mEmit;

	PeriodicTimer mTimer;
	std::atomic<bool> mRunning = false;
};

} // namespace meshcall::impl

#endif
