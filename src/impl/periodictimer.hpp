/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_PERIODIC_TIMER_H
#define MESHCALL_IMPL_PERIODIC_TIMER_H

#include "common.hpp"

#include <condition_variable>
#include <thread>

namespace meshcall::impl {

// Calls a function at a fixed interval on a dedicated thread
class PeriodicTimer final {
public:
	using Callback = std::function<void()>;

	PeriodicTimer(std::chrono::milliseconds interval, Callback callback);
	~PeriodicTimer();

	PeriodicTimer(const PeriodicTimer &) = delete;
	PeriodicTimer &operator=(const PeriodicTimer &) = delete;

	void start();

	// No tick runs after stop() returns, unless called from the tick itself
	void stop();

	bool isRunning() const;
	std::chrono::milliseconds interval() const { return mInterval; }

private:
	void run();

	const std::chrono::milliseconds mInterval;
	const Callback mCallback;

	std::thread mThread;
	bool mRunning = false;

	mutable std::mutex mMutex;
	std::condition_variable mCondition;
};

} // namespace meshcall::impl

#endif
