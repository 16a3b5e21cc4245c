/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "periodictimer.hpp"
#include "internals.hpp"

namespace meshcall::impl {

PeriodicTimer::PeriodicTimer(std::chrono::milliseconds interval, Callback callback)
    : mInterval(interval), mCallback(std::move(callback)) {
	if (mInterval <= std::chrono::milliseconds::zero())
		throw std::invalid_argument("Timer interval must be positive");
}

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start() {
	std::unique_lock lock(mMutex);
	if (mRunning)
		return;

	mRunning = true;
	mThread = std::thread(&PeriodicTimer::run, this);
}

void PeriodicTimer::stop() {
	{
		std::unique_lock lock(mMutex);
		mRunning = false;
		mCondition.notify_all();
	}

	if (!mThread.joinable())
		return;

	if (mThread.get_id() == std::this_thread::get_id())
		mThread.detach(); // stopped from the callback, the loop exits after it returns
	else
		mThread.join();
}

bool PeriodicTimer::isRunning() const {
	std::unique_lock lock(mMutex);
	return mRunning;
}

void PeriodicTimer::run() {
	auto next = clock::now() + mInterval;
	std::unique_lock lock(mMutex);
	while (true) {
		if (mCondition.wait_until(lock, next, [this]() { return !mRunning; }))
			break;

		next += mInterval;
		lock.unlock();
		try {
			mCallback();
		} catch (const std::exception &e) {
			PLOG_WARNING << "Timer callback failed: " << e.what();
		}
		lock.lock();
	}
	PLOG_VERBOSE << "Timer thread finished";
}

} // namespace meshcall::impl
