/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_QUEUE_H
#define MESHCALL_IMPL_QUEUE_H

#include "common.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace meshcall::impl {

template <typename T> class Queue {
public:
	Queue(size_t limit = 0);
	~Queue();

	void stop();
	bool running() const;
	bool empty() const;
	bool full() const;
	size_t size() const;
	void push(T element);
	optional<T> pop();
	optional<T> tryPop();
	bool wait(const optional<std::chrono::milliseconds> &duration = nullopt);

private:
	void pushImpl(T element);
	T popImpl();

	const size_t mLimit;
	std::queue<T> mQueue;
	std::condition_variable mPopCondition, mPushCondition;
	bool mStopping = false;

	mutable std::mutex mMutex;
};

template <typename T> Queue<T>::Queue(size_t limit) : mLimit(limit) {}

template <typename T> Queue<T>::~Queue() { stop(); }

template <typename T> void Queue<T>::stop() {
	std::lock_guard lock(mMutex);
	mStopping = true;
	mPopCondition.notify_all();
	mPushCondition.notify_all();
}

template <typename T> bool Queue<T>::running() const {
	std::lock_guard lock(mMutex);
	return !mQueue.empty() || !mStopping;
}

template <typename T> bool Queue<T>::empty() const {
	std::lock_guard lock(mMutex);
	return mQueue.empty();
}

template <typename T> bool Queue<T>::full() const {
	std::lock_guard lock(mMutex);
	return mLimit > 0 && mQueue.size() >= mLimit;
}

template <typename T> size_t Queue<T>::size() const {
	std::lock_guard lock(mMutex);
	return mQueue.size();
}

template <typename T> void Queue<T>::push(T element) {
	std::unique_lock lock(mMutex);
	mPushCondition.wait(lock, [this]() { return !mLimit || mQueue.size() < mLimit || mStopping; });
	if (mStopping)
		return;

	pushImpl(std::move(element));
}

template <typename T> optional<T> Queue<T>::pop() {
	std::unique_lock lock(mMutex);
	mPopCondition.wait(lock, [this]() { return !mQueue.empty() || mStopping; });
	if (mQueue.empty())
		return nullopt;

	return popImpl();
}

template <typename T> optional<T> Queue<T>::tryPop() {
	std::unique_lock lock(mMutex);
	if (mQueue.empty())
		return nullopt;

	return popImpl();
}

template <typename T> bool Queue<T>::wait(const optional<std::chrono::milliseconds> &duration) {
	std::unique_lock lock(mMutex);
	if (duration)
		mPopCondition.wait_for(lock, *duration,
		                       [this]() { return !mQueue.empty() || mStopping; });
	else
		mPopCondition.wait(lock, [this]() { return !mQueue.empty() || mStopping; });

	return !mQueue.empty();
}

template <typename T> void Queue<T>::pushImpl(T element) {
	mQueue.emplace(std::move(element));
	mPopCondition.notify_one();
}

template <typename T> T Queue<T>::popImpl() {
	T element = std::move(mQueue.front());
	mQueue.pop();
	mPushCondition.notify_one();
	return element;
}

} // namespace meshcall::impl

#endif
