/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_PROCESSOR_H
#define MESHCALL_IMPL_PROCESSOR_H

#include "common.hpp"
#include "init.hpp"
#include "queue.hpp"
#include "threadpool.hpp"

#include <condition_variable>
#include <mutex>

namespace meshcall::impl {

// Processes tasks in order by delegating them to the thread pool. Pending tasks keep
// the processor alive, so it must be held by a shared_ptr.
class Processor final : public std::enable_shared_from_this<Processor> {
public:
	Processor(size_t limit = 0);
	~Processor();

	Processor(const Processor &) = delete;
	Processor &operator=(const Processor &) = delete;
	Processor(Processor &&) = delete;
	Processor &operator=(Processor &&) = delete;

	// Waits until every enqueued task ran, must not be called from a task
	void join();

	// True if called from one of the processor's tasks
	bool isCurrent() const;

	template <class F, class... Args> void enqueue(F &&f, Args &&...args) noexcept(true);

private:
	void schedule();

	struct CurrentGuard {
		CurrentGuard(const Processor *processor);
		~CurrentGuard();
		const Processor *previous;
	};
	static thread_local const Processor *Current;

	// Keep an init token
	const init_token mInitToken = Init::Instance().token();

	Queue<std::function<void()>> mTasks;
	bool mPending = false; // true iff a task is pending in the thread pool

	mutable std::mutex mMutex;
	std::condition_variable mCondition;
};

template <class F, class... Args> void Processor::enqueue(F &&f, Args &&...args) noexcept(true) {
	std::unique_lock lock(mMutex);
	auto bound = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
	auto task = [self = shared_from_this(), bound = std::move(bound)]() mutable {
		scope_guard guard([&self]() { self->schedule(); }); // chain the next task
		CurrentGuard current(self.get());
		try {
			bound();
		} catch (const std::exception &e) {
			PLOG_WARNING << "Unhandled exception in processed task: " << e.what();
		}
	};

	if (!mPending) {
		ThreadPool::Instance().enqueue(std::move(task));
		mPending = true;
	} else {
		mTasks.push(std::move(task));
	}
}

} // namespace meshcall::impl

#endif
