/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "processor.hpp"

namespace meshcall::impl {

Processor::Processor(size_t limit) : mTasks(limit) {}

Processor::~Processor() {}

void Processor::join() {
	std::unique_lock lock(mMutex);
	mCondition.wait(lock, [this]() { return !mPending && mTasks.empty(); });
}

bool Processor::isCurrent() const { return Current == this; }

thread_local const Processor *Processor::Current = nullptr;

Processor::CurrentGuard::CurrentGuard(const Processor *processor) : previous(Current) {
	Current = processor;
}

Processor::CurrentGuard::~CurrentGuard() { Current = previous; }

void Processor::schedule() {
	std::unique_lock lock(mMutex);
	if (auto next = mTasks.tryPop()) {
		ThreadPool::Instance().enqueue(std::move(*next));
	} else {
		// No more tasks
		mPending = false;
		mCondition.notify_all();
	}
}

} // namespace meshcall::impl
