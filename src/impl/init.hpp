/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_INIT_H
#define MESHCALL_IMPL_INIT_H

#include "common.hpp"

#include <future>
#include <mutex>

namespace meshcall::impl {

using init_token = shared_ptr<void>;

// Reference-counted global runtime, the thread pool lives as long as a token exists
class Init {
public:
	static Init &Instance();

	Init(const Init &) = delete;
	Init &operator=(const Init &) = delete;
	Init(Init &&) = delete;
	Init &operator=(Init &&) = delete;

	init_token token();
	void preload();
	std::shared_future<void> cleanup();

private:
	Init();
	~Init();

	void doInit();
	void doCleanup();

	optional<shared_ptr<void>> mGlobal;
	weak_ptr<void> mWeak;
	bool mInitialized = false;
	std::shared_future<void> mCleanupFuture;
	std::recursive_mutex mMutex;

	struct TokenPayload;
};

} // namespace meshcall::impl

#endif
