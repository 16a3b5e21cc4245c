/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_GLOBAL_H
#define MESHCALL_GLOBAL_H

#include "common.hpp"

#include <future>
#include <iostream>

namespace meshcall {

enum class LogLevel { // Don't change, it must match plog severity
	None = 0,
	Fatal = 1,
	Error = 2,
	Warning = 3,
	Info = 4,
	Debug = 5,
	Verbose = 6
};

typedef std::function<void(LogLevel level, string message)> LogCallback;

// Also sets the log level of the underlying peer transport library
MESHCALL_CPP_EXPORT void InitLogger(LogLevel level, LogCallback callback = nullptr);

MESHCALL_CPP_EXPORT void Preload();
MESHCALL_CPP_EXPORT std::shared_future<void> Cleanup();

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::LogLevel level);

#endif
