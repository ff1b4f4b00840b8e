// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "Assertions.h"
#include "Console.h"

#include "fmt/format.h"

#include <cstdio>
#include <cstdlib>
#include <mutex>

static std::mutex s_assertion_failed_mutex;

void pxOnAssertFail(const char* file, int line, const char* func, const char* msg)
{
	std::unique_lock guard(s_assertion_failed_mutex);

	const std::string full_msg = fmt::format("{}:{}: assertion failed in function {}: {}", file, line, func, msg);

	// Route through the host sink as well, the console may be disabled.
	ERROR_LOG("{}", full_msg);

	std::fputs(full_msg.c_str(), stderr);
	std::fputs("\nAborting application.\n", stderr);
	std::fflush(stderr);
	std::abort();
}
