// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "DocPatchTypes.h"
#include <cstddef>

// --------------------------------------------------------------------------------------
//  Microsoft Visual Studio
// --------------------------------------------------------------------------------------
#ifdef _MSC_VER

#define ASSUME(x) __assume(x)

#else

// --------------------------------------------------------------------------------------
//  GCC / Clang Compilers Section
// --------------------------------------------------------------------------------------

// GCC needs ((unused)) on inlined functions to suppress warnings when a static inlined
// function isn't used in the scope of a single file.
#define __forceinline __attribute__((always_inline, unused))

#define ASSUME(x) \
	do \
	{ \
		if (!(x)) \
			__builtin_unreachable(); \
	} while (0)

#endif

// --------------------------------------------------------------------------------------
// __releaseinline / __ri -- a forceinline macro that is enabled for RELEASE builds ONLY.
// --------------------------------------------------------------------------------------
// Log sinks are stepped through in devel builds and inlined in optimized release builds.
//
#define __fi __forceinline
#ifdef DOCPATCH_DEVBUILD
#define __ri
#else
#define __ri __fi
#endif
