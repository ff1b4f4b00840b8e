// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

/**
 * Provides map templates which don't require heap allocations for lookups by string_view.
 */

#pragma once

#include "DocPatchDefs.h"
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace detail
{
	struct transparent_string_hash
	{
		using is_transparent = void;

		std::size_t operator()(const std::string_view& v) const { return std::hash<std::string_view>{}(v); }
		std::size_t operator()(const std::string& s) const { return std::hash<std::string>{}(s); }
		std::size_t operator()(const char* s) const { return operator()(std::string_view(s)); }
	};

	struct transparent_string_equal
	{
		using is_transparent = void;

		bool operator()(const std::string& lhs, const std::string_view& rhs) const { return lhs == rhs; }
		bool operator()(const std::string& lhs, const std::string& rhs) const { return lhs == rhs; }
		bool operator()(const std::string& lhs, const char* rhs) const { return lhs == rhs; }
		bool operator()(const std::string_view& lhs, const std::string& rhs) const { return lhs == rhs; }
		bool operator()(const char* lhs, const std::string& rhs) const { return lhs == rhs; }
	};

	struct transparent_string_less
	{
		using is_transparent = void;

		bool operator()(const std::string& lhs, const std::string_view& rhs) const { return lhs < rhs; }
		bool operator()(const std::string& lhs, const std::string& rhs) const { return lhs < rhs; }
		bool operator()(const std::string& lhs, const char* rhs) const { return lhs < rhs; }
		bool operator()(const std::string_view& lhs, const std::string& rhs) const { return lhs < rhs; }
		bool operator()(const char* lhs, const std::string& rhs) const { return lhs < rhs; }
	};
} // namespace detail

template <typename ValueType>
using UnorderedStringMap =
	std::unordered_map<std::string, ValueType, detail::transparent_string_hash, detail::transparent_string_equal>;

// Ordered by key, which is the iteration order every serializer in this project relies on.
template <typename ValueType>
using StringMap = std::map<std::string, ValueType, detail::transparent_string_less>;
