// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"
#include "common/StringUtil.h"

#include "docpatch/Value.h"

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

/// RFC 6901 JSON Pointer paths ("/server/port", "/items/0", "/a~1b" for the key "a/b").
namespace JsonPointer
{
	/// Unescaped path segments, the empty path addresses the whole document.
	using Path = std::vector<std::string>;

	/// Escapes a key for use as a pointer segment: '~' becomes "~0", then '/' becomes "~1".
	std::string Escape(std::string_view key);

	/// Reverses Escape(): "~1" becomes '/', then "~0" becomes '~'.
	std::string Unescape(std::string_view segment);

	/// Splits a pointer into unescaped segments. "" is the empty path, "/" is a single empty segment.
	/// Anything not starting with '/' is an invalid path.
	std::optional<Path> Parse(std::string_view pointer, Error* error = nullptr);

	/// Builds a pointer from already-unescaped segments.
	std::string Build(const Path& segments);

	/// Same as Build(), but for a sub-range of a path.
	std::string BuildRange(Path::const_iterator begin, Path::const_iterator end);

	namespace detail
	{
		__fi static void AppendSegment(std::string& out, std::string_view segment)
		{
			out.push_back('/');
			out.append(Escape(segment));
		}

		template <typename T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, bool> = true>
		__fi static void AppendSegment(std::string& out, T index)
		{
			out.push_back('/');
			out.append(StringUtil::ToChars(index));
		}
	} // namespace detail

	/// Builds a pointer from any mix of keys and array indices, e.g. Build("items", 0, "name").
	template <typename... T>
	static inline std::string Build(const T&... segments)
	{
		std::string ret;
		(detail::AppendSegment(ret, segments), ...);
		return ret;
	}

	/// Concatenates two pointers, tolerating a missing or present leading '/' on either side.
	std::string Join(std::string_view base, std::string_view relative);

	/// A non-empty run of decimal digits, which addresses an array element.
	bool IsArrayIndex(std::string_view segment);
	std::optional<size_t> ParseArrayIndex(std::string_view segment);

	/// Path-addressed access to a plain canonical object. Objects are traversed by key and
	/// arrays by in-range index.
	const Value* GetPath(const Value::Object& root, std::string_view pointer);
	const Value* GetByKeys(const Value::Object& root, const Path& keys);

	struct SetResult
	{
		bool success = false;

		/// The final key did not exist before.
		bool created = false;

		/// The final key existed and its value was overwritten.
		bool replaced = false;
	};

	/// Sets a value, creating intermediate objects. Intermediate values which are not objects
	/// are replaced by a new object. The empty path cannot be set.
	SetResult SetPath(Value::Object& root, std::string_view pointer, Value value);
	SetResult SetByKeys(Value::Object& root, const Path& keys, Value value);

	/// Removes an object member. Returns true only if something was removed.
	bool DeletePath(Value::Object& root, std::string_view pointer);
	bool DeleteByKeys(Value::Object& root, const Path& keys);
} // namespace JsonPointer
