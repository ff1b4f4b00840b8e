// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include "docpatch/Value.h"

#include <optional>
#include <string>
#include <string_view>

/// RapidJSON based conversion between JSON text and canonical values.
namespace JSONCodec
{
	enum class Dialect : u8
	{
		Strict,

		/// Accepts // and /* */ comments and trailing commas.
		Relaxed,
	};

	/// Decodes a single JSON value. Integers that fit in 64 bits stay integers.
	std::optional<Value> Decode(std::string_view data, Dialect dialect, Error* error);

	/// Decodes a document whose root must be an object. Blank input is an empty object.
	/// format_name is used to prefix errors.
	std::optional<Value::Object> DecodeObject(std::string_view data, Dialect dialect, const char* format_name, Error* error);

	/// Encodes a value, either on one line or indented by two spaces per level.
	/// Non-finite floats cannot be encoded.
	std::optional<std::string> Encode(const Value& value, bool pretty, Error* error);
} // namespace JSONCodec
