// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include "docpatch/JsonPointer.h"
#include "docpatch/Value.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// toml++ based conversion between TOML text and canonical values.
namespace TOMLCodec
{
	/// Decodes a document. Blank input is an empty object, dates and times decode to their text.
	std::optional<Value::Object> Decode(std::string_view data, Error* error);

	/// Checks that the text is well-formed TOML without converting it.
	bool Validate(std::string_view data, Error* error);

	/// Encodes a whole document. The data must not contain nulls.
	std::string Encode(const Value::Object& data);

	/// Single-line TOML text for a value, e.g. "\"text\"", "[ 1, 2 ]" or "{ a = 1 }".
	std::string FormatValue(const Value& value);

	/// Sets the value at keys, which lie below the key-value pair owner, on the parsed document.
	/// Sibling nodes keep their TOML types, dates and times included. Returns the new single-line
	/// text of owner's value. Missing containers are created, and array elements can only be
	/// appended at the end.
	std::optional<std::string> SetInValue(std::string_view data, const JsonPointer::Path& owner,
		const JsonPointer::Path& keys, const Value& value, Error* error);

	/// Removes the value at keys, which lie below owner. Returns the new text of owner's value,
	/// or an empty string if there was nothing to remove.
	std::optional<std::string> DeleteInValue(std::string_view data, const JsonPointer::Path& owner,
		const JsonPointer::Path& keys, Error* error);

	/// A key as written on the left of '=', quoted unless it is a bare key.
	std::string FormatKey(std::string_view key);

	/// Dotted form of a table path, e.g. server."my key".port.
	std::string FormatDottedKey(const std::vector<std::string>& keys);

	/// Pointer to the first null inside the value, relative to base.
	std::optional<std::string> FindNull(const Value& value, std::string_view base);
	std::optional<std::string> FindNull(const Value::Object& data, std::string_view base);
} // namespace TOMLCodec
