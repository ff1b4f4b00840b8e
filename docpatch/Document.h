// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include "docpatch/JsonPointer.h"
#include "docpatch/Patch.h"
#include "docpatch/Value.h"

#include <optional>
#include <string>
#include <string_view>

enum class DocumentFormat : u8
{
	YAML,
	TOML,
	JSONC,
	JSON,
	Count
};

/// Format identity tokens: "yaml", "toml", "jsonc", "json".
const char* GetDocumentFormatName(DocumentFormat format);
std::optional<DocumentFormat> ParseDocumentFormatName(std::string_view name);

/// Format handler for a configuration document. Implementations keep no state between calls on
/// this interface: bytes go in, a canonical object or new bytes come out.
class Document
{
public:
	virtual ~Document();

	virtual DocumentFormat GetFormat() const = 0;

	/// Decodes the bytes into a canonical object. Empty or blank input is an empty object.
	virtual std::optional<Value::Object> Get(std::string_view data, Error* error) const = 0;

	/// Applies the batch to the bytes and returns the new bytes, preserving as much of the
	/// authored layout as the format allows.
	virtual std::optional<std::string> Apply(std::string_view data, const PatchSet& patches, Error* error) const = 0;

	/// Produces bytes which decode to the given object. Fails with an unsupported structure error
	/// if the format cannot represent the data.
	virtual std::optional<std::string> MarshalTestData(const Value::Object& data, Error* error) const = 0;

	__fi const char* GetFormatName() const { return GetDocumentFormatName(GetFormat()); }

	/// Reads the value at a pointer. The empty pointer returns the whole document.
	std::optional<Value> GetValue(std::string_view data, std::string_view path, Error* error) const;

	/// Single-patch wrappers around Apply().
	std::optional<std::string> SetValue(std::string_view data, std::string_view path, Value value, Error* error) const;
	std::optional<std::string> DeleteValue(std::string_view data, std::string_view path, Error* error) const;

protected:
	/// Parses a pointer for a write, rejecting the root.
	static std::optional<JsonPointer::Path> ParseWritePath(std::string_view path, const char* action, Error* error);
};
