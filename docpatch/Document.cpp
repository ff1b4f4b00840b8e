// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/Document.h"
#include "docpatch/JsonPointer.h"

#include "fmt/format.h"

const char* GetDocumentFormatName(DocumentFormat format)
{
	static constexpr const char* s_format_names[] = {
		"yaml",
		"toml",
		"jsonc",
		"json",
	};

	return (format < DocumentFormat::Count) ? s_format_names[static_cast<u32>(format)] : "";
}

std::optional<DocumentFormat> ParseDocumentFormatName(std::string_view name)
{
	for (u32 i = 0; i < static_cast<u32>(DocumentFormat::Count); i++)
	{
		if (name == GetDocumentFormatName(static_cast<DocumentFormat>(i)))
			return static_cast<DocumentFormat>(i);
	}

	return std::nullopt;
}

Document::~Document() = default;

std::optional<JsonPointer::Path> Document::ParseWritePath(std::string_view path, const char* action, Error* error)
{
	std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return std::nullopt;

	if (keys->empty())
	{
		Error::SetInvalidPath(error, path, fmt::format("cannot {} root document", action));
		return std::nullopt;
	}

	return keys;
}

std::optional<Value> Document::GetValue(std::string_view data, std::string_view path, Error* error) const
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return std::nullopt;

	std::optional<Value::Object> root = Get(data, error);
	if (!root.has_value())
		return std::nullopt;

	if (keys->empty())
		return Value(std::move(root.value()));

	const Value* found = JsonPointer::GetByKeys(root.value(), keys.value());
	if (!found)
	{
		Error::SetPathNotFound(error, path);
		return std::nullopt;
	}

	return *found;
}

std::optional<std::string> Document::SetValue(std::string_view data, std::string_view path, Value value, Error* error) const
{
	if (!ParseWritePath(path, "set", error).has_value())
		return std::nullopt;

	PatchSet patches;
	patches.Add(std::string(path), std::move(value));
	return Apply(data, patches, error);
}

std::optional<std::string> Document::DeleteValue(std::string_view data, std::string_view path, Error* error) const
{
	if (!ParseWritePath(path, "delete", error).has_value())
		return std::nullopt;

	PatchSet patches;
	patches.Remove(std::string(path));
	return Apply(data, patches, error);
}
