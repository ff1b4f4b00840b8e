// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/Document.h"

#include <memory>

class TOMLTextIndex;

/// TOML document edited as text. Each write re-indexes the buffer and splices new value text
/// into the original bytes, so comments, ordering and untouched values are kept byte for byte.
class TOMLDocument final : public Document
{
public:
	TOMLDocument();
	explicit TOMLDocument(std::string data);
	~TOMLDocument() override;

	/// Validates the bytes and keeps a copy for the path-oriented methods below.
	static std::unique_ptr<TOMLDocument> Parse(std::string_view data, Error* error);

	DocumentFormat GetFormat() const override;
	std::optional<Value::Object> Get(std::string_view data, Error* error) const override;
	std::optional<std::string> Apply(std::string_view data, const PatchSet& patches, Error* error) const override;
	std::optional<std::string> MarshalTestData(const Value::Object& data, Error* error) const override;

	std::optional<Value> Lookup(std::string_view path, Error* error) const;

	/// Replaces or inserts a value. Missing tables are appended as new [headers].
	bool Set(std::string_view path, const Value& value, Error* error);

	/// Removes a key, an array element or a whole table. Missing paths are not an error.
	bool Delete(std::string_view path, Error* error);

	__fi const std::string& Marshal() const { return m_data; }

private:
	static bool SetKeys(std::string& data, const JsonPointer::Path& keys, const Value& value, Error* error);
	static bool DeleteKeys(std::string& data, const JsonPointer::Path& keys, Error* error);
	static bool SetLeaf(std::string& data, const TOMLTextIndex& index, const JsonPointer::Path& keys, const Value& value,
		Error* error);
	static bool InsertLeaf(std::string& data, const TOMLTextIndex& index, const JsonPointer::Path& keys,
		std::string_view value_text, Error* error);
	static void RemoveTable(std::string& data, const TOMLTextIndex& index, const JsonPointer::Path& keys);

	std::string m_data;
};
