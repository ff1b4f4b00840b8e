// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/Document.h"

#include <memory>
#include <optional>
#include <string_view>

/// Binds a format to the function which builds its document handler.
class DocumentParser
{
public:
	using ParseFunction = std::unique_ptr<Document> (*)(std::string_view data, Error* error);

	DocumentParser(DocumentFormat format, ParseFunction parse, bool can_marshal = true);

	__fi DocumentFormat GetFormat() const { return m_format; }
	__fi const char* GetFormatName() const { return GetDocumentFormatName(m_format); }

	/// Whether documents of this format keep comments through an Apply().
	__fi bool CanMarshal() const { return m_can_marshal; }

	std::unique_ptr<Document> Parse(std::string_view data, Error* error) const;

	/// Encodes test data with a handler created from empty bytes.
	std::optional<std::string> MarshalTestData(const Value::Object& data, Error* error) const;

	/// Parser for one of the built-in formats.
	static const DocumentParser& GetBuiltin(DocumentFormat format);
	static const DocumentParser* GetBuiltin(std::string_view format_name);

	/// Picks a built-in parser from a file extension (.yaml/.yml, .toml, .jsonc, .json).
	static const DocumentParser* GetBuiltinForPath(std::string_view path);

private:
	DocumentFormat m_format;
	ParseFunction m_parse;
	bool m_can_marshal;
};
