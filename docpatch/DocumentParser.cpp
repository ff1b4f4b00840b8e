// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/DocumentParser.h"
#include "docpatch/JSON/JSONDocument.h"
#include "docpatch/JSONC/JSONCDocument.h"
#include "docpatch/TOML/TOMLDocument.h"
#include "docpatch/YAML/YAMLDocument.h"

#include "common/Assertions.h"
#include "common/StringUtil.h"

#include <array>
#include <cctype>

DocumentParser::DocumentParser(DocumentFormat format, ParseFunction parse, bool can_marshal)
	: m_format(format)
	, m_parse(parse)
	, m_can_marshal(can_marshal)
{
}

std::unique_ptr<Document> DocumentParser::Parse(std::string_view data, Error* error) const
{
	return m_parse(data, error);
}

std::optional<std::string> DocumentParser::MarshalTestData(const Value::Object& data, Error* error) const
{
	const std::unique_ptr<Document> document = Parse({}, error);
	if (!document)
		return std::nullopt;

	return document->MarshalTestData(data, error);
}

const DocumentParser& DocumentParser::GetBuiltin(DocumentFormat format)
{
	// Order must match DocumentFormat.
	static const std::array<DocumentParser, static_cast<size_t>(DocumentFormat::Count)> s_parsers = {{
		{DocumentFormat::YAML, [](std::string_view data, Error* error) -> std::unique_ptr<Document> {
			 return YAMLDocument::Parse(data, error);
		 }},
		{DocumentFormat::TOML, [](std::string_view data, Error* error) -> std::unique_ptr<Document> {
			 return TOMLDocument::Parse(data, error);
		 }},
		{DocumentFormat::JSONC, [](std::string_view data, Error* error) -> std::unique_ptr<Document> {
			 return JSONCDocument::Parse(data, error);
		 }},
		{DocumentFormat::JSON, [](std::string_view data, Error* error) -> std::unique_ptr<Document> {
			 return JSONDocument::Parse(data, error);
		 }},
	}};

	pxAssert(format < DocumentFormat::Count);
	return s_parsers[static_cast<size_t>(format)];
}

const DocumentParser* DocumentParser::GetBuiltin(std::string_view format_name)
{
	const std::optional<DocumentFormat> format = ParseDocumentFormatName(format_name);
	return format.has_value() ? &GetBuiltin(format.value()) : nullptr;
}

const DocumentParser* DocumentParser::GetBuiltinForPath(std::string_view path)
{
	const size_t pos = path.rfind('.');
	if (pos == std::string_view::npos)
		return nullptr;

	std::string extension(path.substr(pos + 1));
	for (char& ch : extension)
		ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

	if (extension == "yml")
		return &GetBuiltin(DocumentFormat::YAML);

	return GetBuiltin(extension);
}
