// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/DocumentParser.h"
#include "docpatch/JSON/JSONDocument.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

TEST(DocumentParser, FormatNames)
{
	EXPECT_STREQ(GetDocumentFormatName(DocumentFormat::YAML), "yaml");
	EXPECT_STREQ(GetDocumentFormatName(DocumentFormat::TOML), "toml");
	EXPECT_STREQ(GetDocumentFormatName(DocumentFormat::JSONC), "jsonc");
	EXPECT_STREQ(GetDocumentFormatName(DocumentFormat::JSON), "json");

	EXPECT_EQ(ParseDocumentFormatName("jsonc"), DocumentFormat::JSONC);
	EXPECT_FALSE(ParseDocumentFormatName("JSON").has_value());
	EXPECT_FALSE(ParseDocumentFormatName("ini").has_value());
}

TEST(DocumentParser, Builtins)
{
	for (u32 i = 0; i < static_cast<u32>(DocumentFormat::Count); i++)
	{
		const DocumentFormat format = static_cast<DocumentFormat>(i);
		const DocumentParser& parser = DocumentParser::GetBuiltin(format);
		EXPECT_EQ(parser.GetFormat(), format);
		EXPECT_TRUE(parser.CanMarshal());
		EXPECT_EQ(DocumentParser::GetBuiltin(parser.GetFormatName()), &parser);

		const std::unique_ptr<Document> document = parser.Parse("", nullptr);
		ASSERT_TRUE(document) << parser.GetFormatName();
		EXPECT_EQ(document->GetFormat(), format);
	}

	EXPECT_EQ(DocumentParser::GetBuiltin("xml"), nullptr);
}

TEST(DocumentParser, BuiltinForPath)
{
	const auto format_of = [](std::string_view path) -> std::optional<DocumentFormat> {
		const DocumentParser* parser = DocumentParser::GetBuiltinForPath(path);
		return parser ? std::optional<DocumentFormat>(parser->GetFormat()) : std::nullopt;
	};

	EXPECT_EQ(format_of("config/app.yaml"), DocumentFormat::YAML);
	EXPECT_EQ(format_of("config/app.YML"), DocumentFormat::YAML);
	EXPECT_EQ(format_of("Cargo.toml"), DocumentFormat::TOML);
	EXPECT_EQ(format_of(".vscode/settings.jsonc"), DocumentFormat::JSONC);
	EXPECT_EQ(format_of("package.json"), DocumentFormat::JSON);
	EXPECT_FALSE(format_of("README").has_value());
	EXPECT_FALSE(format_of("notes.txt").has_value());
}

TEST(DocumentParser, ParseErrors)
{
	static constexpr std::pair<DocumentFormat, const char*> inputs[] = {
		{DocumentFormat::YAML, "a: [1, 2"},
		{DocumentFormat::TOML, "a = "},
		{DocumentFormat::JSONC, "{\"a\": }"},
		{DocumentFormat::JSON, "{\"a\": 1,}"},
	};

	for (const auto& [format, input] : inputs)
	{
		Error error;
		EXPECT_FALSE(DocumentParser::GetBuiltin(format).Parse(input, &error)) << input;
		EXPECT_EQ(error.GetType(), Error::Type::Parse) << input;
	}
}

TEST(DocumentParser, MarshalTestData)
{
	const Value::Object data = MakeObject({{"a", MakeObject({{"b", 1}})}, {"c", "x"}});
	for (u32 i = 0; i < static_cast<u32>(DocumentFormat::Count); i++)
	{
		const DocumentParser& parser = DocumentParser::GetBuiltin(static_cast<DocumentFormat>(i));
		const std::optional<std::string> bytes = parser.MarshalTestData(data, nullptr);
		ASSERT_TRUE(bytes.has_value()) << parser.GetFormatName();

		const std::unique_ptr<Document> document = parser.Parse(bytes.value(), nullptr);
		ASSERT_TRUE(document) << parser.GetFormatName();
		EXPECT_EQ(document->Get(bytes.value(), nullptr), data) << parser.GetFormatName();
	}

	Error error;
	EXPECT_FALSE(DocumentParser::GetBuiltin(DocumentFormat::TOML).MarshalTestData(MakeObject({{"n", Value()}}), &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
}

TEST(DocumentParser, CustomParser)
{
	const DocumentParser parser(
		DocumentFormat::JSON,
		[](std::string_view data, Error* error) -> std::unique_ptr<Document> { return JSONDocument::Parse(data, error); },
		false);

	EXPECT_FALSE(parser.CanMarshal());
	EXPECT_STREQ(parser.GetFormatName(), "json");
	EXPECT_EQ(parser.MarshalTestData(MakeObject({{"a", 1}}), nullptr), std::string("{\n  \"a\": 1\n}\n"));
}
