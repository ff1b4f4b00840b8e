// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "DocumentTester.h"
#include "TestUtil.h"

void DocumentTester::SetUp()
{
	m_parser = &DocumentParser::GetBuiltin(GetParam());

	Error error;
	m_document = m_parser->Parse({}, &error);
	ASSERT_TRUE(m_document) << error.GetDescription();
	ASSERT_EQ(m_document->GetFormat(), GetParam());
}

bool DocumentTester::Supports(const Value::Object& data) const
{
	Error error;
	if (m_parser->MarshalTestData(data, &error).has_value())
		return true;

	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure) << error.GetDescription();
	return false;
}

bool DocumentTester::Set(std::string_view path, const Value& value)
{
	Error error;
	std::optional<std::string> data = m_document->SetValue(m_data, path, value, &error);
	EXPECT_TRUE(data.has_value()) << "set " << path << ": " << error.GetDescription();
	if (!data.has_value())
		return false;

	m_data = std::move(data.value());
	return true;
}

bool DocumentTester::Delete(std::string_view path)
{
	Error error;
	std::optional<std::string> data = m_document->DeleteValue(m_data, path, &error);
	EXPECT_TRUE(data.has_value()) << "delete " << path << ": " << error.GetDescription();
	if (!data.has_value())
		return false;

	m_data = std::move(data.value());
	return true;
}

std::optional<Value> DocumentTester::Get(std::string_view path) const
{
	return m_document->GetValue(m_data, path, nullptr);
}

std::optional<Value::Object> DocumentTester::GetRoot() const
{
	Error error;
	std::optional<Value::Object> root = m_document->Get(m_data, &error);
	EXPECT_TRUE(root.has_value()) << error.GetDescription();
	return root;
}

TEST_P(DocumentTester, Identity)
{
	EXPECT_STREQ(m_parser->GetFormatName(), m_document->GetFormatName());
	EXPECT_TRUE(m_parser->CanMarshal());
}

TEST_P(DocumentTester, GetRoot)
{
	EXPECT_EQ(GetRoot(), Value::Object());
	EXPECT_EQ(Get(""), Value(Value::Object()));

	ASSERT_TRUE(Set("/key", Value("value")));
	EXPECT_EQ(GetRoot(), MakeObject({{"key", "value"}}));
}

TEST_P(DocumentTester, SetAndGet)
{
	const std::pair<const char*, Value> values[] = {
		{"/string", Value("hello")},
		{"/int", Value(42)},
		{"/float", Value(3.14)},
		{"/bool", Value(true)},
		{"/unicode", Value("h\xc3\xa9llo \xe2\x9c\x93")},
	};

	for (const auto& [path, value] : values)
	{
		ASSERT_TRUE(Set(path, value));
		EXPECT_EQ(Get(path), value) << path;
	}

	// Earlier values are still there.
	for (const auto& [path, value] : values)
		EXPECT_EQ(Get(path), value) << path;

	ASSERT_TRUE(Set("/int", Value(7)));
	EXPECT_EQ(Get("/int"), Value(7));
}

TEST_P(DocumentTester, Delete)
{
	ASSERT_TRUE(Set("/to_delete", Value("value")));
	ASSERT_TRUE(Set("/kept", Value(1)));
	EXPECT_TRUE(Get("/to_delete").has_value());

	ASSERT_TRUE(Delete("/to_delete"));
	EXPECT_FALSE(Get("/to_delete").has_value());
	EXPECT_EQ(Get("/kept"), Value(1));

	// Missing paths are not an error.
	EXPECT_TRUE(Delete("/nonexistent"));
	EXPECT_TRUE(Delete("/nonexistent/deeper"));
}

TEST_P(DocumentTester, NestedPaths)
{
	ASSERT_TRUE(Set("/a/b/c", Value("deep")));
	EXPECT_EQ(Get("/a/b/c"), Value("deep"));
	EXPECT_EQ(Get("/a/b"), Value(MakeObject({{"c", "deep"}})));
	EXPECT_EQ(GetRoot(), MakeObject({{"a", MakeObject({{"b", MakeObject({{"c", "deep"}})}})}}));

	ASSERT_TRUE(Set("/a/x", Value(1)));
	EXPECT_EQ(Get("/a/b/c"), Value("deep"));
	EXPECT_EQ(Get("/a/x"), Value(1));
}

TEST_P(DocumentTester, SpecialValues)
{
	const std::pair<const char*, Value> values[] = {
		{"/empty_string", Value("")},
		{"/zero_int", Value(0)},
		{"/false_bool", Value(false)},
		{"/null_value", Value()},
	};

	Value::Object expected;
	for (const auto& [path, value] : values)
		expected.emplace(path + 1, value);

	if (!Supports(expected))
		GTEST_SKIP() << m_parser->GetFormatName() << " cannot hold all special values";

	for (const auto& [path, value] : values)
		ASSERT_TRUE(Set(path, value));

	for (const auto& [path, value] : values)
		EXPECT_EQ(Get(path), value) << path;

	EXPECT_FALSE(Get("/nonexistent").has_value());
	EXPECT_EQ(GetRoot(), expected);
}

TEST_P(DocumentTester, SpecialValuesWithoutNull)
{
	ASSERT_TRUE(Set("/empty_string", Value("")));
	ASSERT_TRUE(Set("/zero_int", Value(0)));
	ASSERT_TRUE(Set("/false_bool", Value(false)));

	EXPECT_EQ(GetRoot(), MakeObject({{"empty_string", ""}, {"zero_int", 0}, {"false_bool", false}}));
}

TEST_P(DocumentTester, ArrayPaths)
{
	const Value items(Value::Array{Value("a"), Value("b"), Value("c")});
	if (!Supports(MakeObject({{"items", items}})))
		GTEST_SKIP() << m_parser->GetFormatName() << " cannot hold arrays";

	ASSERT_TRUE(Set("/items", items));
	EXPECT_EQ(Get("/items"), items);
	EXPECT_EQ(Get("/items/0"), Value("a"));
	EXPECT_EQ(Get("/items/2"), Value("c"));
	EXPECT_FALSE(Get("/items/3").has_value());
	EXPECT_EQ(GetRoot(), MakeObject({{"items", items}}));
}

TEST_P(DocumentTester, MissingPath)
{
	ASSERT_TRUE(Set("/a", Value(1)));

	Error error;
	EXPECT_FALSE(m_document->GetValue(m_data, "/b/c", &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);
	EXPECT_EQ(error.GetPath(), "/b/c");

	EXPECT_FALSE(m_document->GetValue(m_data, "b", &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);

	EXPECT_FALSE(m_document->SetValue(m_data, "", Value(1), &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);
}

TEST_P(DocumentTester, EmptyPatchSetRoundTrip)
{
	const Value::Object data = MakeObject({
		{"name", "demo"},
		{"server", MakeObject({{"host", "localhost"}, {"port", 8080}, {"tls", false}})},
		{"ratio", 0.5},
		{"tags", Value::Array{Value("x"), Value("y")}},
	});

	Error error;
	const std::optional<std::string> bytes = m_parser->MarshalTestData(data, &error);
	ASSERT_TRUE(bytes.has_value()) << error.GetDescription();
	EXPECT_EQ(m_document->Get(bytes.value(), nullptr), data);

	const std::optional<std::string> normalized = m_document->Apply(bytes.value(), {}, &error);
	ASSERT_TRUE(normalized.has_value()) << error.GetDescription();
	EXPECT_EQ(m_document->Get(normalized.value(), nullptr), data);
}

TEST_P(DocumentTester, AddIsIdempotent)
{
	const PatchSet patches = {
		Patch::Add("/server/port", 9000),
		Patch::Replace("/name", "x"),
		Patch::Add("/list", Value::Array{Value(1), Value(2)}),
	};

	Error error;
	const std::optional<std::string> once = m_document->Apply(m_data, patches, &error);
	ASSERT_TRUE(once.has_value()) << error.GetDescription();
	const std::optional<std::string> twice = m_document->Apply(once.value(), patches, &error);
	ASSERT_TRUE(twice.has_value()) << error.GetDescription();

	const std::optional<Value::Object> first = m_document->Get(once.value(), nullptr);
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(m_document->Get(twice.value(), nullptr), first);
	EXPECT_EQ(first->at("server"), Value(MakeObject({{"port", 9000}})));
}

INSTANTIATE_TEST_SUITE_P(BuiltinFormats, DocumentTester,
	::testing::Values(DocumentFormat::YAML, DocumentFormat::TOML, DocumentFormat::JSONC, DocumentFormat::JSON),
	[](const ::testing::TestParamInfo<DocumentFormat>& info) { return std::string(GetDocumentFormatName(info.param)); });
