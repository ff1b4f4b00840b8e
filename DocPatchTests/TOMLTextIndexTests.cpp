// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/TOML/TOMLTextIndex.h"

#include <gtest/gtest.h>

static constexpr std::string_view SAMPLE = "# comment\n"
										   "title = \"x\"   # trailing\n"
										   "\n"
										   "[server]\n"
										   "host = \"localhost\"\n"
										   "port = 8080\n"
										   "\n"
										   "[server.tls]\n"
										   "enabled = true\n"
										   "\n"
										   "[[products]]\n"
										   "name = \"a\"\n";

static std::string_view ValueText(std::string_view data, const TOMLKeyValue& kv)
{
	return data.substr(kv.value_start, kv.value_end - kv.value_start);
}

TEST(TOMLTextIndex, Sections)
{
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(SAMPLE, nullptr);
	ASSERT_TRUE(index.has_value());

	const std::vector<TOMLSection>& sections = index->GetSections();
	ASSERT_EQ(sections.size(), 3u);
	EXPECT_EQ(sections[0].path, std::vector<std::string>({"server"}));
	EXPECT_EQ(sections[1].path, std::vector<std::string>({"server", "tls"}));
	EXPECT_EQ(sections[2].path, std::vector<std::string>({"products"}));
	EXPECT_FALSE(sections[0].array_of_tables);
	EXPECT_TRUE(sections[2].array_of_tables);

	EXPECT_EQ(SAMPLE.substr(sections[0].header_start, sections[0].header_end - sections[0].header_start), "[server]\n");
	EXPECT_EQ(sections[0].end, sections[1].header_start);
	EXPECT_EQ(sections[2].end, SAMPLE.size());
	EXPECT_EQ(SAMPLE.substr(sections[0].content_end, 1), "\n");
	EXPECT_EQ(SAMPLE.substr(sections[0].content_end - 12, 12), "port = 8080\n");
}

TEST(TOMLTextIndex, KeyValues)
{
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(SAMPLE, nullptr);
	ASSERT_TRUE(index.has_value());

	const TOMLKeyValue* title = index->FindKeyValue({"title"});
	ASSERT_NE(title, nullptr);
	EXPECT_EQ(ValueText(SAMPLE, *title), "\"x\"");
	EXPECT_EQ(title->section, -1);
	EXPECT_EQ(SAMPLE.substr(title->line_start, title->line_end - title->line_start), "title = \"x\"   # trailing\n");

	const TOMLKeyValue* port = index->FindKeyValue({"server", "port"});
	ASSERT_NE(port, nullptr);
	EXPECT_EQ(ValueText(SAMPLE, *port), "8080");
	EXPECT_EQ(port->section, 0);
	EXPECT_EQ(port->key_segments, 1u);

	const TOMLKeyValue* enabled = index->FindKeyValue({"server", "tls", "enabled"});
	ASSERT_NE(enabled, nullptr);
	EXPECT_EQ(ValueText(SAMPLE, *enabled), "true");

	EXPECT_EQ(index->FindKeyValue({"server", "missing"}), nullptr);
	EXPECT_NE(index->FindArrayOfTables({"products", "0", "name"}), nullptr);
	EXPECT_EQ(index->FindArrayOfTables({"server", "host"}), nullptr);
}

TEST(TOMLTextIndex, ValueSpans)
{
	const std::string_view data = "a = [1, [2, 3], \"]\"] # c\n"
								  "b = { x = 1, y = \"}\" }\n"
								  "c = \"\"\"\nmulti\nline\"\"\"\n"
								  "d = '''lit'''\n"
								  "e = 1979-05-27 07:32:00Z # when\n"
								  "\"quoted key\".'lit' = 'v'\n";

	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(data, nullptr);
	ASSERT_TRUE(index.has_value());
	EXPECT_EQ(ValueText(data, *index->FindKeyValue({"a"})), "[1, [2, 3], \"]\"]");
	EXPECT_EQ(ValueText(data, *index->FindKeyValue({"b"})), "{ x = 1, y = \"}\" }");
	EXPECT_EQ(ValueText(data, *index->FindKeyValue({"c"})), "\"\"\"\nmulti\nline\"\"\"");
	EXPECT_EQ(ValueText(data, *index->FindKeyValue({"d"})), "'''lit'''");
	EXPECT_EQ(ValueText(data, *index->FindKeyValue({"e"})), "1979-05-27 07:32:00Z");

	const TOMLKeyValue* dotted = index->FindKeyValue({"quoted key", "lit"});
	ASSERT_NE(dotted, nullptr);
	EXPECT_EQ(dotted->key_segments, 2u);
	EXPECT_EQ(ValueText(data, *dotted), "'v'");
}

TEST(TOMLTextIndex, KeyEscapes)
{
	const std::string_view data = "\"a\\u00e9\\tb\" = 1\n";
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(data, nullptr);
	ASSERT_TRUE(index.has_value());
	EXPECT_NE(index->FindKeyValue({"a\xc3\xa9\tb"}), nullptr);
}

TEST(TOMLTextIndex, PrefixLookup)
{
	const std::string_view data = "server = { host = \"a\" }\n";
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(data, nullptr);
	ASSERT_TRUE(index.has_value());

	const TOMLKeyValue* owner = index->FindKeyValuePrefix({"server", "host"});
	ASSERT_NE(owner, nullptr);
	EXPECT_EQ(owner->path, std::vector<std::string>({"server"}));
	EXPECT_EQ(index->FindKeyValuePrefix({"server"}), nullptr);
}

TEST(TOMLTextIndex, HasTable)
{
	const std::string_view data = "a.b = 1\n[x.y]\nz = 1\n";
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(data, nullptr);
	ASSERT_TRUE(index.has_value());
	EXPECT_TRUE(index->HasTable({"a"}));
	EXPECT_TRUE(index->HasTable({"x"}));
	EXPECT_TRUE(index->HasTable({"x", "y"}));
	EXPECT_FALSE(index->HasTable({"a", "b"}));
	EXPECT_FALSE(index->HasTable({"q"}));
}

TEST(TOMLTextIndex, InsertionPoints)
{
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(SAMPLE, nullptr);
	ASSERT_TRUE(index.has_value());

	const TOMLTextIndex::InsertionPoint root = index->FindInsertionPoint({});
	EXPECT_EQ(root.offset, index->FindKeyValue({"title"})->line_end);
	EXPECT_FALSE(root.needs_header);

	const TOMLTextIndex::InsertionPoint server = index->FindInsertionPoint({"server"});
	EXPECT_EQ(server.offset, index->FindKeyValue({"server", "port"})->line_end);
	EXPECT_TRUE(server.key_prefix.empty());

	const TOMLTextIndex::InsertionPoint missing = index->FindInsertionPoint({"db"});
	EXPECT_TRUE(missing.needs_header);
	EXPECT_EQ(missing.offset, SAMPLE.size());
}

TEST(TOMLTextIndex, InsertionPointRootWithoutKeys)
{
	const std::string_view data = "# header comment\n[server]\nhost = \"a\"\n";
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(data, nullptr);
	ASSERT_TRUE(index.has_value());
	EXPECT_EQ(index->FindInsertionPoint({}).offset, data.find('['));

	const std::optional<TOMLTextIndex> empty = TOMLTextIndex::Build("", nullptr);
	ASSERT_TRUE(empty.has_value());
	EXPECT_EQ(empty->FindInsertionPoint({}).offset, 0u);
	EXPECT_TRUE(empty->FindInsertionPoint({"a"}).needs_header);
}

TEST(TOMLTextIndex, InsertionPointDottedTable)
{
	const std::string_view data = "[server]\ntls.enabled = true\nname = \"x\"\n";
	const std::optional<TOMLTextIndex> index = TOMLTextIndex::Build(data, nullptr);
	ASSERT_TRUE(index.has_value());

	const TOMLTextIndex::InsertionPoint point = index->FindInsertionPoint({"server", "tls"});
	EXPECT_FALSE(point.needs_header);
	EXPECT_EQ(point.key_prefix, "tls.");
	EXPECT_EQ(point.offset, data.find("name"));
}

TEST(TOMLTextIndex, ScanError)
{
	Error error;
	EXPECT_FALSE(TOMLTextIndex::Build("[unterminated\n", &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::Parse);

	EXPECT_FALSE(TOMLTextIndex::Build("key value\n", &error).has_value());
	EXPECT_NE(error.GetDescription().find("line 1"), std::string::npos);
}
