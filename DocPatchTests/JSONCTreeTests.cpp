// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JSONC/JSONCTree.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

static JSONCTree ParseOrFail(std::string_view data)
{
	Error error;
	std::optional<JSONCTree> tree = JSONCTree::Parse(data, &error);
	EXPECT_TRUE(tree.has_value()) << error.GetDescription();
	return tree.has_value() ? std::move(tree.value()) : JSONCTree();
}

TEST(JSONCTree, PackIsByteExact)
{
	static constexpr const char* inputs[] = {
		"{}",
		"  {  }  ",
		"// leading\n{\n  \"a\": 1, /* inline */\n  \"b\": [1,2,],\n  \"c\" : { \"d\" : null } // tail\n}\n// trailing\n",
		"{\"s\": \"esc \\\" \\u00e9 \\n\", \"n\": -1.5e+3, \"t\": true, \"f\": false}",
		"[\r\n\t1,\r\n\t[]\r\n]",
	};

	for (const char* input : inputs)
		EXPECT_EQ(ParseOrFail(input).Pack(), input);
}

TEST(JSONCTree, Decode)
{
	const JSONCTree tree = ParseOrFail("{\n  // c\n  \"a\": [1, 2,], /* x */\n  \"b\": {\"c\": \"d\",},\n}");
	EXPECT_EQ(tree.Decode(nullptr),
		Value(MakeObject({{"a", Value::Array{Value(1), Value(2)}}, {"b", MakeObject({{"c", "d"}})}})));
	EXPECT_EQ(tree.Find("/a/1", nullptr), Value(2));
	EXPECT_EQ(tree.Find("/b/c", nullptr), Value("d"));

	Error error;
	EXPECT_FALSE(tree.Find("/a/5", &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);
}

TEST(JSONCTree, ParseErrors)
{
	static constexpr const char* inputs[] = {
		"{",
		"{\"a\" 1}",
		"{\"a\": 1} x",
		"{\"a\": /* open",
		"{a: 1}",
		"[1 2]",
		"{\"a\": tru}",
		"{\"a\": 01}",
	};

	for (const char* input : inputs)
	{
		Error error;
		EXPECT_FALSE(JSONCTree::Parse(input, &error).has_value()) << input;
		EXPECT_EQ(error.GetType(), Error::Type::Parse) << input;
		EXPECT_NE(error.GetDescription().find("line 1"), std::string::npos) << input;
	}
}

TEST(JSONCTree, AddMemberFollowsIndentation)
{
	JSONCTree tree = ParseOrFail("{\n  // server settings\n  \"server\": {\n    \"host\": \"localhost\"\n  }\n}");
	ASSERT_TRUE(tree.Add("/server/port", Value(8080), nullptr));
	EXPECT_EQ(tree.Pack(), "{\n  // server settings\n  \"server\": {\n    \"host\": \"localhost\",\n    \"port\": 8080\n  }\n}");
}

TEST(JSONCTree, AddAfterLineComment)
{
	JSONCTree tree = ParseOrFail("{\n  \"a\": 1 // one\n}");
	ASSERT_TRUE(tree.Add("/b", Value(2), nullptr));
	EXPECT_EQ(tree.Pack(), "{\n  \"a\": 1, // one\n  \"b\": 2\n}");
	EXPECT_EQ(tree.Decode(nullptr), Value(MakeObject({{"a", 1}, {"b", 2}})));
}

TEST(JSONCTree, AddWithTrailingComma)
{
	JSONCTree tree = ParseOrFail("{\"a\": 1,}");
	ASSERT_TRUE(tree.Add("/b", Value(2), nullptr));
	EXPECT_EQ(tree.Pack(), "{\"a\": 1, \"b\": 2,}");
}

TEST(JSONCTree, AddToEmptyContainers)
{
	JSONCTree tree;
	EXPECT_EQ(tree.Pack(), "{}");
	ASSERT_TRUE(tree.Add("/a", Value(Value::Object()), nullptr));
	ASSERT_TRUE(tree.Add("/a/b", Value(Value::Array()), nullptr));
	ASSERT_TRUE(tree.Add("/a/b/-", Value("x"), nullptr));
	EXPECT_EQ(tree.Pack(), "{\"a\": {\"b\": [\"x\"]}}");
}

TEST(JSONCTree, AddArrayElements)
{
	JSONCTree tree = ParseOrFail("[1, 3]");
	ASSERT_TRUE(tree.Add("/1", Value(2), nullptr));
	ASSERT_TRUE(tree.Add("/-", Value(4), nullptr));
	ASSERT_TRUE(tree.Add("/4", Value(5), nullptr));
	EXPECT_EQ(tree.Pack(), "[1, 2, 3, 4, 5]");

	Error error;
	EXPECT_FALSE(tree.Add("/9", Value(0), &error));
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);
	EXPECT_EQ(error.GetDescription(), "invalid path \"/9\": array index out of range [0, 5]");
}

TEST(JSONCTree, AddReplacesExistingMember)
{
	JSONCTree tree = ParseOrFail("{\"a\": /* keep */ 1 // c\n}");
	ASSERT_TRUE(tree.Add("/a", Value("x"), nullptr));
	EXPECT_EQ(tree.Pack(), "{\"a\": /* keep */ \"x\" // c\n}");
}

TEST(JSONCTree, AddEscapesMemberNames)
{
	JSONCTree tree;
	ASSERT_TRUE(tree.Add("/a~1b \"q\"", Value(1), nullptr));
	EXPECT_EQ(tree.Pack(), "{\"a/b \\\"q\\\"\": 1}");
	EXPECT_EQ(tree.Find("/a~1b \"q\"", nullptr), Value(1));
}

TEST(JSONCTree, AddErrors)
{
	JSONCTree tree = ParseOrFail("{\"a\": 1}");
	Error error;

	EXPECT_FALSE(tree.Add("/x/y", Value(1), &error));
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);
	EXPECT_EQ(error.GetPath(), "/x");

	EXPECT_FALSE(tree.Add("/a/b", Value(1), &error));
	EXPECT_EQ(error.GetType(), Error::Type::TypeMismatch);

	EXPECT_FALSE(tree.Add("no-slash", Value(1), &error));
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);

	EXPECT_EQ(tree.Pack(), "{\"a\": 1}");
}

TEST(JSONCTree, ReplaceKeepsSurroundings)
{
	JSONCTree tree = ParseOrFail("{\n  \"a\": 1, // one\n  \"b\": [1, 2] /* two */\n}");
	ASSERT_TRUE(tree.Replace("/a", Value(MakeObject({{"x", true}})), nullptr));
	ASSERT_TRUE(tree.Replace("/b/0", Value("z"), nullptr));
	EXPECT_EQ(tree.Pack(), "{\n  \"a\": {\"x\":true}, // one\n  \"b\": [\"z\", 2] /* two */\n}");

	Error error;
	EXPECT_FALSE(tree.Replace("/missing", Value(1), &error));
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);
}

TEST(JSONCTree, ReplaceRoot)
{
	JSONCTree tree = ParseOrFail("// c\n{\"a\": 1}\n");
	ASSERT_TRUE(tree.Replace("", Value(MakeObject({{"b", 2}})), nullptr));
	EXPECT_EQ(tree.Pack(), "// c\n{\"b\":2}\n");
}

TEST(JSONCTree, RemoveMembers)
{
	JSONCTree tree = ParseOrFail("{\n  \"a\": 1,\n  \"b\": 2\n}");
	ASSERT_TRUE(tree.Remove("/b", nullptr));
	EXPECT_EQ(tree.Pack(), "{\n  \"a\": 1\n}");

	tree = ParseOrFail("{\n  \"a\": 1,\n  \"b\": 2\n}");
	ASSERT_TRUE(tree.Remove("/a", nullptr));
	EXPECT_EQ(tree.Pack(), "{\n  \"b\": 2\n}");

	ASSERT_TRUE(tree.Remove("/b", nullptr));
	EXPECT_EQ(tree.Pack(), "{\n}");
}

TEST(JSONCTree, RemoveArrayElements)
{
	JSONCTree tree = ParseOrFail("[1, 2, 3,]");
	ASSERT_TRUE(tree.Remove("/2", nullptr));
	ASSERT_TRUE(tree.Remove("/0", nullptr));
	EXPECT_EQ(tree.Pack(), "[ 2,]");
	ASSERT_TRUE(tree.Remove("/0", nullptr));
	EXPECT_EQ(tree.Pack(), "[]");
}

TEST(JSONCTree, RemoveErrors)
{
	JSONCTree tree = ParseOrFail("{\"a\": [1]}");
	Error error;

	EXPECT_FALSE(tree.Remove("", &error));
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);

	EXPECT_FALSE(tree.Remove("/a/1", &error));
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);

	EXPECT_FALSE(tree.Remove("/x/y", &error));
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);
	EXPECT_EQ(error.GetPath(), "/x/y");
}
