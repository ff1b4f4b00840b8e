// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/TOML/TOMLCodec.h"
#include "docpatch/TOML/TOMLDocument.h"

#include "TestUtil.h"

#include "fmt/format.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>

static std::string ApplyOrFail(std::string_view data, const PatchSet& patches)
{
	const TOMLDocument doc;
	Error error;
	const std::optional<std::string> out = doc.Apply(data, patches, &error);
	EXPECT_TRUE(out.has_value()) << error.GetDescription();
	return out.value_or(std::string());
}

TEST(TOMLDocument, GetEmptyInput)
{
	const TOMLDocument doc;
	const std::optional<Value::Object> data = doc.Get("", nullptr);
	ASSERT_TRUE(data.has_value());
	EXPECT_TRUE(data->empty());
}

TEST(TOMLDocument, GetTypes)
{
	const TOMLDocument doc;
	const std::optional<Value::Object> data = doc.Get("i = 42\n"
													  "f = 1.5\n"
													  "b = true\n"
													  "s = 'lit'\n"
													  "a = [1, \"x\"]\n"
													  "[t]\n"
													  "k = { n = 1 }\n",
		nullptr);
	ASSERT_TRUE(data.has_value());
	EXPECT_TRUE(data->at("i").IsInt());
	EXPECT_TRUE(data->at("f").IsFloat());
	EXPECT_EQ(data->at("b"), Value(true));
	EXPECT_EQ(data->at("s"), Value("lit"));
	EXPECT_EQ(data->at("a"), Value(Value::Array{Value(1), Value("x")}));
	EXPECT_EQ(data->at("t"), Value(MakeObject({{"k", MakeObject({{"n", 1}})}})));
}

TEST(TOMLDocument, GetDatesAsText)
{
	const TOMLDocument doc;
	const std::optional<Value::Object> data = doc.Get("odt = 1979-05-27T07:32:00Z\n"
													  "off = 1979-05-27T00:32:00-07:00\n"
													  "ld = 1979-05-27\n"
													  "lt = 07:32:00\n",
		nullptr);
	ASSERT_TRUE(data.has_value());
	EXPECT_EQ(data->at("odt"), Value("1979-05-27T07:32:00Z"));
	EXPECT_EQ(data->at("off"), Value("1979-05-27T00:32:00-07:00"));
	EXPECT_EQ(data->at("ld"), Value("1979-05-27"));
	EXPECT_EQ(data->at("lt"), Value("07:32:00"));
}

TEST(TOMLDocument, GetParseError)
{
	const TOMLDocument doc;
	Error error;
	EXPECT_FALSE(doc.Get("a = \n", &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::Parse);
	EXPECT_NE(error.GetDescription().find("TOML"), std::string::npos);
}

TEST(TOMLDocument, ReplaceKeepsSurroundingBytes)
{
	EXPECT_EQ(ApplyOrFail("[server]\nhost = \"localhost\"\nport = 8080\n", {Patch::Replace("/server/port", 9000)}),
		"[server]\nhost = \"localhost\"\nport = 9000\n");

	EXPECT_EQ(ApplyOrFail("# top\n\n[server]\nhost = \"a\"   # the host\nport = 1 # p\n", {Patch::Replace("/server/port", 2)}),
		"# top\n\n[server]\nhost = \"a\"   # the host\nport = 2 # p\n");
}

TEST(TOMLDocument, ReplaceChangesType)
{
	EXPECT_EQ(ApplyOrFail("a = 1\nb = 2\n", {Patch::Replace("/a", "text")}), "a = \"text\"\nb = 2\n");
	EXPECT_EQ(ApplyOrFail("a = 'x'\n", {Patch::Replace("/a", 2.5)}), "a = 2.5\n");
}

TEST(TOMLDocument, AddToExistingTable)
{
	EXPECT_EQ(ApplyOrFail("[server]\nhost = \"a\"\n\n[db]\nname = \"x\"\n", {Patch::Add("/server/port", 1)}),
		"[server]\nhost = \"a\"\nport = 1\n\n[db]\nname = \"x\"\n");
}

TEST(TOMLDocument, AddToRoot)
{
	EXPECT_EQ(ApplyOrFail("title = \"x\"\n\n[server]\nhost = \"a\"\n", {Patch::Add("/debug", true)}),
		"title = \"x\"\ndebug = true\n\n[server]\nhost = \"a\"\n");

	// Root keys must come before the first header.
	EXPECT_EQ(ApplyOrFail("[server]\nhost = \"a\"\n", {Patch::Add("/debug", true)}), "debug = true\n[server]\nhost = \"a\"\n");

	EXPECT_EQ(ApplyOrFail("a = 1", {Patch::Add("/b", 2)}), "a = 1\nb = 2\n");
}

TEST(TOMLDocument, AddCreatesTable)
{
	EXPECT_EQ(ApplyOrFail("a = 1\n", {Patch::Add("/server/port", 8080)}), "a = 1\n[server]\nport = 8080\n");
	EXPECT_EQ(ApplyOrFail("a = 1", {Patch::Add("/server/port", 8080)}), "a = 1\n[server]\nport = 8080\n");
	EXPECT_EQ(ApplyOrFail("", {Patch::Add("/x/y/z", "v")}), "[x.y]\nz = \"v\"\n");
	EXPECT_EQ(ApplyOrFail("", {Patch::Add("/my key/a.b", 1)}), "[\"my key\"]\n\"a.b\" = 1\n");
}

TEST(TOMLDocument, AddToBlankInput)
{
	EXPECT_EQ(ApplyOrFail("", {Patch::Add("/a", 1), Patch::Add("/b/c", "x")}), "a = 1\n[b]\nc = \"x\"\n");
}

TEST(TOMLDocument, AddToDottedKeyTable)
{
	EXPECT_EQ(ApplyOrFail("[server]\ntls.enabled = true\n", {Patch::Add("/server/tls/cert", "x")}),
		"[server]\ntls.enabled = true\ntls.cert = \"x\"\n");
}

TEST(TOMLDocument, InlineTable)
{
	const TOMLDocument doc;
	const std::string out = ApplyOrFail("server = { host = \"a\", port = 1 } # inline\nother = 2\n", {Patch::Replace("/server/port", 2)});

	EXPECT_EQ(doc.Get(out, nullptr), MakeObject({{"server", MakeObject({{"host", "a"}, {"port", 2}})}, {"other", 2}}));
	EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 2);
	EXPECT_EQ(out.rfind("server = {", 0), 0u);
	EXPECT_NE(out.find("} # inline\nother = 2\n"), std::string::npos);
}

TEST(TOMLDocument, ReplaceWholeTable)
{
	const TOMLDocument doc;
	const std::string out =
		ApplyOrFail("[server]\nhost = \"a\"\n[server.tls]\non = true\n[db]\nx = 1\n", {Patch::Replace("/server", MakeObject({{"port", 1}}))});

	EXPECT_EQ(doc.Get(out, nullptr), MakeObject({{"server", MakeObject({{"port", 1}})}, {"db", MakeObject({{"x", 1}})}}));
	EXPECT_EQ(out.find("host"), std::string::npos);
	EXPECT_NE(out.find("[db]\nx = 1\n"), std::string::npos);
}

TEST(TOMLDocument, RemoveKey)
{
	EXPECT_EQ(ApplyOrFail("[server]\nhost = \"a\" # c\nport = 1\n", {Patch::Remove("/server/host")}), "[server]\nport = 1\n");

	// Missing keys are not an error.
	EXPECT_EQ(ApplyOrFail("a = 1\n", {Patch::Remove("/nope"), Patch::Remove("/x/y")}), "a = 1\n");
}

TEST(TOMLDocument, RemoveTable)
{
	EXPECT_EQ(ApplyOrFail("a = 1\n[server]\nhost = \"a\"\n[server.tls]\non = true\n[db]\nx = 1\n", {Patch::Remove("/server")}),
		"a = 1\n[db]\nx = 1\n");

	EXPECT_EQ(ApplyOrFail("tls.on = true\ntls.cert = 'x'\nname = 1\n", {Patch::Remove("/tls")}), "name = 1\n");
}

TEST(TOMLDocument, RemoveFromInlineTable)
{
	const TOMLDocument doc;
	const std::string out = ApplyOrFail("server = { host = \"a\", port = 1 }\n", {Patch::Remove("/server/host")});
	EXPECT_EQ(doc.Get(out, nullptr), MakeObject({{"server", MakeObject({{"port", 1}})}}));
}

TEST(TOMLDocument, ArrayElements)
{
	const TOMLDocument doc;

	std::string out = ApplyOrFail("items = [\"a\", \"b\"] # list\n", {Patch::Add("/items/2", "c")});
	EXPECT_EQ(doc.GetValue(out, "/items", nullptr), Value(Value::Array{Value("a"), Value("b"), Value("c")}));
	EXPECT_NE(out.find("# list"), std::string::npos);

	out = ApplyOrFail("items = [\"a\", \"b\"]\n", {Patch::Replace("/items/0", "z")});
	EXPECT_EQ(doc.GetValue(out, "/items", nullptr), Value(Value::Array{Value("z"), Value("b")}));

	out = ApplyOrFail("items = [\"a\", \"b\"]\n", {Patch::Remove("/items/0")});
	EXPECT_EQ(doc.GetValue(out, "/items", nullptr), Value(Value::Array{Value("b")}));

	out = ApplyOrFail("", {Patch::Add("/list/0", "x")});
	EXPECT_EQ(doc.GetValue(out, "/list", nullptr), Value(Value::Array{Value("x")}));

	out = ApplyOrFail("[t]\npoints = [{ x = 1 }]\n", {Patch::Replace("/t/points/0/x", 5)});
	EXPECT_EQ(doc.GetValue(out, "/t/points/0/x", nullptr), Value(5));
}

TEST(TOMLDocument, LongArraysStayOnOneLine)
{
	const TOMLDocument doc;

	Value::Array hosts;
	for (int i = 0; i < 30; i++)
		hosts.emplace_back(fmt::format("element-{}", i));

	std::string out = ApplyOrFail("[server]\nport = 8080\n", {Patch::Replace("/server/hosts", hosts)});
	EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 3);
	Error error;
	const std::optional<Value> read = doc.GetValue(out, "/server/hosts", &error);
	ASSERT_TRUE(read.has_value()) << error.GetDescription();
	EXPECT_EQ(read.value(), Value(hosts));

	std::string items = "items = [";
	for (int i = 0; i < 20; i++)
		fmt::format_to(std::back_inserter(items), "{}\"item-{}\"", (i > 0) ? ", " : "", i);
	items.append("]\n");

	out = ApplyOrFail(items, {Patch::Add("/items/20", "x")});
	EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 1);
	EXPECT_EQ(doc.GetValue(out, "/items/20", nullptr), Value("x"));
	EXPECT_EQ(doc.GetValue(out, "/items/0", nullptr), Value("item-0"));
}

TEST(TOMLDocument, StructuralEditsKeepDates)
{
	const TOMLDocument doc;

	std::string out = ApplyOrFail("t = { when = 1979-05-27T07:32:00Z, n = 1 }\n", {Patch::Replace("/t/n", 2)});
	EXPECT_NE(out.find("when = 1979-05-27T07:32:00Z"), std::string::npos) << out;
	EXPECT_EQ(out.find('"'), std::string::npos) << out;
	EXPECT_EQ(doc.GetValue(out, "/t/n", nullptr), Value(2));

	out = ApplyOrFail("days = [1979-05-27, 1980-01-01]\n", {Patch::Add("/days/2", "x")});
	EXPECT_NE(out.find("1979-05-27, 1980-01-01, \"x\""), std::string::npos) << out;

	out = ApplyOrFail("days = [1979-05-27, 1980-01-01]\n", {Patch::Remove("/days/0")});
	EXPECT_EQ(out, "days = [ 1980-01-01 ]\n");

	out = ApplyOrFail("t = { when = 07:32:00, tags = [\"a\"] }\n", {Patch::Remove("/t/tags")});
	EXPECT_EQ(out, "t = { when = 07:32:00 }\n");
}

TEST(TOMLDocument, ArrayErrors)
{
	const TOMLDocument doc;
	Error error;

	EXPECT_FALSE(doc.Apply("items = [\"a\", \"b\"]\n", {Patch::Add("/items/5", "c")}, &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
	EXPECT_EQ(error.GetPath(), "/items/5");

	EXPECT_FALSE(doc.Apply("a = 1\n", {Patch::Add("/0", 1)}, &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);

	EXPECT_FALSE(doc.Apply("a = 1\n", {Patch::Add("/a/0", 1)}, &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::TypeMismatch);
	EXPECT_EQ(error.GetDescription(), "type mismatch at \"/a\": expected array, got integer");
}

TEST(TOMLDocument, ArrayOfTablesRejected)
{
	const TOMLDocument doc;
	Error error;
	EXPECT_FALSE(doc.Apply("[[products]]\nname = \"a\"\n", {Patch::Replace("/products/0/name", "b")}, &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
	EXPECT_EQ(error.GetPath(), "/products");

	EXPECT_FALSE(doc.Apply("[[products]]\nname = \"a\"\n", {Patch::Remove("/products")}, &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
}

TEST(TOMLDocument, NullsRejected)
{
	const TOMLDocument doc;
	Error error;

	EXPECT_FALSE(doc.Apply("a = 1\n", {Patch::Add("/b", MakeObject({{"c", Value::Array{Value(1), Value()}}}))}, &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
	EXPECT_EQ(error.GetPath(), "/b/c/1");

	EXPECT_FALSE(doc.MarshalTestData(MakeObject({{"x", MakeObject({{"a", Value()}})}}), &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
	EXPECT_EQ(error.GetPath(), "/x/a");

	// Removes carry no value and are never rejected.
	EXPECT_TRUE(doc.Apply("a = 1\n", {Patch::Remove("/a")}, nullptr).has_value());
}

TEST(TOMLDocument, SkipsInvalidPaths)
{
	EXPECT_EQ(ApplyOrFail("a = 1\n", {Patch::Add("", 1), Patch::Add("nope", 2), Patch::Replace("/a", 3)}), "a = 3\n");
}

TEST(TOMLDocument, EmptyPatchSetNormalizes)
{
	EXPECT_EQ(ApplyOrFail("b = 1 # c\na = 2\n", {}), "a = 2\nb = 1\n");
}

TEST(TOMLDocument, MarshalTestData)
{
	const TOMLDocument doc;
	const Value::Object data = MakeObject({{"name", "x"}, {"server", MakeObject({{"port", 1}, {"tags", Value::Array{Value("a")}}})}});

	const std::optional<std::string> out = doc.MarshalTestData(data, nullptr);
	ASSERT_TRUE(out.has_value());
	EXPECT_EQ(out->back(), '\n');
	EXPECT_EQ(doc.Get(out.value(), nullptr), data);
}

TEST(TOMLDocument, PathSurface)
{
	Error error;
	std::unique_ptr<TOMLDocument> doc = TOMLDocument::Parse("[server]\nport = 8080 # p\n", &error);
	ASSERT_TRUE(doc);

	EXPECT_EQ(doc->Lookup("/server/port", nullptr), Value(8080));
	EXPECT_FALSE(doc->Lookup("/server/host", &error).has_value());
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);

	ASSERT_TRUE(doc->Set("/server/port", Value(9000), nullptr));
	ASSERT_TRUE(doc->Set("/server/host", Value("h"), nullptr));
	EXPECT_EQ(doc->Marshal(), "[server]\nport = 9000 # p\nhost = \"h\"\n");

	// A failed edit leaves the buffer untouched.
	const std::string before = doc->Marshal();
	EXPECT_FALSE(doc->Set("/server/port/0", Value(1), &error));
	EXPECT_EQ(doc->Marshal(), before);
	EXPECT_FALSE(doc->Set("", Value(1), &error));
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);

	ASSERT_TRUE(doc->Delete("/server/port", nullptr));
	EXPECT_EQ(doc->Marshal(), "[server]\nhost = \"h\"\n");

	EXPECT_FALSE(TOMLDocument::Parse("= broken", &error));
	EXPECT_EQ(error.GetType(), Error::Type::Parse);
}

TEST(TOMLCodec, FormatKey)
{
	EXPECT_EQ(TOMLCodec::FormatKey("plain_key-1"), "plain_key-1");
	EXPECT_EQ(TOMLCodec::FormatKey("a.b"), "\"a.b\"");
	EXPECT_EQ(TOMLCodec::FormatKey("with space"), "\"with space\"");
	EXPECT_EQ(TOMLCodec::FormatDottedKey({"a", "b c"}), "a.\"b c\"");
}

TEST(TOMLCodec, FormatScalars)
{
	EXPECT_EQ(TOMLCodec::FormatValue(Value(1)), "1");
	EXPECT_EQ(TOMLCodec::FormatValue(Value(true)), "true");
	EXPECT_EQ(TOMLCodec::FormatValue(Value(1.5)), "1.5");
	EXPECT_EQ(TOMLCodec::FormatValue(Value("x\"y")), "\"x\\\"y\"");
}

TEST(TOMLCodec, FormatContainers)
{
	EXPECT_EQ(TOMLCodec::FormatValue(Value(Value::Array{Value(1), Value("a")})), "[ 1, \"a\" ]");
	EXPECT_EQ(TOMLCodec::FormatValue(Value(Value::Array())), "[]");
	EXPECT_EQ(TOMLCodec::FormatValue(Value(MakeObject({{"a", 1}, {"b c", Value::Array{Value(true)}}}))),
		"{ a = 1, \"b c\" = [ true ] }");
	EXPECT_EQ(TOMLCodec::FormatValue(Value(Value::Object())), "{}");
}
