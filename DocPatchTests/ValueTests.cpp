// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/Value.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

TEST(Value, Types)
{
	EXPECT_TRUE(Value().IsNull());
	EXPECT_TRUE(Value(nullptr).IsNull());
	EXPECT_TRUE(Value(false).IsBool());
	EXPECT_TRUE(Value(1).IsInt());
	EXPECT_TRUE(Value(static_cast<u64>(5)).IsInt());
	EXPECT_TRUE(Value(1.5).IsFloat());
	EXPECT_TRUE(Value("x").IsString());
	EXPECT_TRUE(Value(std::string("x")).IsString());
	EXPECT_TRUE(Value(Value::Array()).IsArray());
	EXPECT_TRUE(Value(Value::Object()).IsObject());

	EXPECT_STREQ(Value(1).GetTypeName(), "integer");
	EXPECT_STREQ(Value(Value::Object()).GetTypeName(), "object");
}

TEST(Value, NumericEquality)
{
	EXPECT_EQ(Value(1), Value(1.0));
	EXPECT_NE(Value(1), Value(1.5));
	EXPECT_NE(Value(1), Value("1"));
	EXPECT_NE(Value(true), Value(1));
	EXPECT_EQ(Value(std::numeric_limits<double>::quiet_NaN()), Value(std::numeric_limits<double>::quiet_NaN()));
	EXPECT_DOUBLE_EQ(Value(3).GetFloat(), 3.0);
}

TEST(Value, StructuralEquality)
{
	const Value lhs(MakeObject({{"a", Value::Array{Value(1), Value("two")}}, {"b", MakeObject({{"c", nullptr}})}}));
	Value rhs(MakeObject({{"b", MakeObject({{"c", nullptr}})}, {"a", Value::Array{Value(1.0), Value("two")}}}));
	EXPECT_EQ(lhs, rhs);

	rhs.GetObject()["a"].GetArray().push_back(Value(3));
	EXPECT_NE(lhs, rhs);
}

TEST(Value, Find)
{
	Value value(MakeObject({{"a", 1}}));
	ASSERT_NE(value.Find("a"), nullptr);
	EXPECT_EQ(*value.Find("a"), Value(1));
	EXPECT_EQ(value.Find("b"), nullptr);
	EXPECT_EQ(Value(1).Find("a"), nullptr);
}

TEST(Value, ContainsNull)
{
	EXPECT_FALSE(Value(MakeObject({{"a", Value::Array{Value(1)}}})).ContainsNull());
	EXPECT_TRUE(Value(MakeObject({{"a", Value::Array{Value(1), Value()}}})).ContainsNull());
	EXPECT_TRUE(Value().ContainsNull());
}

TEST(Value, ToString)
{
	EXPECT_EQ(Value(MakeObject({{"a", Value::Array{Value(1), Value(true), Value()}}, {"b", "x"}})).ToString(),
		"{\"a\":[1,true,null],\"b\":\"x\"}");
}
