// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "common/Error.h"

#include <gtest/gtest.h>

TEST(Error, DefaultIsNone)
{
	const Error error;
	EXPECT_FALSE(error.IsValid());
	EXPECT_EQ(error.GetType(), Error::Type::None);
	EXPECT_TRUE(error.GetDescription().empty());
}

TEST(Error, Messages)
{
	Error error;
	error.SetPathNotFound("/server/port");
	EXPECT_EQ(error.GetType(), Error::Type::PathNotFound);
	EXPECT_EQ(error.GetDescription(), "path not found: /server/port");
	EXPECT_EQ(error.GetPath(), "/server/port");

	error.SetInvalidPath("/items/x", "array index must be a number");
	EXPECT_EQ(error.GetType(), Error::Type::InvalidPath);
	EXPECT_EQ(error.GetDescription(), "invalid path \"/items/x\": array index must be a number");

	error.SetTypeMismatch("/a", "array", "string");
	EXPECT_EQ(error.GetType(), Error::Type::TypeMismatch);
	EXPECT_EQ(error.GetDescription(), "type mismatch at \"/a\": expected array, got string");

	error.SetUnsupportedStructure("/a/b", "TOML does not support null values");
	EXPECT_EQ(error.GetType(), Error::Type::UnsupportedStructure);
	EXPECT_EQ(error.GetDescription(), "unsupported structure at \"/a/b\": TOML does not support null values");

	error.SetUnsupportedStructure("", "no path");
	EXPECT_EQ(error.GetDescription(), "unsupported structure: no path");

	error.SetParse("YAML", "bad indent");
	EXPECT_EQ(error.GetType(), Error::Type::Parse);
	EXPECT_EQ(error.GetDescription(), "failed to parse YAML: bad indent");
	EXPECT_TRUE(error.GetPath().empty());
}

TEST(Error, NullPointerIsIgnored)
{
	Error::SetPathNotFound(nullptr, "/a");
	Error::SetInvalidPath(nullptr, "/a", "reason");
	Error::SetTypeMismatch(nullptr, "/a", "x", "y");
	Error::SetUnsupportedStructure(nullptr, "/a", "reason");
	Error::SetParse(nullptr, "TOML", "reason");
	Error::SetStringFmt(nullptr, "failed {}", 1);
	SUCCEED();
}

TEST(Error, FormattedAndClear)
{
	Error error;
	error.SetInvalidPath("/a", "reason");
	Error::SetStringFmt(&error, "failed {}", 1);
	EXPECT_EQ(error.GetDescription(), "failed 1");
	EXPECT_EQ(error.GetType(), Error::Type::User);
	EXPECT_TRUE(error.GetPath().empty());

	error.Clear();
	EXPECT_FALSE(error.IsValid());
}
