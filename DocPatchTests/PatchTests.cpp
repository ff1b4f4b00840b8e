// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JsonPointer.h"
#include "docpatch/Patch.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

TEST(Patch, Constructors)
{
	const Patch add = Patch::Add("/a", 1);
	EXPECT_EQ(add.op, PatchOp::Add);
	EXPECT_EQ(add.path, "/a");
	EXPECT_EQ(add.value, Value(1));

	const Patch remove = Patch::Remove("/a");
	EXPECT_EQ(remove.op, PatchOp::Remove);
	EXPECT_TRUE(remove.value.IsNull());
}

TEST(Patch, OpNames)
{
	EXPECT_STREQ(GetPatchOpName(PatchOp::Add), "add");
	EXPECT_STREQ(GetPatchOpName(PatchOp::Replace), "replace");
	EXPECT_STREQ(GetPatchOpName(PatchOp::Remove), "remove");
	EXPECT_EQ(ParsePatchOpName("replace"), PatchOp::Replace);
	EXPECT_FALSE(ParsePatchOpName("move").has_value());
}

TEST(Patch, FromWire)
{
	Error error;
	const std::optional<Patch> patch = Patch::FromWire("add", "/a", Value("x"), &error);
	ASSERT_TRUE(patch.has_value());
	EXPECT_EQ(patch.value(), Patch::Add("/a", "x"));

	EXPECT_FALSE(Patch::FromWire("copy", "/a", Value(1), &error).has_value());
	EXPECT_EQ(error.GetDescription(), "unknown patch operation \"copy\"");

	EXPECT_FALSE(Patch::FromWire("replace", "/a", std::nullopt, &error).has_value());
	EXPECT_TRUE(Patch::FromWire("remove", "/a", std::nullopt, &error).has_value());
}

TEST(PatchSet, KeepsOrder)
{
	PatchSet patches;
	EXPECT_TRUE(patches.empty());
	patches.Add("/a", 1);
	patches.Replace("/b", 2);
	patches.Remove("/c");
	ASSERT_EQ(patches.size(), 3u);
	EXPECT_EQ(patches[0].op, PatchOp::Add);
	EXPECT_EQ(patches[1].op, PatchOp::Replace);
	EXPECT_EQ(patches[2], Patch::Remove("/c"));
}

TEST(ApplyPatchesToMapping, SetsNestedValues)
{
	Value::Object mapping;
	const PatchSet patches = {Patch::Add("/server/host", "localhost"), Patch::Replace("/server/port", 8080)};
	const std::vector<PatchOutcome> outcomes = ApplyPatchesToMapping(mapping, patches);
	EXPECT_EQ(outcomes, std::vector<PatchOutcome>({PatchOutcome::Applied, PatchOutcome::Applied}));
	EXPECT_EQ(mapping, MakeObject({{"server", MakeObject({{"host", "localhost"}, {"port", 8080}})}}));
}

TEST(ApplyPatchesToMapping, LaterPatchesSeeEarlierOnes)
{
	Value::Object mapping;
	ApplyPatchesToMapping(mapping, {Patch::Add("/a", 1), Patch::Remove("/a"), Patch::Add("/b", 2), Patch::Replace("/b", 3)});
	EXPECT_EQ(mapping, MakeObject({{"b", 3}}));
}

TEST(ApplyPatchesToMapping, SkipsInvalidAndRootPaths)
{
	Value::Object mapping = MakeObject({{"a", 1}});
	const std::vector<PatchOutcome> outcomes =
		ApplyPatchesToMapping(mapping, {Patch::Add("", 5), Patch::Add("no-slash", 5), Patch::Add("/b", 2)});
	EXPECT_EQ(outcomes, std::vector<PatchOutcome>({PatchOutcome::SkippedInvalidPath, PatchOutcome::SkippedInvalidPath,
							PatchOutcome::Applied}));
	EXPECT_EQ(mapping, MakeObject({{"a", 1}, {"b", 2}}));
}

TEST(ApplyPatchesToMapping, NonObjectIntermediateSkipsWholePatch)
{
	Value::Object mapping = MakeObject({{"a", MakeObject({{"b", "scalar"}})}});
	const std::vector<PatchOutcome> outcomes = ApplyPatchesToMapping(mapping, {Patch::Add("/a/b/c/d", 1), Patch::Add("/a/x", 2)});
	EXPECT_EQ(outcomes[0], PatchOutcome::Failed);
	EXPECT_EQ(outcomes[1], PatchOutcome::Applied);
	EXPECT_EQ(mapping, MakeObject({{"a", MakeObject({{"b", "scalar"}, {"x", 2}})}}));
}

TEST(ApplyPatchesToMapping, RemoveMissingIsNoOp)
{
	Value::Object mapping = MakeObject({{"a", 1}});
	const std::vector<PatchOutcome> outcomes = ApplyPatchesToMapping(mapping, {Patch::Remove("/x/y"), Patch::Remove("/b")});
	EXPECT_EQ(outcomes, std::vector<PatchOutcome>({PatchOutcome::Applied, PatchOutcome::Applied}));
	EXPECT_EQ(mapping, MakeObject({{"a", 1}}));
}

TEST(ApplyPatchesToMapping, IdempotentAdd)
{
	Value::Object once;
	Value::Object twice;
	const Patch patch = Patch::Add("/a/b", Value::Array{Value(1), Value(2)});
	ApplyPatchesToMapping(once, {patch});
	ApplyPatchesToMapping(twice, {patch, patch});
	EXPECT_EQ(once, twice);
}
