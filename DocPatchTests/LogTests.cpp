// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "common/Console.h"

#include "docpatch/Patch.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{
	struct HostMessage
	{
		LOGLEVEL level;
		ConsoleColors color;
		std::string text;
	};

	std::vector<HostMessage> s_host_messages;

	void CaptureHostMessage(LOGLEVEL level, ConsoleColors color, std::string_view message)
	{
		s_host_messages.push_back(HostMessage{level, color, std::string(message)});
	}

	class LogTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			s_host_messages.clear();
			m_timestamps = Log::AreTimestampsEnabled();
		}

		void TearDown() override
		{
			Log::SetHostOutputLevel(LOGLEVEL_NONE, nullptr);
			Log::SetConsoleOutputLevel(LOGLEVEL_NONE);
			Log::SetTimestampsEnabled(m_timestamps);
			s_host_messages.clear();
		}

	private:
		bool m_timestamps = true;
	};
} // namespace

TEST_F(LogTest, SilentByDefault)
{
	EXPECT_FALSE(Log::IsConsoleOutputEnabled());
	EXPECT_FALSE(Log::IsHostOutputEnabled());
	EXPECT_EQ(Log::GetMaxLevel(), LOGLEVEL_NONE);

	Value::Object data;
	ApplyPatchesToMapping(data, {Patch::Add("nope", 1)});
	EXPECT_TRUE(s_host_messages.empty());
}

TEST_F(LogTest, HostReceivesSkippedPatches)
{
	Log::SetHostOutputLevel(LOGLEVEL_DEV, CaptureHostMessage);
	EXPECT_TRUE(Log::IsHostOutputEnabled());
	EXPECT_EQ(Log::GetMaxLevel(), LOGLEVEL_DEV);

	Value::Object data = MakeObject({{"a", 1}});
	const std::vector<PatchOutcome> outcomes =
		ApplyPatchesToMapping(data, {Patch::Add("nope", 1), Patch::Add("/a/b", 2), Patch::Replace("/c", 3)});
	ASSERT_EQ(outcomes.size(), 3u);
	EXPECT_EQ(outcomes[2], PatchOutcome::Applied);

	ASSERT_EQ(s_host_messages.size(), 2u);
	EXPECT_EQ(s_host_messages[0].level, LOGLEVEL_DEV);
	EXPECT_EQ(s_host_messages[0].text, "Skipping add patch with unusable path \"nope\"");
	EXPECT_EQ(s_host_messages[1].text, "Skipping add patch at \"/a/b\": Failed");
}

TEST_F(LogTest, HostLevelFilters)
{
	Log::SetHostOutputLevel(LOGLEVEL_WARNING, CaptureHostMessage);

	DEV_LOG("dropped {}", 1);
	INFO_LOG("dropped too");
	WARNING_LOG("kept {}", 2);
	ERROR_LOG("also kept");

	ASSERT_EQ(s_host_messages.size(), 2u);
	EXPECT_EQ(s_host_messages[0].level, LOGLEVEL_WARNING);
	EXPECT_EQ(s_host_messages[0].color, Color_StrongOrange);
	EXPECT_EQ(s_host_messages[0].text, "kept 2");
	EXPECT_EQ(s_host_messages[1].level, LOGLEVEL_ERROR);
	EXPECT_EQ(s_host_messages[1].color, Color_StrongRed);

	// A null callback disables the sink.
	Log::SetHostOutputLevel(LOGLEVEL_TRACE, nullptr);
	EXPECT_FALSE(Log::IsHostOutputEnabled());
	ERROR_LOG("nobody listens");
	EXPECT_EQ(s_host_messages.size(), 2u);
}

TEST_F(LogTest, HostMessagesAreSplitPerLine)
{
	Log::SetHostOutputLevel(LOGLEVEL_INFO, CaptureHostMessage);
	Log::Write(LOGLEVEL_INFO, Color_Default, "first\nsecond\n\nfourth");

	ASSERT_EQ(s_host_messages.size(), 4u);
	EXPECT_EQ(s_host_messages[0].text, "first");
	EXPECT_EQ(s_host_messages[1].text, "second");
	EXPECT_EQ(s_host_messages[2].text, "");
	EXPECT_EQ(s_host_messages[3].text, "fourth");
}

TEST_F(LogTest, ConsoleWritesWarningsToStderr)
{
	Log::SetConsoleOutputLevel(LOGLEVEL_WARNING);
	Log::SetTimestampsEnabled(false);
	EXPECT_TRUE(Log::IsConsoleOutputEnabled());

	::testing::internal::CaptureStderr();
	WARNING_LOG("disk {} is full", "C");
	DEV_LOG("not written");
	const std::string output = ::testing::internal::GetCapturedStderr();

	EXPECT_NE(output.find("disk C is full"), std::string::npos);
	EXPECT_EQ(output.find("not written"), std::string::npos);
	EXPECT_EQ(output.back(), '\n');
}

TEST_F(LogTest, ConsoleTimestamps)
{
	Log::SetConsoleOutputLevel(LOGLEVEL_ERROR);
	Log::SetTimestampsEnabled(true);
	EXPECT_TRUE(Log::AreTimestampsEnabled());
	EXPECT_GE(Log::GetCurrentMessageTime(), 0.0f);

	::testing::internal::CaptureStderr();
	ERROR_LOG("stamped");
	const std::string output = ::testing::internal::GetCapturedStderr();

	const size_t open = output.find('[');
	const size_t close = output.find("] stamped");
	ASSERT_NE(open, std::string::npos);
	ASSERT_NE(close, std::string::npos);
	EXPECT_LT(open, close);
}
