#include <gtest/gtest.h>

#include "config/config_schema.hpp"
#include "cron/trigger_parser.hpp"
#include "test_support.hpp"

using llmtrigger::cron::FormatError;
using llmtrigger::cron::LoadTriggers;
using llmtrigger::cron::ParseTrigger;
using llmtrigger::cron::ParseTriggers;
using llmtrigger::cron::RejectReason;
using llmtrigger::cron::ScheduleError;
using llmtrigger::cron::TriggerCategory;
using llmtrigger::testing::LocalTime;
using llmtrigger::testing::LogCapture;
using llmtrigger::utils::LogLevel;

TEST(TriggerParserTest, SplitsFieldsAndKeepsSeparatorInPrompt) {
    const auto now = LocalTime(2024, 1, 3, 8, 2);
    const auto state = ParseTrigger("p1::g1::provA::*/5 * * * *::hello::world", TriggerCategory::Room, now);

    EXPECT_EQ(state.definition.category, TriggerCategory::Room);
    EXPECT_EQ(state.definition.channel, "p1");
    EXPECT_EQ(state.definition.destination_id, "g1");
    EXPECT_EQ(state.definition.provider_name, "provA");
    EXPECT_EQ(state.definition.cron_expression, "*/5 * * * *");
    EXPECT_EQ(state.definition.prompt, "hello::world");
    EXPECT_EQ(state.next_run, LocalTime(2024, 1, 3, 8, 5));
    EXPECT_FALSE(state.last_run.has_value());
}

TEST(TriggerParserTest, TooFewSegmentsIsFormatError) {
    const auto now = LocalTime(2024, 1, 3, 8, 2);
    EXPECT_THROW(ParseTrigger("p1::g1::provA::*/5 * * * *", TriggerCategory::Room, now), FormatError);
    EXPECT_THROW(ParseTrigger("just text", TriggerCategory::Direct, now), FormatError);
}

TEST(TriggerParserTest, EmptyIdentifiersAreKeptAsWritten) {
    const auto now = LocalTime(2024, 1, 3, 8, 2);

    const auto no_channel = ParseTrigger("::g1::provA::*/5 * * * *::hi", TriggerCategory::Room, now);
    EXPECT_EQ(no_channel.definition.channel, "");
    EXPECT_EQ(no_channel.definition.destination_id, "g1");
    EXPECT_EQ(no_channel.next_run, LocalTime(2024, 1, 3, 8, 5));

    const auto no_provider = ParseTrigger("p1::::::*/5 * * * *::hi", TriggerCategory::Room, now);
    EXPECT_EQ(no_provider.definition.destination_id, "");
    EXPECT_EQ(no_provider.definition.provider_name, "");
    EXPECT_EQ(no_provider.definition.prompt, "hi");
}

TEST(TriggerParserTest, InvalidCronIsScheduleError) {
    const auto now = LocalTime(2024, 1, 3, 8, 2);
    EXPECT_THROW(ParseTrigger("p1::g1::provA::99 * * * *::hi", TriggerCategory::Room, now), ScheduleError);
    EXPECT_THROW(ParseTrigger("p1::g1::provA::* * *::hi", TriggerCategory::Room, now), ScheduleError);
}

TEST(TriggerParserTest, BadEntriesDoNotStopTheBatch) {
    LogCapture capture;
    const auto now = LocalTime(2024, 1, 3, 8, 2);
    const auto report = ParseTriggers(
        {
            "p1::g1::provA::0 9 * * *::first",
            "broken",
            "p1::g2::provA::99 * * * *::hi",
            "p2::u1::provB::*/15 * * * *::second",
        },
        TriggerCategory::Direct,
        now);

    ASSERT_EQ(report.triggers.size(), 2u);
    EXPECT_EQ(report.triggers[0].definition.prompt, "first");
    EXPECT_EQ(report.triggers[1].definition.prompt, "second");
    EXPECT_EQ(report.triggers[1].definition.category, TriggerCategory::Direct);

    ASSERT_EQ(report.rejected.size(), 2u);
    EXPECT_EQ(report.rejected[0].raw, "broken");
    EXPECT_EQ(report.rejected[0].reason, RejectReason::Format);
    EXPECT_EQ(report.rejected[1].reason, RejectReason::Schedule);

    EXPECT_TRUE(capture.Contains(LogLevel::kWarn, "broken"));
    EXPECT_TRUE(capture.Contains(LogLevel::kError, "99 * * * *"));
}

TEST(TriggerParserTest, LoadTriggersReadsRoomThenDirect) {
    llmtrigger::config::Config config{};
    config.scheduler.group_triggers = {"tg::-100::gpt::0 8 * * *::morning"};
    config.scheduler.friend_triggers = {"tg::42::gpt::0 20 * * *::evening", "bad"};

    const auto report = LoadTriggers(config, LocalTime(2024, 1, 3, 7, 0));
    ASSERT_EQ(report.triggers.size(), 2u);
    EXPECT_EQ(report.triggers[0].definition.category, TriggerCategory::Room);
    EXPECT_EQ(report.triggers[1].definition.category, TriggerCategory::Direct);
    ASSERT_EQ(report.rejected.size(), 1u);
    EXPECT_EQ(report.rejected[0].category, TriggerCategory::Direct);
}

TEST(TriggerParserTest, RestartRecomputesFromRestartInstant) {
    const std::string raw = "p1::g1::provA::0 9 * * *::daily";
    const auto first_boot = LocalTime(2024, 1, 3, 8, 0);
    const auto restart = LocalTime(2024, 1, 6, 12, 0);

    const auto before = ParseTrigger(raw, TriggerCategory::Room, first_boot);
    const auto after = ParseTrigger(raw, TriggerCategory::Room, restart);

    EXPECT_EQ(before.next_run, LocalTime(2024, 1, 3, 9, 0));
    EXPECT_GT(after.next_run, restart);
    EXPECT_EQ(after.next_run, LocalTime(2024, 1, 7, 9, 0));
}
