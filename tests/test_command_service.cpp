#include <gtest/gtest.h>

#include "commands/command_service.hpp"
#include "cron/trigger_parser.hpp"
#include "test_support.hpp"

using llmtrigger::bus::InboundMessage;
using llmtrigger::bus::MessageKind;
using llmtrigger::bus::OutboundMessage;
using llmtrigger::commands::CommandService;
using llmtrigger::commands::ExtractCommand;
using llmtrigger::cron::SchedulerService;
using llmtrigger::cron::TriggerCategory;
using llmtrigger::testing::ExecutorHarness;

namespace {

InboundMessage MakeCommand(const std::string& content, const std::string& sender = "42|alice") {
    InboundMessage msg{};
    msg.channel = "p1";
    msg.sender_id = sender;
    msg.chat_id = "-100";
    msg.kind = MessageKind::Group;
    msg.content = content;
    return msg;
}

std::vector<OutboundMessage> DrainReplies(llmtrigger::bus::MessageBus& bus) {
    std::vector<OutboundMessage> replies;
    OutboundMessage msg{};
    while (bus.TryConsumeOutbound(msg, std::chrono::milliseconds(0))) {
        replies.push_back(msg);
    }
    return replies;
}

class CommandServiceTest : public ::testing::Test {
protected:
    CommandServiceTest()
        : scheduler_(
              {llmtrigger::cron::ParseTrigger("p1::g1::provA::0 9 * * *::morning",
                                              TriggerCategory::Room,
                                              llmtrigger::utils::Now())},
              *harness_.executor,
              std::chrono::seconds(60))
        , commands_(harness_.bus, scheduler_, "alice") {}

    ExecutorHarness harness_;
    SchedulerService scheduler_;
    CommandService commands_;
};

}  // namespace

TEST(ExtractCommandTest, StripsBotMentionAndArguments) {
    EXPECT_EQ(ExtractCommand("/llm_trigger"), "/llm_trigger");
    EXPECT_EQ(ExtractCommand("  /llm_trigger_test@my_bot now"), "/llm_trigger_test");
    EXPECT_EQ(ExtractCommand("hello /llm_trigger"), "");
    EXPECT_EQ(ExtractCommand(""), "");
}

TEST_F(CommandServiceTest, StatusCommandRepliesToSameChat) {
    EXPECT_TRUE(commands_.Handle(MakeCommand("/llm_trigger")));

    const auto replies = DrainReplies(harness_.bus);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].channel, "p1");
    EXPECT_EQ(replies[0].kind, MessageKind::Group);
    EXPECT_EQ(replies[0].chat_id, "-100");
    EXPECT_NE(replies[0].content.find("Configured triggers: 1"), std::string::npos);
    EXPECT_NE(replies[0].content.find("Check interval: 60 s"), std::string::npos);
    EXPECT_NE(replies[0].content.find("- p1:g1 (0 9 * * *) -> "), std::string::npos);
}

TEST_F(CommandServiceTest, TestCommandRequiresAdmin) {
    EXPECT_TRUE(commands_.Handle(MakeCommand("/llm_trigger_test", "7|mallory")));

    const auto replies = DrainReplies(harness_.bus);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].content, "Only the administrator can run trigger tests");
    EXPECT_EQ(harness_.provider->Calls(), 0);
}

TEST(CommandServiceSentinelTest, LogOnlyAdminRefusesEverySender) {
    ExecutorHarness harness;
    SchedulerService scheduler(
        {llmtrigger::cron::ParseTrigger("p1::g1::provA::0 9 * * *::morning",
                                        TriggerCategory::Room,
                                        llmtrigger::utils::Now())},
        *harness.executor,
        std::chrono::seconds(60));
    CommandService commands(harness.bus, scheduler, llmtrigger::config::kLogOnlyAdmin);

    EXPECT_TRUE(commands.Handle(MakeCommand("/llm_trigger_test", "7|admin")));
    EXPECT_TRUE(commands.Handle(MakeCommand("/llm_trigger_test", "admin")));

    const auto replies = DrainReplies(harness.bus);
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].content, "Only the administrator can run trigger tests");
    EXPECT_EQ(replies[1].content, "Only the administrator can run trigger tests");
    EXPECT_EQ(harness.provider->Calls(), 0);
}

TEST_F(CommandServiceTest, TestCommandRunsEveryTrigger) {
    EXPECT_TRUE(commands_.Handle(MakeCommand("/llm_trigger_test")));

    const auto replies = DrainReplies(harness_.bus);
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].content, "Testing all triggers...");
    EXPECT_EQ(replies[1].content, "Trigger test finished\nSucceeded: 1/1");
    EXPECT_EQ(harness_.provider->Calls(), 1);
    EXPECT_EQ(harness_.channel->Sent().size(), 1u);
}

TEST_F(CommandServiceTest, IgnoresOrdinaryMessages) {
    EXPECT_FALSE(commands_.Handle(MakeCommand("good morning")));
    EXPECT_FALSE(commands_.Handle(MakeCommand("/help")));
    EXPECT_TRUE(DrainReplies(harness_.bus).empty());
}

TEST(CommandServiceEmptyTest, StatusWithoutTriggers) {
    ExecutorHarness harness;
    SchedulerService scheduler({}, *harness.executor);
    CommandService commands(harness.bus, scheduler, "alice");

    const auto text = commands.FormatStatus();
    EXPECT_NE(text.find("Configured triggers: 0"), std::string::npos);
    EXPECT_NE(text.find("No triggers configured"), std::string::npos);
}
