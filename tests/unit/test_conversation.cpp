#include <gtest/gtest.h>
#include "chat_store.hpp"
#include "conversation.hpp"

namespace {

using namespace webscout;

TEST(ConversationTest, UserMessageGoesToBothLogs) {
    Conversation c("abc");
    c.add_user_message("hello");

    auto msgs = c.messages();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].role, MessageRole::user);
    EXPECT_GT(msgs[0].timestamp, 0.0);

    auto t = c.transcript();
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0].role, TurnRole::user);
    EXPECT_EQ(t[0].content, "hello");
}

TEST(ConversationTest, AssistantAndToolMessagesAreDisplayOnly) {
    Conversation c("abc");
    c.add_assistant_message("hi");
    c.add_tool_activity("search", {{"query", "q"}}, {{"results", nlohmann::json::array()}}, 12);
    c.add_file_message("a.pdf", "/tmp/a.pdf", 42);

    EXPECT_EQ(c.message_count(), 3u);
    EXPECT_TRUE(c.transcript().empty());
}

TEST(ConversationTest, SystemMessageIsEchoedAsSystemCheck) {
    Conversation c("abc");
    c.add_system_message("careful");

    ASSERT_EQ(c.messages().size(), 1u);
    EXPECT_EQ(c.messages()[0].role, MessageRole::system);
    auto t = c.transcript();
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0].role, TurnRole::user);
    EXPECT_EQ(t[0].content, "[SYSTEM CHECK] careful");
}

TEST(ConversationTest, SystemPromptGoesFirstAndOnlyOnce) {
    Conversation c("abc");
    c.add_user_message("q");
    c.ensure_system_prompt("prompt v1");
    c.ensure_system_prompt("prompt v2");

    auto t = c.transcript();
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0].role, TurnRole::system);
    EXPECT_EQ(t[0].content, "prompt v1");
}

TEST(ConversationTest, MessagesSinceIsIncremental) {
    Conversation c("abc");
    c.add_user_message("one");
    c.add_assistant_message("two");
    c.add_file_message("f.xlsx", "/d/f.xlsx", 7000);

    auto first = c.messages_since(1);
    auto again = c.messages_since(1);
    EXPECT_EQ(first, again);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[1]["role"], "file");
    EXPECT_EQ(first[1]["filename"], "f.xlsx");
    EXPECT_EQ(first[1]["file_size"], 7000);

    c.add_tool_activity("search", {{"query", "q"}}, {{"results", nlohmann::json::array()}}, 3);
    c.add_system_message("careful");
    auto later = c.messages_since(1);
    ASSERT_EQ(later.size(), first.size() + 2);
    for (size_t i = 0; i < first.size(); i++) EXPECT_EQ(later[i], first[i]);
    EXPECT_EQ(later[2]["role"], "tool_activity");
    EXPECT_EQ(later[3]["content"], "careful");

    EXPECT_EQ(c.messages_since(3), nlohmann::json::array({later[2], later[3]}));
    EXPECT_TRUE(c.messages_since(5).empty());
    EXPECT_TRUE(c.messages_since(99).empty());
}

TEST(ConversationTest, ProcessingFlagIsExclusive) {
    Conversation c("abc");
    EXPECT_TRUE(c.try_begin_processing());
    EXPECT_FALSE(c.try_begin_processing());
    {
        ProcessingGuard guard(c);
        EXPECT_TRUE(c.is_processing());
    }
    EXPECT_FALSE(c.is_processing());
    EXPECT_TRUE(c.try_begin_processing());
}

TEST(ChatStoreTest, CreatesDistinctConversations) {
    ChatStore store;
    auto a = store.create();
    auto b = store.create();
    EXPECT_NE(a->id(), b->id());
    EXPECT_EQ(a->id().size(), 12u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get(a->id()), a);
    EXPECT_FALSE(store.get("nope"));
}

TEST(ChatStoreTest, MessagesSinceReportsTotals) {
    ChatStore store;
    auto c = store.create();
    c->add_user_message("one");
    c->add_assistant_message("two");

    auto page = store.messages_since(c->id(), 1);
    ASSERT_TRUE(page);
    EXPECT_EQ((*page)["id"], c->id());
    EXPECT_EQ((*page)["messages"].size(), 1u);
    EXPECT_EQ((*page)["total_messages"], 2);
    EXPECT_EQ((*page)["is_processing"], false);

    auto past_end = store.messages_since(c->id(), 10);
    ASSERT_TRUE(past_end);
    EXPECT_TRUE((*past_end)["messages"].empty());
    EXPECT_EQ((*past_end)["total_messages"], 2);

    EXPECT_FALSE(store.messages_since("missing", 0));
}

} // namespace
