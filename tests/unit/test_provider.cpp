#include <gtest/gtest.h>
#include <stdexcept>
#include "provider.hpp"

namespace {

using namespace webscout;

TEST(ChatRequestTest, OptionalFieldsAreOmitted) {
    ChatOptions opts;
    opts.model = "gpt-4.1";
    opts.temperature = 0.2;

    auto body = build_chat_request({TranscriptEntry::user("hi")}, nlohmann::json::array(), opts);
    EXPECT_EQ(body["model"], "gpt-4.1");
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.2);
    EXPECT_FALSE(body.contains("max_tokens"));
    EXPECT_FALSE(body.contains("tools"));
    ASSERT_EQ(body["messages"].size(), 1u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
}

TEST(ChatRequestTest, CarriesToolsAndMaxTokens) {
    ChatOptions opts;
    opts.model = "m";
    opts.max_tokens = 2048;
    nlohmann::json tools = nlohmann::json::array({{{"type", "function"}, {"function", {{"name", "search"}}}}});

    auto body = build_chat_request({TranscriptEntry::system("s"), TranscriptEntry::user("u")}, tools, opts);
    EXPECT_EQ(body["max_tokens"], 2048);
    EXPECT_EQ(body["tools"], tools);
    EXPECT_EQ(body["messages"][0]["role"], "system");
}

TEST(ChatResponseTest, ParsesTextReply) {
    auto r = parse_chat_response(R"({
        "choices": [{"message": {"role": "assistant", "content": "Hello"}, "finish_reason": "stop"}],
        "usage": {"prompt_tokens": 12, "completion_tokens": 3}
    })");
    ASSERT_TRUE(std::holds_alternative<TextReply>(r.turn));
    EXPECT_EQ(std::get<TextReply>(r.turn).content, "Hello");
    EXPECT_EQ(r.finish_reason, std::optional<std::string>("stop"));
    EXPECT_EQ(r.prompt_tokens, 12);
    EXPECT_EQ(r.completion_tokens, 3);
}

TEST(ChatResponseTest, ParsesToolCalls) {
    auto r = parse_chat_response(R"({
        "choices": [{"message": {"role": "assistant", "content": null, "tool_calls": [
            {"id": "call_1", "type": "function",
             "function": {"name": "download_file", "arguments": "{\"url\":\"https://a\",\"filename\":\"a.pdf\"}"}}
        ]}, "finish_reason": "tool_calls"}]
    })");
    ASSERT_TRUE(std::holds_alternative<ToolCallReply>(r.turn));
    auto& calls = std::get<ToolCallReply>(r.turn).tool_calls;
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].id, "call_1");
    EXPECT_EQ(calls[0].name, "download_file");
    EXPECT_EQ(r.prompt_tokens, 0);
}

TEST(ChatResponseTest, MalformedBodiesThrow) {
    EXPECT_THROW(parse_chat_response("not json"), std::runtime_error);
    EXPECT_THROW(parse_chat_response(R"({"choices": []})"), std::runtime_error);
    EXPECT_THROW(parse_chat_response(R"({"choices": [{"finish_reason": "stop"}]})"), std::runtime_error);
    try {
        parse_chat_response(R"({"error": {"message": "bad key"}})");
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to parse provider response: ", 0), 0u);
    }
}

TEST(BaseUrlTest, SplitsSchemeHostPortAndPrefix) {
    auto a = parse_base_url("https://api.openai.com/v1/");
    EXPECT_EQ(a.scheme, "https");
    EXPECT_EQ(a.host, "api.openai.com");
    EXPECT_EQ(a.port, 443);
    EXPECT_EQ(a.path_prefix, "/v1");

    auto b = parse_base_url("http://localhost:11434/v1");
    EXPECT_EQ(b.scheme, "http");
    EXPECT_EQ(b.host, "localhost");
    EXPECT_EQ(b.port, 11434);
    EXPECT_EQ(b.path_prefix, "/v1");

    auto c = parse_base_url("http://10.0.0.2");
    EXPECT_EQ(c.port, 80);
    EXPECT_EQ(c.path_prefix, "");
}

TEST(BaseUrlTest, BadPortNamesTheSetting) {
    for (const char* url : {"http://localhost:abc/v1", "http://localhost:80x", "https://host:99999"}) {
        try {
            parse_base_url(url);
            FAIL() << "expected an exception for " << url;
        } catch (const std::runtime_error& e) {
            EXPECT_NE(std::string(e.what()).find("provider.api_base"), std::string::npos) << e.what();
        }
    }

    ProviderConfig cfg;
    cfg.api_base = "http://localhost:port/v1";
    EXPECT_THROW(Provider{cfg}, std::runtime_error);
}

} // namespace
