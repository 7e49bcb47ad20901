#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "chat_service.hpp"
#include "fake_transport.hpp"
#include "prompt/ConversationBuilder.hpp"

using namespace support_assistant;
using support_assistant::testing::FakeTransport;
using support_assistant::testing::capture_error;
using support_assistant::testing::completion_body;
using json = nlohmann::json;

class ChatServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.api_key = "sk-test";
        config_.organization_name = "NovaTech";
        transport_ = std::make_shared<FakeTransport>();
        transport_->reply_with(200, completion_body("Here you go"));
        logs_ = std::make_shared<LogManager>();
    }

    ChatService service() {
        return ChatService(config_,
                           KnowledgeBase::sample(config_.organization_name),
                           std::make_shared<CompletionClient>(config_, transport_),
                           logs_);
    }

    json sent_payload(size_t i = 0) const { return json::parse(transport_->requests.at(i).body); }

    std::string sent_system_prompt(size_t i = 0) const {
        return sent_payload(i)["messages"][0]["content"].get<std::string>();
    }

    ServiceConfig config_;
    std::shared_ptr<FakeTransport> transport_;
    std::shared_ptr<LogManager> logs_;
};

TEST_F(ChatServiceTest, PricingQuestionIsGrounded) {
    ChatRequest request;
    request.message = "How much does a website cost?";
    ChatReply reply = service().answer(request);

    EXPECT_EQ(reply.reply, "Here you go");
    EXPECT_TRUE(reply.has_context);
    EXPECT_EQ(reply.model, config_.model);

    std::string system = sent_system_prompt();
    EXPECT_NE(system.find("[Document 1: Pricing & Billing]"), std::string::npos);
    EXPECT_NE(system.find("NovaTech offers flexible pricing models"), std::string::npos);

    json logs = logs_->get_logs_json();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0]["status"], 200);
    EXPECT_EQ(logs[0]["has_context"], true);
    EXPECT_EQ(logs[0]["chunk_ids"][0], "pricing-billing");
    EXPECT_EQ(logs[0]["error_kind"], "");
}

TEST_F(ChatServiceTest, UnknownTopicGetsRefusalPrompt) {
    ChatRequest request;
    request.message = "xyzabc";
    ChatReply reply = service().answer(request);

    EXPECT_FALSE(reply.has_context);
    std::string system = sent_system_prompt();
    EXPECT_EQ(system.find("CONTEXT FROM KNOWLEDGE BASE"), std::string::npos);
    EXPECT_NE(system.find(ConversationBuilder::kNoInformationReply), std::string::npos);
    EXPECT_TRUE(logs_->get_logs_json()[0]["chunk_ids"].empty());
}

TEST_F(ChatServiceTest, EmptyMessageIsRejectedAndLogged) {
    ChatRequest request;
    auto error = capture_error([&] { service().answer(request); });

    EXPECT_EQ(error.kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(error.status(), 400);
    EXPECT_EQ(error.user_message(), "Message is required");
    EXPECT_TRUE(transport_->requests.empty());

    json logs = logs_->get_logs_json();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0]["status"], 400);
    EXPECT_EQ(logs[0]["error_kind"], "InvalidInput");
}

TEST_F(ChatServiceTest, SuppliedContextSkipsRetrieval) {
    ChatRequest request;
    request.message = "How much does a website cost?";
    request.knowledge_context = std::string("Websites start at 42 credits.");
    ChatReply reply = service().answer(request);

    EXPECT_TRUE(reply.has_context);
    std::string system = sent_system_prompt();
    EXPECT_NE(system.find("Websites start at 42 credits."), std::string::npos);
    EXPECT_EQ(system.find("[Document 1:"), std::string::npos);
    EXPECT_TRUE(logs_->get_logs_json()[0]["chunk_ids"].empty());
}

TEST_F(ChatServiceTest, BlankSuppliedContextMeansNoContext) {
    ChatRequest request;
    request.message = "How much does a website cost?";
    request.knowledge_context = std::string("  \n ");
    EXPECT_FALSE(service().answer(request).has_context);
}

TEST_F(ChatServiceTest, RateLimitIsRethrownAndLogged) {
    transport_->reply_with(429, "slow down");
    ChatRequest request;
    request.message = "What are your support hours?";
    auto error = capture_error([&] { service().answer(request); });

    EXPECT_EQ(error.kind(), ErrorKind::RateLimited);
    EXPECT_EQ(error.status(), 429);
    EXPECT_EQ(transport_->requests.size(), 1u);

    json logs = logs_->get_logs_json();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0]["status"], 429);
    EXPECT_EQ(logs[0]["error_kind"], "RateLimited");
    EXPECT_EQ(logs[0]["chunk_ids"][0], "support-hours");
}

TEST_F(ChatServiceTest, TimeoutSurfacesAs504) {
    transport_->time_out();
    ChatRequest request;
    request.message = "Do you offer a refund if I cancel?";
    auto error = capture_error([&] { service().answer(request); });

    EXPECT_EQ(error.kind(), ErrorKind::Timeout);
    EXPECT_EQ(error.status(), 504);
    EXPECT_EQ(transport_->requests.size(), 1u);
}

TEST_F(ChatServiceTest, HistoryIsTrimmedToConfiguredWindow) {
    ChatRequest request;
    request.message = "And the price?";
    for (int i = 0; i < 10; ++i) {
        request.history.push_back({i % 2 == 0 ? Role::User : Role::Assistant, "turn " + std::to_string(i)});
    }
    service().answer(request);

    json messages = sent_payload()["messages"];
    ASSERT_EQ(messages.size(), 8u);
    EXPECT_EQ(messages[0]["role"], "system");
    EXPECT_EQ(messages[1]["content"], "turn 4");
    EXPECT_EQ(messages[6]["content"], "turn 9");
    EXPECT_EQ(messages[7]["role"], "user");
    EXPECT_EQ(messages[7]["content"], "And the price?");
}

TEST_F(ChatServiceTest, OrganizationOverrideReachesPromptAndHeaders) {
    ChatRequest request;
    request.message = "xyzabc";
    request.organization_name = "Acme";
    service().answer(request);

    EXPECT_EQ(transport_->requests.at(0).headers.at("X-Title"), "Acme Support Chat");
    EXPECT_NE(sent_system_prompt().find("Acme"), std::string::npos);
    EXPECT_EQ(logs_->get_logs_json()[0]["organization"], "Acme");
}

TEST_F(ChatServiceTest, LogKeepsOnlyNewestEntries) {
    ChatService chat = service();
    for (size_t i = 0; i < LogManager::kMaxEntries + 5; ++i) {
        ChatRequest request;
        request.message = "question " + std::to_string(i);
        chat.answer(request);
    }
    json logs = logs_->get_logs_json();
    ASSERT_EQ(logs.size(), LogManager::kMaxEntries);
    EXPECT_EQ(logs[0]["user_query"], "question 54");
    EXPECT_FALSE(logs[0].contains("reply"));
}

TEST_F(ChatServiceTest, ConfiguredRetrievalWindowIsHonoured) {
    ChatRequest request;
    request.message = "support maintenance website project security";
    service().answer(request);
    json chunk_ids = logs_->get_logs_json()[0]["chunk_ids"];
    ASSERT_EQ(chunk_ids.size(), 4u);
    EXPECT_EQ(chunk_ids[0], "technical-support");

    config_.top_k = 1;
    service().answer(request);
    chunk_ids = logs_->get_logs_json()[0]["chunk_ids"];
    ASSERT_EQ(chunk_ids.size(), 1u);
    EXPECT_EQ(chunk_ids[0], "technical-support");
}

TEST(ChatRequestParseTest, ReadsAllFields) {
    ChatRequest request = ChatRequest::from_json(json{
        {"message", "hi"},
        {"companyName", "Acme"},
        {"knowledgeContext", "ctx"},
        {"conversationHistory", json::array({
            {{"role", "user"}, {"content", "a"}},
            {{"role", "assistant"}, {"content", "b"}}
        })}
    });
    EXPECT_EQ(request.message, "hi");
    EXPECT_EQ(request.organization_name, "Acme");
    ASSERT_TRUE(request.knowledge_context.has_value());
    EXPECT_EQ(*request.knowledge_context, "ctx");
    ASSERT_EQ(request.history.size(), 2u);
    EXPECT_EQ(request.history[1].role, Role::Assistant);
}

TEST(ChatRequestParseTest, NullOptionalFieldsAreAbsent) {
    ChatRequest request = ChatRequest::from_json(json{
        {"message", "hi"}, {"companyName", nullptr}, {"knowledgeContext", nullptr}, {"conversationHistory", nullptr}
    });
    EXPECT_TRUE(request.organization_name.empty());
    EXPECT_FALSE(request.knowledge_context.has_value());
    EXPECT_TRUE(request.history.empty());
}

TEST(ChatRequestParseTest, WrongTypesAreInvalidInput) {
    const json bodies[] = {
        json::array(),
        json{{"companyName", "Acme"}},
        json{{"message", 42}},
        json{{"message", "hi"}, {"companyName", 7}},
        json{{"message", "hi"}, {"companyName", json::object()}},
        json{{"message", "hi"}, {"knowledgeContext", true}},
        json{{"message", "hi"}, {"conversationHistory", "nope"}},
        json{{"message", "hi"}, {"conversationHistory", json::array({{{"role", "user"}}})}},
        json{{"message", "hi"}, {"conversationHistory", json::array({{{"role", "bot"}, {"content", "x"}}})}},
    };
    for (const auto& body : bodies) {
        auto error = capture_error([&] { ChatRequest::from_json(body); });
        EXPECT_EQ(error.kind(), ErrorKind::InvalidInput) << body.dump();
        EXPECT_EQ(error.status(), 400) << body.dump();
    }
}
