#include <gtest/gtest.h>
#include <httplib.h>
#include <chrono>
#include <string>
#include <thread>
#include "llm/HttpTransport.hpp"

using namespace support_assistant;
using namespace std::chrono_literals;

// Real libcurl transfers against a local httplib server.
class CprTransportTest : public ::testing::Test {
protected:
    static constexpr auto kSlowHandlerDelay = 1500ms;

    void SetUp() override {
        server_.Post("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(kSlowHandlerDelay);
            res.set_content("too late", "text/plain");
        });
        server_.Post("/busy", [](const httplib::Request&, httplib::Response& res) {
            res.status = 429;
            res.set_content(R"({"error":"rate limited"})", "application/json");
        });
        server_.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.get_header_value("X-Title") + "|" + req.body, "text/plain");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        listener_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    void TearDown() override {
        server_.stop();
        if (listener_.joinable()) listener_.join();
    }

    HttpRequest request_to(const std::string& path, long timeout_ms = 5000) const {
        HttpRequest request;
        request.url = "http://127.0.0.1:" + std::to_string(port_) + path;
        request.headers = {{"Content-Type", "application/json"}, {"X-Title", "NovaTech Support Chat"}};
        request.body = R"({"model":"m"})";
        request.timeout_ms = timeout_ms;
        return request;
    }

    httplib::Server server_;
    std::thread listener_;
    int port_ = -1;
    CprTransport transport_;
};

TEST_F(CprTransportTest, DeadlineAbortsSlowTransfer) {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response = transport_.post(request_to("/slow", 200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(response.transport, TransportStatus::TimedOut);
    EXPECT_FALSE(response.error_message.empty());
    EXPECT_TRUE(response.body.empty());
    EXPECT_LT(elapsed, 1000ms);
}

TEST_F(CprTransportTest, ErrorStatusIsPassedThrough) {
    HttpResponse response = transport_.post(request_to("/busy"));

    EXPECT_EQ(response.transport, TransportStatus::Completed);
    EXPECT_EQ(response.status, 429);
    EXPECT_EQ(response.body, R"({"error":"rate limited"})");
}

TEST_F(CprTransportTest, HeadersAndBodyAreSent) {
    HttpResponse response = transport_.post(request_to("/echo"));

    EXPECT_EQ(response.transport, TransportStatus::Completed);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, R"(NovaTech Support Chat|{"model":"m"})");
}

TEST_F(CprTransportTest, RefusedConnectionIsFailure) {
    HttpRequest request = request_to("/echo");
    request.url = "http://127.0.0.1:1/echo";
    HttpResponse response = transport_.post(request);

    EXPECT_EQ(response.transport, TransportStatus::Failed);
    EXPECT_FALSE(response.error_message.empty());
}
