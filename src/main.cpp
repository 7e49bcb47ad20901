#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "ConfigManager.hpp"
#include "LogManager.hpp"
#include "chat_service.hpp"
#include "knowledge_base.hpp"
#include "llm/CompletionClient.hpp"
#include "llm/HttpTransport.hpp"
#include "retrieval_engine.hpp"
#include "service_error.hpp"

using json = nlohmann::json;
namespace sa = support_assistant;

class SupportServer {
public:
    explicit SupportServer(sa::ServiceConfig config)
        : config_(std::move(config)),
          logs_(std::make_shared<sa::LogManager>())
    {
        knowledge_base_ = config_.knowledge_base_path.empty()
            ? sa::KnowledgeBase::sample(config_.organization_name)
            : sa::KnowledgeBase::load_json(config_.knowledge_base_path, config_.organization_name);

        auto client = std::make_shared<sa::CompletionClient>(config_, std::make_shared<sa::CprTransport>());
        chat_service_ = std::make_shared<sa::ChatService>(config_, knowledge_base_, client, logs_);
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Support assistant listening on {}:{} ({} knowledge chunks)",
                     config_.host, config_.port, knowledge_base_->size());
        return server_.listen(config_.host, config_.port);
    }

private:
    sa::ServiceConfig config_;
    httplib::Server server_;
    std::shared_ptr<sa::LogManager> logs_;
    std::shared_ptr<const sa::KnowledgeBase> knowledge_base_;
    std::shared_ptr<sa::ChatService> chat_service_;

    static void send_error(httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(json{{"error", message}}.dump(), "application/json");
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "authorization, x-client-info, apikey, content-type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_chat(req, res);
        });

        server_.Post("/retrieve", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_retrieve(req, res);
        });

        server_.Get("/categories", [this](const httplib::Request& req, httplib::Response& res) {
            json categories = json::array();
            for (auto c : knowledge_base_->categories()) {
                categories.push_back(sa::category_name(c));
            }
            json body = {{"categories", categories}};
            if (req.has_param("q")) {
                auto terms = sa::QueryTokenizer::extract_terms(req.get_param_value("q"));
                auto type = sa::RetrievalEngine::classify_question_type(terms);
                body["question_type"] = type ? json(sa::category_name(*type)) : json(nullptr);
            }
            res.set_content(body.dump(), "application/json");
        });

        server_.Get("/api/admin/logs", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(json{{"logs", logs_->get_logs_json()}}.dump(), "application/json");
        });
    }

    void handle_chat(const httplib::Request& req, httplib::Response& res) {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            spdlog::error("[chat] Malformed request body");
            send_error(res, 400, "Invalid JSON body");
            return;
        }

        try {
            sa::ChatRequest request = sa::ChatRequest::from_json(body);
            sa::ChatReply reply = chat_service_->answer(request);
            res.set_content(json{
                {"reply", reply.reply},
                {"hasContext", reply.has_context},
                {"model", reply.model}
            }.dump(), "application/json");

        } catch (const sa::ServiceError& e) {
            send_error(res, e.status(), e.user_message());
        } catch (const std::exception& e) {
            spdlog::error("[chat] Error: {}", e.what());
            auto wrapped = sa::ServiceError::unknown(e.what());
            send_error(res, wrapped.status(), wrapped.user_message());
        }
    }

    void handle_retrieve(const httplib::Request& req, httplib::Response& res) {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("query") || !body["query"].is_string()) {
            send_error(res, 400, "query is required");
            return;
        }

        try {
            std::string query = body["query"].get<std::string>();
            const auto& engine = chat_service_->retriever();
            std::vector<sa::RetrievalResult> results;
            if (!body.contains("topK") && !body.contains("minScore")) {
                results = engine.lookup(query);
            } else {
                int top_k = body.value("topK", sa::RetrievalEngine::kDefaultTopK);
                double min_score = body.value("minScore", sa::RetrievalEngine::kDefaultMinScore);
                results = engine.retrieve(query, top_k, min_score);
            }

            json candidates = json::array();
            for (const auto& r : results) {
                candidates.push_back({
                    {"id", r.chunk->id},
                    {"title", r.chunk->title},
                    {"category", sa::category_name(r.chunk->category)},
                    {"score", r.score},
                    {"matched_terms", r.matched_terms}
                });
            }
            res.set_content(json{{"results", candidates}}.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("❌ Retrieval request error: {}", e.what());
            send_error(res, 400, "Invalid retrieval request");
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path = argc > 1 ? argv[1] : "";
    sa::ServiceConfig config = sa::ConfigManager::load(config_path);
    spdlog::set_level(sa::ConfigManager::log_level(config.log_level));

    try {
        SupportServer server(config);
        if (!server.run()) {
            spdlog::error("❌ Failed to bind {}:{}", config.host, config.port);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("💥 Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
