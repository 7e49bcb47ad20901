#pragma once
#include <cstdlib>
#include <fstream>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace support_assistant {

struct ServiceConfig {
    static constexpr long kDefaultTimeoutMs = 30000;

    // Completion service
    std::string api_url = "https://openrouter.ai/api/v1/chat/completions";
    std::string api_key;
    std::string model = "mistralai/mistral-7b-instruct:free";
    std::string referer = "https://faytech-support.lovable.app";
    std::string organization_name = "Our Company";
    int max_tokens = 500;
    double temperature = 0.3;
    long timeout_ms = kDefaultTimeoutMs; // must stay positive: curl treats 0 as no deadline

    // Prompt and retrieval
    size_t max_history = 6;
    int top_k = 4;
    double min_score = 2.0;
    std::string knowledge_base_path; // empty: built-in sample corpus

    // Host
    std::string host = "127.0.0.1";
    int port = 5002;
    std::string log_level = "info";
};

class ConfigManager {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    // Reads the first config.json found (explicit path first), then applies
    // environment overrides. A missing or broken file leaves the defaults.
    static ServiceConfig load(const std::string& explicit_path = "", const EnvLookup& env = process_env) {
        ServiceConfig config;

        std::vector<std::string> search_paths;
        if (!explicit_path.empty()) search_paths.push_back(explicit_path);
        search_paths.insert(search_paths.end(), {
            "config.json",          // 1. Current Working Directory
            "../config.json",       // 2. Parent Directory (running from build/)
            "build/config.json",    // 3. Build Directory
            "data/config.json"      // 4. Sample location
        });

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
            f.clear();
        }

        if (found_path.empty()) {
            spdlog::warn("⚠️ config.json not found, using defaults");
        } else {
            try {
                apply_json(config, nlohmann::json::parse(f));
                spdlog::info("⚙️  Config loaded from {}", found_path);
            } catch (const std::exception& e) {
                spdlog::error("💥 Failed to parse config {}: {}", found_path, e.what());
            }
        }

        apply_env(config, env);
        return config;
    }

    static const char* process_env(const char* key) { return std::getenv(key); }

    // All or nothing: a type error leaves config untouched.
    static void apply_json(ServiceConfig& config, const nlohmann::json& j) {
        ServiceConfig next = config;
        next.api_url = j.value("api_url", next.api_url);
        next.api_key = j.value("api_key", next.api_key);
        next.model = j.value("model", next.model);
        next.referer = j.value("referer", next.referer);
        next.organization_name = j.value("organization_name", next.organization_name);
        next.max_tokens = j.value("max_tokens", next.max_tokens);
        next.temperature = j.value("temperature", next.temperature);
        next.timeout_ms = j.value("timeout_ms", next.timeout_ms);
        next.max_history = j.value("max_history", next.max_history);
        next.top_k = j.value("top_k", next.top_k);
        next.min_score = j.value("min_score", next.min_score);
        next.knowledge_base_path = j.value("knowledge_base_path", next.knowledge_base_path);
        next.host = j.value("host", next.host);
        next.port = j.value("port", next.port);
        next.log_level = j.value("log_level", next.log_level);

        if (next.timeout_ms <= 0) {
            spdlog::warn("⚠️ timeout_ms must be positive (got {}), keeping {} ms", next.timeout_ms, config.timeout_ms);
            next.timeout_ms = config.timeout_ms;
        }
        config = std::move(next);
    }

    // spdlog maps unknown names to "off"; only an explicit "off" silences logging.
    static spdlog::level::level_enum log_level(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            spdlog::warn("⚠️ Unknown log_level '{}', using info", name);
            return spdlog::level::info;
        }
        return level;
    }

    static void apply_env(ServiceConfig& config, const EnvLookup& env) {
        auto override_with = [&](const char* key, std::string& target) {
            const char* v = env(key);
            if (v && *v) target = v;
        };
        override_with("OPENROUTER_API_KEY", config.api_key);
        override_with("OPENROUTER_API_URL", config.api_url);
        override_with("OPENROUTER_MODEL", config.model);
        override_with("SUPPORT_COMPANY_NAME", config.organization_name);

        if (config.api_key.empty()) {
            spdlog::warn("⚠️ OPENROUTER_API_KEY is not set; chat requests will fail until it is configured");
        }
    }
};

} // namespace support_assistant
