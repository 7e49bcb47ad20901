#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <map>
#include "ConfigManager.hpp"

using namespace support_assistant;

namespace {

class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_(::testing::TempDir() + name) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

ConfigManager::EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const char* key) -> const char* {
        auto it = values.find(key);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(ConfigManagerTest, DefaultsWithoutFileOrEnvironment) {
    ServiceConfig config;
    ConfigManager::apply_env(config, fake_env({}));

    EXPECT_EQ(config.api_url, "https://openrouter.ai/api/v1/chat/completions");
    EXPECT_EQ(config.model, "mistralai/mistral-7b-instruct:free");
    EXPECT_TRUE(config.api_key.empty());
    EXPECT_EQ(config.max_tokens, 500);
    EXPECT_DOUBLE_EQ(config.temperature, 0.3);
    EXPECT_EQ(config.timeout_ms, 30000);
    EXPECT_EQ(config.max_history, 6u);
    EXPECT_EQ(config.top_k, 4);
    EXPECT_DOUBLE_EQ(config.min_score, 2.0);
    EXPECT_EQ(config.port, 5002);
}

TEST(ConfigManagerTest, ExplicitFileIsRead) {
    TempFile file("support_config_read.json", R"({
        "api_key": "sk-file",
        "organization_name": "NovaTech",
        "timeout_ms": 1200,
        "top_k": 2,
        "port": 8080
    })");
    ServiceConfig config = ConfigManager::load(file.path(), fake_env({}));

    EXPECT_EQ(config.api_key, "sk-file");
    EXPECT_EQ(config.organization_name, "NovaTech");
    EXPECT_EQ(config.timeout_ms, 1200);
    EXPECT_EQ(config.top_k, 2);
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.model, "mistralai/mistral-7b-instruct:free");
}

TEST(ConfigManagerTest, EnvironmentOverridesFile) {
    TempFile file("support_config_env.json", R"({"api_key": "sk-file", "model": "file/model"})");
    ServiceConfig config = ConfigManager::load(file.path(), fake_env({
        {"OPENROUTER_API_KEY", "sk-env"},
        {"OPENROUTER_MODEL", ""},
        {"SUPPORT_COMPANY_NAME", "Acme"}
    }));

    EXPECT_EQ(config.api_key, "sk-env");
    EXPECT_EQ(config.model, "file/model");
    EXPECT_EQ(config.organization_name, "Acme");
}

TEST(ConfigManagerTest, MalformedFileKeepsDefaults) {
    TempFile file("support_config_broken.json", "{ not json");
    ServiceConfig config = ConfigManager::load(file.path(), fake_env({}));

    EXPECT_TRUE(config.api_key.empty());
    EXPECT_EQ(config.organization_name, "Our Company");
}

TEST(ConfigManagerTest, TypeErrorLeavesEveryFieldUntouched) {
    TempFile file("support_config_partial.json", R"({"api_key": "k", "max_tokens": "lots"})");
    ServiceConfig config = ConfigManager::load(file.path(), fake_env({}));

    EXPECT_TRUE(config.api_key.empty());
    EXPECT_EQ(config.max_tokens, 500);
}

TEST(ConfigManagerTest, NonPositiveTimeoutIsRejected) {
    for (long bad : {0L, -250L}) {
        ServiceConfig config;
        config.timeout_ms = 4000;
        ConfigManager::apply_json(config, nlohmann::json{{"timeout_ms", bad}, {"model", "m"}});
        EXPECT_EQ(config.timeout_ms, 4000) << bad;
        EXPECT_EQ(config.model, "m");
    }

    TempFile file("support_config_timeout.json", R"({"timeout_ms": 0})");
    EXPECT_EQ(ConfigManager::load(file.path(), fake_env({})).timeout_ms, ServiceConfig::kDefaultTimeoutMs);
}

TEST(ConfigManagerTest, UnknownLogLevelFallsBackToInfo) {
    EXPECT_EQ(ConfigManager::log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(ConfigManager::log_level("off"), spdlog::level::off);
    EXPECT_EQ(ConfigManager::log_level("verbose"), spdlog::level::info);
    EXPECT_EQ(ConfigManager::log_level(""), spdlog::level::info);
}
