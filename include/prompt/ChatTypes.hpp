#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace support_assistant {

enum class Role { System, User, Assistant };

inline const char* role_name(Role role) {
    switch (role) {
        case Role::System:    return "system";
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

inline std::optional<Role> parse_role(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    return std::nullopt;
}

struct ChatMessage {
    Role role = Role::User;
    std::string content;
};

inline bool operator==(const ChatMessage& a, const ChatMessage& b) {
    return a.role == b.role && a.content == b.content;
}

// Wire shape used by the completion service: {"role": "...", "content": "..."}
inline void to_json(nlohmann::json& j, const ChatMessage& m) {
    j = nlohmann::json{{"role", role_name(m.role)}, {"content", m.content}};
}

} // namespace support_assistant
