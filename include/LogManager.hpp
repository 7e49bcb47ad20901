#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace support_assistant {

// One answered (or failed) chat call. Replies and history are not kept.
struct InteractionLog {
    long long timestamp;
    std::string organization;
    std::string user_query;
    int term_count;
    std::vector<std::string> chunk_ids;
    bool has_context;
    std::string model;
    int status;              // 200 or the ServiceError status
    std::string error_kind;  // empty on success
    double duration_ms;
};

class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) { // Keep last 50 only
            logs_.pop_front();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"organization", it->organization},
                {"user_query", it->user_query},
                {"term_count", it->term_count},
                {"chunk_ids", it->chunk_ids},
                {"has_context", it->has_context},
                {"model", it->model},
                {"status", it->status},
                {"error_kind", it->error_kind},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    std::deque<InteractionLog> logs_;
    mutable std::mutex mtx_;
};

}
