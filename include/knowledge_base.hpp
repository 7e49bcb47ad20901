#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace support_assistant {

enum class Category { Services, Support, Pricing, Process, Security, FAQ, Legal, Contact };

const char* category_name(Category category);
std::optional<Category> parse_category(const std::string& name);

struct KnowledgeChunk {
    std::string id;
    std::string title;
    Category category = Category::FAQ;
    std::string content;
    std::vector<std::string> keywords; // lowercase, pre-extracted

    nlohmann::json to_json() const;
    static KnowledgeChunk from_json(const nlohmann::json& j);
};

// Immutable corpus, built once at startup and shared read-only by every request.
class KnowledgeBase {
public:
    explicit KnowledgeBase(std::vector<KnowledgeChunk> chunks);

    // Built-in support corpus with {company} replaced by organization_name.
    static std::shared_ptr<const KnowledgeBase> sample(const std::string& organization_name);
    static std::shared_ptr<const KnowledgeBase> load_json(const std::string& path, const std::string& organization_name);

    const std::vector<std::shared_ptr<const KnowledgeChunk>>& chunks() const { return chunks_; }
    size_t size() const { return chunks_.size(); }

    std::vector<Category> categories() const;
    std::vector<std::shared_ptr<const KnowledgeChunk>> by_category(Category category) const;
    std::shared_ptr<const KnowledgeChunk> find(const std::string& id) const;

private:
    std::vector<std::shared_ptr<const KnowledgeChunk>> chunks_;
    std::unordered_map<std::string, std::shared_ptr<const KnowledgeChunk>> id_to_chunk_;
};

} // namespace support_assistant
