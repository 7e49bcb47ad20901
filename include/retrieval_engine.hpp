#pragma once
#include "chunk_scorer.hpp"
#include "knowledge_base.hpp"
#include "query_tokenizer.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace support_assistant {

struct RetrievedContext {
    std::string context;
    bool has_context = false;
    std::vector<std::shared_ptr<const KnowledgeChunk>> chunks;
};

class RetrievalEngine {
public:
    static constexpr int kDefaultTopK = 3;
    static constexpr int kAnswerTopK = 4;
    static constexpr double kDefaultMinScore = 2.0;

    explicit RetrievalEngine(std::shared_ptr<const KnowledgeBase> knowledge_base)
        : knowledge_base_(std::move(knowledge_base)) {}

    // Scores every chunk, drops those below min_score and keeps the best top_k.
    // Equal scores keep corpus order.
    std::vector<RetrievalResult> retrieve(
        const std::string& query,
        int top_k = kDefaultTopK,
        double min_score = kDefaultMinScore
    ) const;

    // Ranking used to ground chat answers (top 4 by default).
    std::vector<RetrievalResult> retrieve_for_answer(
        const std::string& query,
        int top_k = kAnswerTopK,
        double min_score = kDefaultMinScore
    ) const;

    // Category-style lookups (top 3).
    std::vector<RetrievalResult> lookup(const std::string& query) const;

    // retrieve_for_answer plus the formatted context block.
    RetrievedContext retrieve_context(
        const std::string& query,
        int top_k = kAnswerTopK,
        double min_score = kDefaultMinScore
    ) const;

    static std::optional<Category> classify_question_type(const TermSet& terms);

    const KnowledgeBase& knowledge_base() const { return *knowledge_base_; }

private:
    std::shared_ptr<const KnowledgeBase> knowledge_base_;
};

} // namespace support_assistant
