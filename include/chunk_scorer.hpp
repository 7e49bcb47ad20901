#pragma once
#include <memory>
#include <string>
#include <vector>
#include "knowledge_base.hpp"
#include "query_tokenizer.hpp"

namespace support_assistant {

struct RetrievalResult {
    std::shared_ptr<const KnowledgeChunk> chunk;
    double score = 0.0;
    std::vector<std::string> matched_terms;
};

// Weighted lexical overlap: keyword hit +3, title hit +2, content hit +1,
// plus 0.5 per distinct matched term.
class ChunkScorer {
public:
    static constexpr double kKeywordWeight = 3.0;
    static constexpr double kTitleWeight = 2.0;
    static constexpr double kContentWeight = 1.0;
    static constexpr double kBreadthBonus = 0.5;

    static RetrievalResult score(const std::shared_ptr<const KnowledgeChunk>& chunk, const TermSet& terms);

    // Bidirectional substring containment, so "price" matches "pricing" and
    // "websites" matches "website". Short terms may match unrelated keywords.
    static bool terms_overlap(const std::string& term, const std::string& keyword);
};

} // namespace support_assistant
