#include "chunk_scorer.hpp"
#include <algorithm>
#include <cctype>

namespace support_assistant {

namespace {

std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void record_match(std::vector<std::string>& matched, const std::string& term) {
    if (std::find(matched.begin(), matched.end(), term) == matched.end()) {
        matched.push_back(term);
    }
}

} // namespace

bool ChunkScorer::terms_overlap(const std::string& term, const std::string& keyword) {
    return keyword.find(term) != std::string::npos || term.find(keyword) != std::string::npos;
}

RetrievalResult ChunkScorer::score(const std::shared_ptr<const KnowledgeChunk>& chunk, const TermSet& terms) {
    RetrievalResult result;
    result.chunk = chunk;

    // 1. Keywords: each term counts once, however many keywords it hits
    for (const auto& term : terms) {
        for (const auto& keyword : chunk->keywords) {
            if (terms_overlap(term, keyword)) {
                result.score += kKeywordWeight;
                record_match(result.matched_terms, term);
                break;
            }
        }
    }

    // 2. Title
    const std::string title = lowercase(chunk->title);
    for (const auto& term : terms) {
        if (title.find(term) != std::string::npos) {
            result.score += kTitleWeight;
            record_match(result.matched_terms, term);
        }
    }

    // 3. Content
    const std::string content = lowercase(chunk->content);
    for (const auto& term : terms) {
        if (content.find(term) != std::string::npos) {
            result.score += kContentWeight;
            record_match(result.matched_terms, term);
        }
    }

    result.score += kBreadthBonus * static_cast<double>(result.matched_terms.size());
    return result;
}

} // namespace support_assistant
