#include "retrieval_engine.hpp"
#include "prompt/ContextFormatter.hpp"
#include <algorithm>
#include <chrono>
#include <utility>
#include <spdlog/spdlog.h>

namespace support_assistant {

namespace {

// Indicator terms per category, in evaluation order. The first category to
// reach the best count keeps it.
const std::vector<std::pair<Category, std::vector<std::string>>>& question_patterns() {
    static const std::vector<std::pair<Category, std::vector<std::string>>> patterns = {
        {Category::Services, {"services", "offer", "provide", "build", "develop", "create", "website", "web", "app",
                              "application", "saas", "mvp", "chatbot", "ai", "api", "ux", "ui"}},
        {Category::Pricing,  {"price", "cost", "pay", "pricing", "money", "billing", "invoice", "rate", "hourly",
                              "fixed", "budget", "quote", "estimate", "charge", "fee", "much"}},
        {Category::Support,  {"help", "support", "contact", "reach", "call", "email", "hours", "available", "when",
                              "time", "schedule", "language", "english", "french"}},
        {Category::Process,  {"process", "workflow", "steps", "phases", "start", "begin", "timeline", "project",
                              "stages", "consultation", "delivery"}},
        {Category::Security, {"security", "privacy", "data", "safe", "secure", "confidential", "access",
                              "credentials", "login", "password", "account", "gdpr"}},
        {Category::Legal,    {"refund", "cancel", "contract", "agreement", "legal", "terms", "scope", "policy",
                              "cancellation"}},
        {Category::FAQ,      {"redesign", "mobile", "app", "api", "integration", "maintain", "maintenance",
                              "existing", "third-party", "legacy"}},
    };
    return patterns;
}

std::string join_terms(const TermSet& terms) {
    std::string out;
    for (const auto& t : terms) {
        if (!out.empty()) out += ", ";
        out += t;
    }
    return out;
}

} // namespace

std::vector<RetrievalResult> RetrievalEngine::retrieve(
    const std::string& query,
    int top_k,
    double min_score) const
{
    auto start = std::chrono::high_resolution_clock::now();

    // 1. Terms
    TermSet terms = QueryTokenizer::extract_terms(query);
    if (terms.empty() || top_k <= 0) {
        return {};
    }

    // 2. Score and filter
    std::vector<RetrievalResult> results;
    for (const auto& chunk : knowledge_base_->chunks()) {
        RetrievalResult scored = ChunkScorer::score(chunk, terms);
        if (scored.score >= min_score) {
            results.push_back(std::move(scored));
        }
    }

    // 3. Sort and cap
    std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });

    if (results.size() > static_cast<size_t>(top_k)) {
        results.resize(top_k);
    }

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("⏱️ Retrieval Pipeline Time: {:.3f} ms ({} chunks scored)", duration, knowledge_base_->size());

    return results;
}

std::vector<RetrievalResult> RetrievalEngine::retrieve_for_answer(
    const std::string& query,
    int top_k,
    double min_score) const
{
    return retrieve(query, top_k, min_score);
}

std::vector<RetrievalResult> RetrievalEngine::lookup(const std::string& query) const {
    return retrieve(query, kDefaultTopK, kDefaultMinScore);
}

RetrievedContext RetrievalEngine::retrieve_context(
    const std::string& query,
    int top_k,
    double min_score) const
{
    auto results = retrieve_for_answer(query, top_k, min_score);

    RetrievedContext out;
    out.context = ContextFormatter::format(results);
    out.has_context = !results.empty();
    for (const auto& r : results) {
        out.chunks.push_back(r.chunk);
    }

    spdlog::info("[RAG] Query: \"{}\"", query);
    spdlog::info("[RAG] Keywords: {}", join_terms(QueryTokenizer::extract_terms(query)));
    spdlog::info("[RAG] Found {} relevant chunks", out.chunks.size());
    return out;
}

std::optional<Category> RetrievalEngine::classify_question_type(const TermSet& terms) {
    std::optional<Category> best_match;
    size_t best_score = 0;

    for (const auto& [category, indicators] : question_patterns()) {
        size_t match_count = 0;
        for (const auto& term : terms) {
            bool hit = std::any_of(indicators.begin(), indicators.end(), [&](const std::string& indicator) {
                return ChunkScorer::terms_overlap(term, indicator);
            });
            if (hit) ++match_count;
        }

        if (match_count > best_score) {
            best_score = match_count;
            best_match = category;
        }
    }
    return best_match;
}

} // namespace support_assistant
