#include "knowledge_base.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace support_assistant {

using json = nlohmann::json;

namespace {

const char* kCompanyPlaceholder = "{company}";

std::string substitute_company(std::string text, const std::string& organization_name) {
    const std::string placeholder = kCompanyPlaceholder;
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), organization_name);
        pos += organization_name.size();
    }
    return text;
}

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct SampleEntry {
    const char* id;
    const char* title;
    Category category;
    const char* content;
    std::vector<std::string> keywords;
};

const std::vector<SampleEntry>& sample_entries() {
    static const std::vector<SampleEntry> entries = {
        {"services-overview", "Services Offered", Category::Services,
         R"({company} provides the following services:
- Custom website development
- Web application development
- SaaS MVP development
- AI-powered chatbot integration
- Internal business tools
- API development and integration
- Maintenance and technical support
- UI/UX implementation from design files

We work primarily with modern web technologies such as JavaScript, React, Node.js, and cloud-based solutions.)",
         {"services", "website", "web", "application", "saas", "mvp", "chatbot", "ai", "tools", "api",
          "maintenance", "support", "ui", "ux", "design", "javascript", "react", "node", "cloud",
          "development", "build", "create", "offer", "provide", "what", "do", "you"}},

        {"support-hours", "Customer Support Hours", Category::Support,
         R"(Our customer support team is available:
- Monday to Friday
- From 9:00 AM to 6:00 PM (UTC)

Support requests submitted outside business hours are processed the next business day.)",
         {"support", "hours", "time", "available", "availability", "monday", "friday", "business", "contact",
          "when", "open", "schedule", "utc", "customer", "help", "reach", "working"}},

        {"pricing-billing", "Pricing & Billing", Category::Pricing,
         R"({company} offers flexible pricing models depending on the project:
- Fixed-price projects for clearly defined scopes
- Hourly billing for ongoing or evolving projects
- Monthly maintenance plans for long-term clients

Invoices are issued at the beginning or end of each billing cycle, depending on the agreement. Payments are accepted via bank transfer or online payment platforms.)",
         {"pricing", "price", "cost", "billing", "invoice", "payment", "pay", "fixed", "hourly", "monthly",
          "rate", "charge", "fee", "money", "budget", "quote", "estimate", "bank", "transfer", "how", "much"}},

        {"project-process", "Project Process & Workflow", Category::Process,
         R"(Our typical project workflow includes:
1. Initial consultation and requirement gathering
2. Proposal and timeline approval
3. Design and development phase
4. Testing and quality assurance
5. Deployment and delivery
6. Post-launch support and maintenance

Clients are kept informed throughout the project with regular updates.)",
         {"project", "process", "workflow", "steps", "phases", "consultation", "requirements", "proposal",
          "timeline", "design", "development", "testing", "qa", "quality", "deployment", "delivery", "launch",
          "updates", "how", "work", "start", "begin", "stages"}},

        {"technical-support", "Technical Support & Maintenance", Category::Support,
         R"(We provide ongoing technical support after project delivery. This includes:
- Bug fixes
- Security updates
- Performance improvements
- Minor feature enhancements

Maintenance plans are available on a monthly basis and can be customized to client needs.)",
         {"technical", "support", "maintenance", "bug", "fix", "security", "update", "performance",
          "enhancement", "monthly", "plan", "ongoing", "after", "delivery", "help", "issue", "problem", "error"}},

        {"ai-chatbot-services", "AI Chatbot Services", Category::Services,
         R"({company} offers AI-powered chatbot solutions that help businesses:
- Answer customer questions automatically
- Reduce support workload
- Provide 24/7 assistance
- Improve response time and customer satisfaction

Our chatbots can be trained on company-specific documents such as FAQs, policies, and internal documentation.)",
         {"ai", "chatbot", "bot", "artificial", "intelligence", "automation", "automatic", "24/7", "questions",
          "answers", "support", "customer", "train", "training", "documents", "faq", "assistant"}},

        {"data-privacy-security", "Data Privacy & Security", Category::Security,
         R"(We take data privacy seriously.
- Client data is never shared with third parties
- All data is processed securely
- Access to internal systems is restricted
- AI systems are configured to use only approved data sources

We comply with general data protection principles and best practices.)",
         {"data", "privacy", "security", "secure", "protection", "gdpr", "confidential", "safe", "third",
          "party", "access", "restricted", "compliance", "information", "private"}},

        {"account-access", "Account & Access Credentials", Category::Security,
         R"(Clients receive secure access credentials for any systems developed by {company}.

It is the client's responsibility to keep login credentials confidential. {company} is not responsible for issues caused by unauthorized access due to credential sharing.)",
         {"account", "access", "credentials", "login", "password", "secure", "responsibility", "unauthorized",
          "sharing", "confidential", "username"}},

        {"faq-redesign", "FAQ: Website Redesign", Category::FAQ,
         R"(Q: Do you offer website redesign services?

Yes, we redesign existing websites to improve performance, usability, and modern design standards.)",
         {"redesign", "website", "existing", "improve", "update", "refresh", "modernize", "revamp", "old",
          "current", "remake", "offer"}},

        {"faq-api-integration", "FAQ: Third-Party API Integration", Category::FAQ,
         R"(Q: Can you integrate third-party APIs?

Yes, we regularly integrate payment gateways, CRM systems, and external APIs.)",
         {"api", "integration", "integrate", "third-party", "payment", "gateway", "crm", "external", "connect",
          "stripe", "paypal", "system"}},

        {"faq-mobile-app", "FAQ: Mobile App Development", Category::FAQ,
         R"(Q: Do you provide mobile app development?

Our primary focus is web applications. Mobile apps may be developed using web-based technologies depending on requirements.)",
         {"mobile", "app", "application", "ios", "android", "phone", "smartphone", "pwa", "responsive", "native"}},

        {"faq-existing-maintenance", "FAQ: Existing Project Maintenance", Category::FAQ,
         R"(Q: Can you maintain an existing project?

Yes, we offer maintenance services for both projects developed by us and third-party systems.)",
         {"maintain", "maintenance", "existing", "project", "third-party", "legacy", "old", "current", "take",
          "over", "takeover"}},

        {"contracts-legal", "Contracts & Legal Agreements", Category::Legal,
         R"(All projects are governed by a service agreement that defines scope, timelines, pricing, and responsibilities.

Changes outside the original scope may require a revised agreement or additional charges.)",
         {"contract", "legal", "agreement", "scope", "timeline", "terms", "conditions", "responsibilities",
          "changes", "revision", "document", "sign", "nda"}},

        {"refunds-cancellations", "Refunds & Cancellations Policy", Category::Legal,
         R"(Refunds depend on the project stage:
- Work already completed is non-refundable
- Remaining unused hours or phases may be refundable
- Cancellations must be submitted in writing

Each case is reviewed individually.)",
         {"refund", "refunds", "cancel", "cancellation", "money", "back", "return", "policy", "completed",
          "unused", "writing", "stop"}},

        {"contact-info", "Contact Information", Category::Contact,
         R"(Clients can contact {company} via:
- Email support
- Contact forms on the website
- Scheduled video calls

Response time is typically within 24 business hours.)",
         {"contact", "email", "phone", "call", "reach", "message", "form", "video", "meeting", "response",
          "time", "how", "get", "touch", "talk", "speak"}},

        {"language-support", "Multi-Language Support", Category::Support,
         R"({company} supports clients in:
- English
- French

Documentation and communication can be provided in either language.)",
         {"language", "english", "french", "multilingual", "translation", "communication", "documentation",
          "speak", "parler", "français", "languages"}},
    };
    return entries;
}

} // namespace

const char* category_name(Category category) {
    switch (category) {
        case Category::Services: return "Services";
        case Category::Support:  return "Support";
        case Category::Pricing:  return "Pricing";
        case Category::Process:  return "Process";
        case Category::Security: return "Security";
        case Category::FAQ:      return "FAQ";
        case Category::Legal:    return "Legal";
        case Category::Contact:  return "Contact";
    }
    return "FAQ";
}

std::optional<Category> parse_category(const std::string& name) {
    static const Category all[] = {Category::Services, Category::Support, Category::Pricing, Category::Process,
                                   Category::Security, Category::FAQ,     Category::Legal,   Category::Contact};
    std::string wanted = to_lower_ascii(name);
    for (Category c : all) {
        if (to_lower_ascii(category_name(c)) == wanted) return c;
    }
    return std::nullopt;
}

json KnowledgeChunk::to_json() const {
    return json{
        {"id", id},
        {"title", title},
        {"category", category_name(category)},
        {"content", content},
        {"keywords", keywords}
    };
}

KnowledgeChunk KnowledgeChunk::from_json(const json& j) {
    KnowledgeChunk chunk;
    chunk.id = j.at("id").get<std::string>();
    chunk.title = j.at("title").get<std::string>();
    chunk.content = j.at("content").get<std::string>();

    std::string category = j.at("category").get<std::string>();
    auto parsed = parse_category(category);
    if (!parsed) {
        throw std::runtime_error("Unknown category '" + category + "' for chunk " + chunk.id);
    }
    chunk.category = *parsed;

    for (const auto& kw : j.value("keywords", json::array())) {
        std::string lowered = to_lower_ascii(kw.get<std::string>());
        if (!lowered.empty()) chunk.keywords.push_back(std::move(lowered));
    }
    return chunk;
}

KnowledgeBase::KnowledgeBase(std::vector<KnowledgeChunk> chunks) {
    chunks_.reserve(chunks.size());
    for (auto& chunk : chunks) {
        if (id_to_chunk_.count(chunk.id)) {
            throw std::runtime_error("Duplicate knowledge chunk id: " + chunk.id);
        }
        auto shared = std::make_shared<const KnowledgeChunk>(std::move(chunk));
        id_to_chunk_[shared->id] = shared;
        chunks_.push_back(std::move(shared));
    }
}

std::shared_ptr<const KnowledgeBase> KnowledgeBase::sample(const std::string& organization_name) {
    std::vector<KnowledgeChunk> chunks;
    for (const auto& entry : sample_entries()) {
        KnowledgeChunk chunk;
        chunk.id = entry.id;
        chunk.title = entry.title;
        chunk.category = entry.category;
        chunk.content = substitute_company(entry.content, organization_name);
        chunk.keywords = entry.keywords;
        chunks.push_back(std::move(chunk));
    }
    return std::make_shared<const KnowledgeBase>(std::move(chunks));
}

std::shared_ptr<const KnowledgeBase> KnowledgeBase::load_json(const std::string& path,
                                                              const std::string& organization_name) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Knowledge base not found: " + path);
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Knowledge base is not valid JSON (" + path + "): " + e.what());
    }

    const json& items = j.is_object() ? j.at("chunks") : j;
    if (!items.is_array()) {
        throw std::runtime_error("Knowledge base must be an array of chunks: " + path);
    }

    std::vector<KnowledgeChunk> chunks;
    for (const auto& item : items) {
        KnowledgeChunk chunk = KnowledgeChunk::from_json(item);
        chunk.content = substitute_company(chunk.content, organization_name);
        chunk.title = substitute_company(chunk.title, organization_name);
        chunks.push_back(std::move(chunk));
    }

    spdlog::info("📚 Knowledge base loaded: {} chunks from {}", chunks.size(), path);
    return std::make_shared<const KnowledgeBase>(std::move(chunks));
}

std::vector<Category> KnowledgeBase::categories() const {
    std::vector<Category> seen;
    for (const auto& chunk : chunks_) {
        if (std::find(seen.begin(), seen.end(), chunk->category) == seen.end()) {
            seen.push_back(chunk->category);
        }
    }
    return seen;
}

std::vector<std::shared_ptr<const KnowledgeChunk>> KnowledgeBase::by_category(Category category) const {
    std::vector<std::shared_ptr<const KnowledgeChunk>> out;
    for (const auto& chunk : chunks_) {
        if (chunk->category == category) out.push_back(chunk);
    }
    return out;
}

std::shared_ptr<const KnowledgeChunk> KnowledgeBase::find(const std::string& id) const {
    auto it = id_to_chunk_.find(id);
    return it == id_to_chunk_.end() ? nullptr : it->second;
}

} // namespace support_assistant
