/**
 * @file types.cpp
 * @brief Enum names, chunk references and JSON encodings
 */

#include <core/types.hpp>
#include <stdexcept>

namespace Repealer {

const char* to_string(SectionType t) {
    switch (t) {
        case SectionType::Purpose: return "purpose";
        case SectionType::Notes:   return "notes";
        case SectionType::Table:   return "table";
        case SectionType::Figure:  return "figure";
        case SectionType::General: return "general";
    }
    return "general";
}

const char* to_string(Severity s) {
    switch (s) {
        case Severity::High:   return "HIGH";
        case Severity::Medium: return "MEDIUM";
        case Severity::Low:    return "LOW";
    }
    return "MEDIUM";
}

const char* to_string(VerdictStatus s) {
    switch (s) {
        case VerdictStatus::Repealable:        return "REPEALABLE";
        case VerdictStatus::ReviewRecommended: return "REVIEW_RECOMMENDED";
        case VerdictStatus::ValidInfraction:   return "VALID_INFRACTION";
    }
    return "VALID_INFRACTION";
}

SectionType section_type_from_string(const std::string& name) {
    if (name == "purpose") return SectionType::Purpose;
    if (name == "notes")   return SectionType::Notes;
    if (name == "table")   return SectionType::Table;
    if (name == "figure")  return SectionType::Figure;
    if (name == "general") return SectionType::General;
    throw std::invalid_argument("Unknown section type: " + name);
}

std::string SpecChunk::reference() const {
    std::string ref;
    if (document_number) {
        ref = "Document " + *document_number;
        if (revision) ref += " Rev. #" + *revision;
    } else {
        ref = source;
    }
    ref += " p." + std::to_string(page);
    return ref;
}

AnalysisSummary summarize(const std::vector<RepealVerdict>& verdicts, double high_confidence_cutoff) {
    AnalysisSummary s;
    s.total = verdicts.size();
    double sum = 0.0;
    for (const auto& v : verdicts) {
        switch (v.status) {
            case VerdictStatus::Repealable:        ++s.repealable; break;
            case VerdictStatus::ReviewRecommended: ++s.review; break;
            case VerdictStatus::ValidInfraction:   ++s.valid; break;
        }
        if (v.confidence >= high_confidence_cutoff) ++s.high_confidence;
        sum += v.confidence;
    }
    if (s.total > 0) s.average_confidence = sum / static_cast<double>(s.total);
    return s;
}

void to_json(nlohmann::json& j, const SpecChunk& c) {
    j = nlohmann::json{
        {"text", c.text},
        {"source", c.source},
        {"page", c.page},
        {"section_type", to_string(c.section_type)}
    };
    if (c.document_number) j["document_number"] = *c.document_number;
    if (c.revision) j["revision"] = *c.revision;
    if (!c.content_hash.empty()) j["content_hash"] = c.content_hash;
}

void from_json(const nlohmann::json& j, SpecChunk& c) {
    c.text = j.at("text").get<std::string>();
    c.source = j.at("source").get<std::string>();
    c.page = j.at("page").get<uint32_t>();
    c.section_type = section_type_from_string(j.at("section_type").get<std::string>());
    c.document_number.reset();
    c.revision.reset();
    if (j.contains("document_number")) c.document_number = j["document_number"].get<std::string>();
    if (j.contains("revision")) c.revision = j["revision"].get<std::string>();
    c.content_hash = j.value("content_hash", std::string());
}

void to_json(nlohmann::json& j, const Infraction& inf) {
    j = nlohmann::json{
        {"text", inf.raw_text},
        {"severity", to_string(inf.severity)},
        {"position", inf.position}
    };
    j["category"] = inf.category ? nlohmann::json(*inf.category) : nlohmann::json(nullptr);
    j["document_ref"] = inf.document_ref ? nlohmann::json(*inf.document_ref) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const RepealVerdict& v) {
    nlohmann::json trace = nlohmann::json::array();
    for (const auto& t : v.trace) {
        trace.push_back({{"stage", t.stage}, {"confidence", t.confidence}});
    }
    j = nlohmann::json{
        {"infraction", v.infraction},
        {"status", to_string(v.status)},
        {"confidence", v.confidence},
        {"match_count", v.match_count},
        {"reasons", v.reasons},
        {"spec_references", v.spec_references},
        {"trace", trace}
    };
}

void to_json(nlohmann::json& j, const IngestResult& r) {
    j = nlohmann::json{
        {"chunks_added", r.chunks_added},
        {"total_chunks", r.total_chunks},
        {"duplicate", r.duplicate},
        {"cancelled", r.cancelled},
        {"content_hash", r.content_hash}
    };
}

void to_json(nlohmann::json& j, const AnalysisSummary& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"repealable", s.repealable},
        {"review_recommended", s.review},
        {"valid", s.valid},
        {"high_confidence", s.high_confidence},
        {"average_confidence", s.average_confidence}
    };
}

void to_json(nlohmann::json& j, const AuditReport& r) {
    j = nlohmann::json{
        {"name", r.name},
        {"status", r.error ? "failed" : "analyzed"}
    };
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["verdicts"] = r.verdicts;
        j["summary"] = r.summary;
    }
}

} // namespace Repealer
