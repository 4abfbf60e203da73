/**
 * @file infraction_extractor.cpp
 * @brief Structured and keyword-scan infraction capture
 */

#include <analysis/infraction_extractor.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <unordered_set>

namespace Repealer {

namespace {

const auto k_icase = std::regex::ECMAScript | std::regex::icase;

std::string escape_regex(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{}/)";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

struct Line {
    size_t offset;
    std::string text;
};

std::vector<Line> split_lines(const std::string& text) {
    std::vector<Line> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) nl = text.size();
        std::string line = text.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back({pos, std::move(line)});
        pos = nl + 1;
    }
    return lines;
}

size_t capture_position(const Capture& c) {
    return std::visit([](const auto& cap) { return cap.position; }, c);
}

std::string capture_text(const Capture& c) {
    struct Visitor {
        std::string operator()(const KeywordCapture& k) const {
            return k.description.empty() ? std::string() : k.keyword + ": " + k.description;
        }
        std::string operator()(const LineCapture& l) const { return l.line; }
    };
    return std::visit(Visitor{}, c);
}

} // namespace

ExtractionParams ExtractionParams::from_config(const EngineConfig& config) {
    ExtractionParams p;
    p.keywords = config.infraction_keywords;
    p.category_keywords = config.category_keywords;
    p.min_chars = config.min_infraction_chars;
    p.max_chars = config.max_infraction_chars;
    p.max_infractions = config.max_infractions;
    return p;
}

InfractionExtractor::InfractionExtractor(ExtractionParams params) : params_(std::move(params)) {
    std::vector<std::string> keywords;
    for (const auto& k : params_.keywords) {
        std::string t = trim(k);
        if (!t.empty()) keywords.push_back(t);
    }
    if (keywords.empty()) throw ConfigError("At least one infraction keyword is required");

    // Longest first so "non-compliance" wins over "non-compliant" in the alternation
    std::sort(keywords.begin(), keywords.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string alternation;
    for (const auto& k : keywords) {
        if (!alternation.empty()) alternation.push_back('|');
        alternation += escape_regex(k);
    }
    // Prefix only: the description is the match suffix. Bounded repeats keep the
    // recursive std::regex matcher shallow on very long lines.
    structured_ = std::regex(R"((?:[-*]\s{1,8})?()" + alternation + R"()\s{0,32}(?:#\s{0,8}\d{1,9})?\s{0,32}[:\-])",
                             k_icase);

    for (const auto& k : keywords) scan_terms_.push_back(to_lower(k));
    for (const auto& k : params_.category_keywords) {
        std::string t = to_lower(trim(k));
        if (!t.empty()) scan_terms_.push_back(t);
    }
}

Severity InfractionExtractor::classify_severity(const std::string& text) {
    static const std::regex high(R"(\b(?:safety|critical|hazard(?:ous)?|immediate(?:ly)?)\b)", k_icase);
    static const std::regex low(R"(\b(?:minor|cosmetic|optional)\b)", k_icase);
    if (std::regex_search(text, high)) return Severity::High;
    if (std::regex_search(text, low)) return Severity::Low;
    return Severity::Medium;
}

std::optional<std::string> InfractionExtractor::find_document_ref(const std::string& text) {
    static const std::regex ref(R"(\b(?:per|according\s+to|ref\.?|document|spec)\s*#?\s*(\d{5,6})\b)", k_icase);
    std::smatch m;
    if (std::regex_search(text, m, ref) && m[1].matched) return m[1].str();
    return std::nullopt;
}

std::vector<Capture> InfractionExtractor::capture(const std::string& audit_text) const {
    const auto lines = split_lines(audit_text);
    std::vector<bool> covered(lines.size(), false);
    std::vector<Capture> captures;

    auto match_prefix = [this](const std::string& line, std::smatch& m) {
        return std::regex_search(line, m, structured_, std::regex_constants::match_continuous);
    };

    // Pass 1: keyword-prefixed blocks
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string line = trim(lines[i].text);
        std::smatch m;
        if (!match_prefix(line, m)) continue;

        KeywordCapture cap;
        cap.keyword = trim(m[1].str());
        cap.position = lines[i].offset;
        std::string description = trim(m.suffix().str());
        covered[i] = true;

        size_t j = i + 1;
        for (; j < lines.size(); ++j) {
            const std::string next = trim(lines[j].text);
            std::smatch n;
            if (next.empty() || match_prefix(next, n)) break;
            if (!description.empty()) description.push_back(' ');
            description += next;
            covered[j] = true;
        }
        cap.description = std::move(description);
        captures.emplace_back(std::move(cap));
        i = j - 1;
    }

    // Pass 2: any remaining line that mentions a keyword
    for (size_t i = 0; i < lines.size(); ++i) {
        if (covered[i]) continue;
        std::string lower = to_lower(lines[i].text);
        bool hit = std::any_of(scan_terms_.begin(), scan_terms_.end(),
                               [&](const std::string& term) { return contains_word_ci(lower, term); });
        if (hit) captures.emplace_back(LineCapture{trim(lines[i].text), lines[i].offset});
    }
    return captures;
}

std::optional<Infraction> InfractionExtractor::to_infraction(const Capture& capture) const {
    std::string text = collapse_whitespace(capture_text(capture));
    if (text.empty()) return std::nullopt;

    const size_t length = utf8_to_utf32(text).size();
    if (length < params_.min_chars || length > params_.max_chars) return std::nullopt;

    Infraction inf;
    inf.normalized_text = to_lower(text);
    inf.severity = classify_severity(text);
    inf.document_ref = find_document_ref(text);
    inf.position = capture_position(capture);
    for (const auto& k : params_.category_keywords) {
        std::string key = to_lower(trim(k));
        if (contains_ci(inf.normalized_text, key)) {
            inf.category = key;
            inf.category_flagged = true;
            break;
        }
    }
    inf.raw_text = std::move(text);
    return inf;
}

std::vector<Infraction> InfractionExtractor::extract(const std::string& audit_text) const {
    if (trim(audit_text).empty()) throw EmptyDocumentError("Audit text is empty");

    auto captures = capture(audit_text);
    std::stable_sort(captures.begin(), captures.end(), [](const Capture& a, const Capture& b) {
        return capture_position(a) < capture_position(b);
    });

    std::vector<Infraction> out;
    std::unordered_set<std::string> seen;
    size_t filtered = 0;
    for (const auto& c : captures) {
        auto inf = to_infraction(c);
        if (!inf) { ++filtered; continue; }
        if (!seen.insert(inf->normalized_text).second) continue;
        out.push_back(std::move(*inf));
        if (out.size() >= params_.max_infractions) {
            Logger::warn("Infraction cap of " + std::to_string(params_.max_infractions) + " reached");
            break;
        }
    }

    Logger::debug("Extracted " + std::to_string(out.size()) + " infractions from " +
                  std::to_string(captures.size()) + " captures (" + std::to_string(filtered) +
                  " outside the length window)");
    return out;
}

} // namespace Repealer
