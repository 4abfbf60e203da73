/**
 * @file infraction_extractor.hpp
 * @brief Audit text → ordered, de-duplicated candidate infractions
 *
 * Two passes over the audit lines:
 *   1. Structured: a line opening with a keyword ("Go-back #3: ...",
 *      "Violation - ...") starts a capture that runs over the following lines
 *      until a blank line or the next keyword-prefixed line.
 *   2. Keyword scan: any line not covered by pass 1 that mentions an infraction
 *      or category keyword is captured whole.
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace Repealer {

struct ExtractionParams {
    std::vector<std::string> keywords = EngineConfig::default_infraction_keywords();
    std::vector<std::string> category_keywords = EngineConfig::default_category_keywords();
    uint32_t min_chars = 20;
    uint32_t max_chars = 1000;
    uint32_t max_infractions = 100;

    static ExtractionParams from_config(const EngineConfig& config);
};

/// "keyword: description" opened by a keyword-prefixed line
struct KeywordCapture {
    std::string keyword;
    std::string description;
    size_t position = 0;
};

/// A whole line that mentions a keyword somewhere
struct LineCapture {
    std::string line;
    size_t position = 0;
};

using Capture = std::variant<KeywordCapture, LineCapture>;

class REPEALER_API InfractionExtractor {
public:
    explicit InfractionExtractor(ExtractionParams params = ExtractionParams());

    /**
     * @brief Extract infractions in order of first occurrence.
     * @throws EmptyDocumentError if audit_text is empty after trimming
     */
    std::vector<Infraction> extract(const std::string& audit_text) const;

    /// Raw captures of both passes, unfiltered, in pass order.
    std::vector<Capture> capture(const std::string& audit_text) const;

    static Severity classify_severity(const std::string& text);
    static std::optional<std::string> find_document_ref(const std::string& text);

private:
    std::optional<Infraction> to_infraction(const Capture& capture) const;

    ExtractionParams params_;
    std::regex structured_;
    std::vector<std::string> scan_terms_;   // lower-cased keywords + category keywords
};

} // namespace Repealer
