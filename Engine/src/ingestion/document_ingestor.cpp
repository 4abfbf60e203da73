/**
 * @file document_ingestor.cpp
 * @brief Section-aware chunking of spec documents
 */

#include <ingestion/document_ingestor.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <regex>

namespace Repealer {

namespace {

const auto k_icase = std::regex::ECMAScript | std::regex::icase;

const std::regex& purpose_header() {
    static const std::regex re(R"(^(?:\d+(?:\.\d+)*\.?\s+)?Purpose\s+and\s+Scope\b)", k_icase);
    return re;
}
const std::regex& notes_header() {
    static const std::regex re(R"(^(?:General\s+Notes?\b|Notes?\s*:))", k_icase);
    return re;
}
const std::regex& table_header() {
    static const std::regex re(R"(^Table\s+[A-Z]?\d+)", k_icase);
    return re;
}
const std::regex& figure_header() {
    static const std::regex re(R"(^(?:Figure|Fig\.)\s+[A-Z]?\d+)", k_icase);
    return re;
}
const std::regex& general_header() {
    static const std::regex re(R"(^(?:References?\s*:|References?\s*$|Section\s+\d+|Document\s+(?:No\.?\s*)?\d{5,6}\b|Rev\.?\s*#?\s*\d+\s*:))", k_icase);
    return re;
}
const std::regex& document_number_pattern() {
    static const std::regex re(R"(\bDocument\s+(?:No\.?\s*)?(\d{5,6})\b)", k_icase);
    return re;
}
const std::regex& revision_pattern() {
    static const std::regex re(R"(\bRev\.?\s*#?\s*(\d+))", k_icase);
    return re;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

} // namespace

ChunkingParams ChunkingParams::from_config(const EngineConfig& config) {
    ChunkingParams p;
    p.chunk_size = config.chunk_size;
    p.chunk_overlap = config.chunk_overlap;
    p.table_chunk_size = config.table_chunk_size;
    p.min_chunk_chars = config.min_chunk_chars;
    return p;
}

// ============================================================================
// PageMap
// ============================================================================

void DocumentIngestor::PageMap::add_page(size_t char_count, uint32_t page_number) {
    starts_.push_back(total_);
    numbers_.push_back(std::max<uint32_t>(page_number, 1));
    total_ += char_count;
}

uint32_t DocumentIngestor::PageMap::page_for_offset(size_t offset) const {
    if (starts_.empty()) return 1;
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    size_t idx = (it == starts_.begin()) ? 0 : static_cast<size_t>(it - starts_.begin()) - 1;
    return numbers_[idx];
}

// ============================================================================
// DocumentIngestor
// ============================================================================

DocumentIngestor::DocumentIngestor(const ChunkingParams& params) : params_(params) {
    if (params_.chunk_size == 0 || params_.chunk_overlap >= params_.chunk_size) {
        throw ConfigError("chunk_overlap must be smaller than a positive chunk_size");
    }
    params_.table_chunk_size = std::max(params_.table_chunk_size, params_.chunk_size);
}

std::optional<DocumentIngestor::Header> DocumentIngestor::classify_header(const std::string& line) const {
    if (std::regex_search(line, table_header()))   return Header{SectionType::Table};
    if (std::regex_search(line, figure_header()))  return Header{SectionType::Figure};
    if (std::regex_search(line, purpose_header())) return Header{SectionType::Purpose};
    if (std::regex_search(line, notes_header()))   return Header{SectionType::Notes};
    if (std::regex_search(line, general_header())) return Header{std::nullopt};
    return std::nullopt;
}

void DocumentIngestor::track_metadata(const std::string& line, DocState& state) const {
    std::smatch m;
    if (std::regex_search(line, m, document_number_pattern()) && m[1].matched) {
        if (state.document_number != m[1].str()) state.revision.reset();
        state.document_number = m[1].str();
    }
    if (std::regex_search(line, m, revision_pattern()) && m[1].matched) {
        state.revision = m[1].str();
    }
}

uint32_t DocumentIngestor::budget_for(SectionType type) const {
    return (type == SectionType::Table || type == SectionType::Figure) ? params_.table_chunk_size
                                                                         : params_.chunk_size;
}

void DocumentIngestor::append_words(const std::string& text, size_t base_offset, std::vector<Word>& out) {
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) out.push_back({text.substr(start, i - start), base_offset + start});
    }
}

void DocumentIngestor::flush(Section& section, const DocState& state, const PageMap& pages,
                             const std::string& source, std::vector<SpecChunk>& out) const {
    const auto& words = section.words;
    if (words.empty()) return;

    const size_t budget = budget_for(section.type);
    const size_t step = budget - std::min<size_t>(params_.chunk_overlap, budget - 1);

    auto emit = [&](size_t begin, size_t end) {
        std::vector<std::string> slice;
        slice.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) slice.push_back(words[i].text);
        std::string text = join_words(slice);
        if (text.size() < params_.min_chunk_chars) {
            Logger::debug("Dropping " + std::to_string(text.size()) + "-char fragment from " + source);
            return;
        }
        SpecChunk c;
        c.text = std::move(text);
        c.source = source;
        c.page = pages.page_for_offset(words[begin].offset);
        c.section_type = section.type;
        c.document_number = state.document_number;
        c.revision = state.revision;
        out.push_back(std::move(c));
    };

    if (words.size() <= budget) {
        emit(0, words.size());
    } else {
        for (size_t begin = 0; begin < words.size(); begin += step) {
            size_t end = std::min(begin + budget, words.size());
            emit(begin, end);
            if (end == words.size()) break;
        }
    }
    section.words.clear();
}

std::vector<SpecChunk> DocumentIngestor::chunk(const std::vector<PageText>& pages,
                                               const std::string& source_name) const {
    PageMap page_map;
    std::vector<const PageText*> kept;
    for (const auto& p : pages) {
        if (trim(p.text).empty()) continue;
        page_map.add_page(p.text.size() + 1, p.page_number);
        kept.push_back(&p);
    }

    std::vector<SpecChunk> out;
    DocState state;
    size_t page_base = 0;

    for (const PageText* page : kept) {
        const std::string& text = page->text;

        // Split into lines, remembering each line's offset within the page
        std::vector<std::pair<size_t, std::string>> lines;
        size_t pos = 0;
        while (pos <= text.size()) {
            size_t nl = text.find('\n', pos);
            if (nl == std::string::npos) nl = text.size();
            lines.emplace_back(pos, text.substr(pos, nl - pos));
            pos = nl + 1;
        }

        bool page_has_header = false;
        for (const auto& [off, line] : lines) {
            if (classify_header(trim(line))) { page_has_header = true; break; }
        }

        if (!page_has_header) {
            // Fixed-window fallback, page-local
            flush(state.open, state, page_map, source_name, out);
            for (const auto& [off, line] : lines) {
                track_metadata(line, state);
                append_words(line, page_base + off, state.open.words);
            }
            flush(state.open, state, page_map, source_name, out);
        } else {
            for (const auto& [off, line] : lines) {
                std::string trimmed = trim(line);
                if (auto header = classify_header(trimmed)) {
                    flush(state.open, state, page_map, source_name, out);
                    if (header->type) state.open.type = *header->type;
                }
                track_metadata(line, state);
                append_words(line, page_base + off, state.open.words);
            }
        }
        page_base += text.size() + 1;
    }
    flush(state.open, state, page_map, source_name, out);

    if (out.empty()) {
        throw EmptyDocumentError("No chunks could be produced from '" + source_name + "'");
    }
    Logger::debug("Chunked '" + source_name + "' into " + std::to_string(out.size()) + " chunks over " +
                  std::to_string(kept.size()) + " pages");
    return out;
}

} // namespace Repealer
