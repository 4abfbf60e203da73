/**
 * @file document_ingestor.hpp
 * @brief Per-page spec text → metadata-tagged SpecChunks
 *
 * Header lines ("Purpose and Scope", "General Notes", "Table 3", "Figure 20")
 * split the text into typed sections. "References:", "Section 4",
 * "Document 022178" and "Rev. #13:" split without changing the section type. A header flushes the open section as chunks tagged with the previous
 * section type and opens a new one. Table and figure sections get a larger word
 * budget than prose so tabular rows are not cut apart. A page with no header
 * falls back to overlapping fixed-size word windows, keeping the section type in
 * effect. Oversized sections are windowed the same way.
 *
 * Page numbers are estimated from a chunk's starting character offset against
 * cumulative per-page character counts.
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Repealer {

struct ChunkingParams {
    uint32_t chunk_size = 300;
    uint32_t chunk_overlap = 50;
    uint32_t table_chunk_size = 600;
    uint32_t min_chunk_chars = 50;

    static ChunkingParams from_config(const EngineConfig& config);
};

class REPEALER_API DocumentIngestor {
public:
    explicit DocumentIngestor(const ChunkingParams& params = ChunkingParams());

    /**
     * @brief Chunk one document.
     * @throws EmptyDocumentError if no chunk survives (empty pages are skipped)
     */
    std::vector<SpecChunk> chunk(const std::vector<PageText>& pages, const std::string& source_name) const;

    /**
     * @brief Maps a cumulative character offset back to the page it falls on.
     */
    class PageMap {
    public:
        void add_page(size_t char_count, uint32_t page_number);
        uint32_t page_for_offset(size_t offset) const;
        size_t total_chars() const { return total_; }

    private:
        std::vector<size_t> starts_;
        std::vector<uint32_t> numbers_;
        size_t total_ = 0;
    };

private:
    struct Word {
        std::string text;
        size_t offset;
    };

    struct Section {
        SectionType type = SectionType::General;
        std::vector<Word> words;
    };

    struct DocState {
        Section open;
        std::optional<std::string> document_number;
        std::optional<std::string> revision;
    };

    struct Header {
        std::optional<SectionType> type; ///< empty: boundary that keeps the current type
    };

    std::optional<Header> classify_header(const std::string& line) const;
    void track_metadata(const std::string& line, DocState& state) const;

    uint32_t budget_for(SectionType type) const;
    void flush(Section& section, const DocState& state, const PageMap& pages,
               const std::string& source, std::vector<SpecChunk>& out) const;

    static void append_words(const std::string& text, size_t base_offset, std::vector<Word>& out);

    ChunkingParams params_;
};

} // namespace Repealer
