/**
 * @file test_document_ingestor.cpp
 * @brief Section boundaries, window fallback, page estimation and metadata carry-over
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ingestion/document_ingestor.hpp>
#include <ingestion/page_text.hpp>
#include <algorithm>
#include <string>

using namespace Repealer;

static std::string numbered_words(size_t n, const std::string& prefix = "w") {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i) out += ' ';
        out += prefix + std::to_string(i);
    }
    return out;
}

static ChunkingParams small_params() {
    ChunkingParams p;
    p.chunk_size = 10;
    p.chunk_overlap = 2;
    p.table_chunk_size = 30;
    p.min_chunk_chars = 1;
    return p;
}

TEST(DocumentIngestorTest, TableOnFirstPageIsTaggedTable) {
    std::vector<PageText> pages = {
        {"Table 1: Clearance requirements for overhead conductors above roadways require a "
         "minimum 18 feet of vertical clearance at all times.", 1},
        {"General Notes: Crossarms shall be installed level and inspected before the line "
         "section is energized.", 2}
    };

    DocumentIngestor ingestor;
    auto chunks = ingestor.chunk(pages, "greenbook.txt");

    auto it = std::find_if(chunks.begin(), chunks.end(), [](const SpecChunk& c) {
        return c.section_type == SectionType::Table && c.page == 1;
    });
    ASSERT_NE(it, chunks.end());
    EXPECT_NE(it->text.find("minimum 18 feet"), std::string::npos);
    EXPECT_EQ(it->source, "greenbook.txt");

    auto notes = std::find_if(chunks.begin(), chunks.end(), [](const SpecChunk& c) {
        return c.section_type == SectionType::Notes;
    });
    ASSERT_NE(notes, chunks.end());
    EXPECT_EQ(notes->page, 2u);
}

TEST(DocumentIngestorTest, BoundaryFlushesWithPreviousType) {
    std::vector<PageText> pages = {
        {"Purpose and Scope\n"
         "This document describes the installation of wood poles in the distribution system.\n"
         "Table 2: Pole setting depths for wood poles in firm soil are listed below by class.\n", 1}
    };

    auto chunks = DocumentIngestor().chunk(pages, "poles.txt");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].section_type, SectionType::Purpose);
    EXPECT_NE(chunks[0].text.find("installation of wood poles"), std::string::npos);
    EXPECT_EQ(chunks[0].text.find("Table 2"), std::string::npos);
    EXPECT_EQ(chunks[1].section_type, SectionType::Table);
    EXPECT_EQ(chunks[1].text.rfind("Table 2:", 0), 0u);
}

TEST(DocumentIngestorTest, ReferenceBoundaryKeepsSectionType) {
    std::vector<PageText> pages = {
        {"Figure 4: Anchor placement relative to the pole line and the guy lead length.\n"
         "References: anchor assemblies and guy strand sizes appear in the material list.\n", 1}
    };

    auto chunks = DocumentIngestor().chunk(pages, "anchors.txt");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].section_type, SectionType::Figure);
    EXPECT_EQ(chunks[1].section_type, SectionType::Figure);
    EXPECT_EQ(chunks[1].text.rfind("References:", 0), 0u);
}

TEST(DocumentIngestorTest, PageWithoutBoundaryUsesOverlappingWindows) {
    std::vector<PageText> pages = {{numbered_words(25), 1}};

    auto chunks = DocumentIngestor(small_params()).chunk(pages, "plain.txt");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].text, numbered_words(10));
    EXPECT_EQ(chunks[1].text.rfind("w8 w9 w10", 0), 0u);
    EXPECT_EQ(chunks[2].text.rfind("w16", 0), 0u);
    EXPECT_NE(chunks[2].text.find("w24"), std::string::npos);
    for (const auto& c : chunks) EXPECT_EQ(c.section_type, SectionType::General);
}

TEST(DocumentIngestorTest, TablesGetLargerBudget) {
    std::vector<PageText> table = {{"Table 5: " + numbered_words(25), 1}};
    std::vector<PageText> prose = {{numbered_words(27), 1}};

    DocumentIngestor ingestor(small_params());
    EXPECT_EQ(ingestor.chunk(table, "t.txt").size(), 1u);
    EXPECT_GT(ingestor.chunk(prose, "p.txt").size(), 1u);
}

TEST(DocumentIngestorTest, PageNumbersFollowCharacterOffsets) {
    std::vector<PageText> pages = {
        {numbered_words(12, "alpha"), 5},
        {"", 6},
        {numbered_words(12, "beta"), 7}
    };

    ChunkingParams p = small_params();
    p.chunk_size = 100;
    auto chunks = DocumentIngestor(p).chunk(pages, "pages.txt");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].page, 5u);
    EXPECT_EQ(chunks[1].page, 7u);
}

TEST(DocumentIngestorTest, PageMapLooksUpOffsets) {
    DocumentIngestor::PageMap map;
    map.add_page(100, 1);
    map.add_page(50, 2);
    map.add_page(10, 9);
    EXPECT_EQ(map.page_for_offset(0), 1u);
    EXPECT_EQ(map.page_for_offset(99), 1u);
    EXPECT_EQ(map.page_for_offset(100), 2u);
    EXPECT_EQ(map.page_for_offset(155), 9u);
    EXPECT_EQ(map.page_for_offset(10000), 9u);
    EXPECT_EQ(map.total_chars(), 160u);
}

TEST(DocumentIngestorTest, DocumentNumberAndRevisionCarryForward) {
    std::vector<PageText> pages = {
        {"Document 022178 Rev. #13\n"
         "Purpose and Scope\n"
         "This document covers guy marker installation on anchors near roads and paths.\n", 1},
        {"Table 1: Guy marker colours and lengths for each anchor type used in the service area.", 2}
    };

    auto chunks = DocumentIngestor().chunk(pages, "guys.txt");
    ASSERT_EQ(chunks.size(), 2u);
    for (const auto& c : chunks) {
        ASSERT_TRUE(c.document_number.has_value());
        EXPECT_EQ(*c.document_number, "022178");
        ASSERT_TRUE(c.revision.has_value());
        EXPECT_EQ(*c.revision, "13");
    }
    EXPECT_EQ(chunks[1].reference(), "Document 022178 Rev. #13 p.2");
}

TEST(DocumentIngestorTest, ShortChunksAreDropped) {
    std::vector<PageText> pages = {
        {"Notes: see below\n"
         "Table 9: Conduit fill limits for each conductor size and insulation type used underground.", 1}
    };

    auto chunks = DocumentIngestor().chunk(pages, "conduit.txt");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].section_type, SectionType::Table);
}

TEST(DocumentIngestorTest, EmptyDocumentThrows) {
    DocumentIngestor ingestor;
    EXPECT_THROW(ingestor.chunk({}, "none.txt"), EmptyDocumentError);
    EXPECT_THROW(ingestor.chunk({{"   \n\t ", 1}, {"", 2}}, "blank.txt"), EmptyDocumentError);
    EXPECT_THROW(ingestor.chunk({{"Notes: tiny", 1}}, "tiny.txt"), EmptyDocumentError);
}

TEST(DocumentIngestorTest, RejectsOverlapNotSmallerThanChunk) {
    ChunkingParams p;
    p.chunk_size = 10;
    p.chunk_overlap = 10;
    EXPECT_THROW(DocumentIngestor{p}, ConfigError);
}

TEST(DocumentIngestorTest, ChunkingIsDeterministic) {
    std::vector<PageText> pages = {
        {"Purpose and Scope\n" + numbered_words(700, "x") + "\nTable 3: " + numbered_words(40, "t"), 1}
    };
    DocumentIngestor ingestor;
    auto a = ingestor.chunk(pages, "d.txt");
    auto b = ingestor.chunk(pages, "d.txt");
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].text, b[i].text);
        EXPECT_EQ(a[i].page, b[i].page);
        EXPECT_EQ(a[i].section_type, b[i].section_type);
    }
}

TEST(PageTextTest, SplitsOnFormFeeds) {
    auto pages = split_pages("first page\fsecond page\fthird\f");
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].text, "first page");
    EXPECT_EQ(pages[1].page_number, 2u);
    EXPECT_EQ(pages[2].text, "third");

    auto single = split_pages("no separators here");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].page_number, 1u);
}
