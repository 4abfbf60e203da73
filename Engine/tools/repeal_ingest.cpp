#include <analysis/repeal_engine.hpp>
#include <ingestion/page_text.hpp>
#include "tool_common.hpp"
#include <filesystem>
#include <iostream>

using namespace Repealer;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        EngineConfig config = tools::load_config(args);

        if (args.size() < 2) {
            std::cerr << "Usage: " << argv[0] << " <corpus_dir> <spec.txt>... [--config engine.json]\n";
            std::cerr << "\nSpec files are extracted text; form feeds separate pages.\n";
            std::cerr << "\nExamples:\n";
            std::cerr << "  pdftotext greenbook.pdf greenbook.txt\n";
            std::cerr << "  " << argv[0] << " ./corpus greenbook.txt\n";
            return tools::UserError;
        }

        RepealEngine engine(config, args[0]);

        for (size_t i = 1; i < args.size(); ++i) {
            const std::filesystem::path path(args[i]);
            const std::string bytes = read_file(path);
            IngestResult r = engine.ingest_document(split_pages(bytes), path.filename().string(), bytes);

            std::cout << path.filename().string() << ": ";
            if (r.duplicate) {
                std::cout << "already ingested (" << r.content_hash << ")\n";
            } else {
                std::cout << r.chunks_added << " chunks added, " << r.total_chunks << " in corpus\n";
            }
        }

        return tools::Ok;
    } catch (const std::exception& e) {
        return tools::report(e);
    }
}
