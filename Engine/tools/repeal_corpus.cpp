#include <analysis/repeal_engine.hpp>
#include <hashing/blake3_pipeline.hpp>
#include "tool_common.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

using namespace Repealer;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <corpus_dir> <command> [args] [--config engine.json]\n";
    std::cerr << "\nCommands:\n";
    std::cerr << "  stats     print chunk, source and section counts as JSON\n";
    std::cerr << "  rebuild   re-embed every chunk and rebuild the index\n";
    std::cerr << "  reindex   rebuild the index from stored vectors\n";
    std::cerr << "  remove <content_hash>\n";
    std::cerr << "            drop one source, its chunks and vectors (hash as shown by stats)\n";
    std::cerr << "  reset     delete the corpus\n";
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        EngineConfig config = tools::load_config(args);

        if (args.size() < 2) {
            usage(argv[0]);
            return tools::UserError;
        }

        const std::string& command = args[1];
        const size_t expected_args = command == "remove" ? 3 : 2;
        if (args.size() != expected_args) {
            usage(argv[0]);
            return tools::UserError;
        }
        if (command != "stats" && command != "rebuild" && command != "reindex" && command != "reset" &&
            command != "remove") {
            std::cerr << "Unknown command: " << command << "\n";
            usage(argv[0]);
            return tools::UserError;
        }

        if (command == "reset") {
            // No load: reset must work on a corpus too damaged to open
            CorpusIndex corpus(CorpusIndex::Options::from_config(config, args[0]),
                               std::make_shared<HashingEmbeddingProvider>(config.embedding_dim),
                               CorpusIndex::make_index_factory(config));
            corpus.reset();
            return tools::Ok;
        }

        std::string content_hash;
        if (command == "remove") {
            try {
                content_hash = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::from_hex(args[2]));
            } catch (const std::invalid_argument& e) {
                std::cerr << "Not a content hash: " << e.what() << "\n";
                return tools::UserError;
            }
        }

        RepealEngine engine(config, args[0]);
        CorpusIndex& corpus = engine.corpus();

        if (command == "stats") {
            nlohmann::json j = corpus.stats();
            std::cout << j.dump(2) << "\n";
        } else if (command == "remove") {
            const size_t removed = corpus.remove_source(content_hash);
            if (removed == 0) {
                std::cerr << "No source with content hash " << content_hash << "\n";
                return tools::UserError;
            }
            std::cout << "Removed " << removed << " chunks, " << corpus.size() << " left in corpus\n";
        } else if (command == "rebuild") {
            corpus.rebuild_from_chunks();
        } else {
            corpus.reindex();
        }
        return tools::Ok;
    } catch (const std::exception& e) {
        return tools::report(e);
    }
}
