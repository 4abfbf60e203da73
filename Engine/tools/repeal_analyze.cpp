#include <analysis/repeal_engine.hpp>
#include <ingestion/page_text.hpp>
#include "tool_common.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <utility>

using namespace Repealer;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        EngineConfig config = tools::load_config(args);

        if (args.size() < 2) {
            std::cerr << "Usage: " << argv[0] << " <corpus_dir> <audit.txt>... [--config engine.json]\n";
            std::cerr << "\nWrites verdicts and a summary as JSON to stdout. With several audits,\n";
            std::cerr << "writes one report per audit; a failed audit does not stop the others.\n";
            return tools::UserError;
        }

        RepealEngine engine(config, args[0]);

        if (args.size() == 2) {
            const auto verdicts = engine.analyze_infractions(read_file(args[1]));
            nlohmann::json out{
                {"verdicts", verdicts},
                {"summary", engine.summarize(verdicts)}
            };
            std::cout << out.dump(2) << "\n";
            return tools::Ok;
        }

        std::vector<std::pair<std::string, std::string>> audits;
        for (size_t i = 1; i < args.size(); ++i) {
            audits.emplace_back(std::filesystem::path(args[i]).filename().string(), read_file(args[i]));
        }
        const auto reports = engine.analyze_batch(audits);

        size_t failed = 0;
        for (const auto& r : reports) {
            if (r.error) ++failed;
        }
        nlohmann::json out{
            {"total", reports.size()},
            {"analyzed", reports.size() - failed},
            {"failed", failed},
            {"audits", reports}
        };
        std::cout << out.dump(2) << "\n";
        if (failed > 0) return tools::UserError;
        return tools::Ok;
    } catch (const std::exception& e) {
        return tools::report(e);
    }
}
