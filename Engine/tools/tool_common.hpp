#pragma once

#include <core/config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace Repealer::tools {

/// Exit codes shared by the repeal_* tools.
enum ExitCode {
    Ok = 0,
    UserError = 1,
    Retryable = 2,
    Fatal = 3
};

/**
 * @brief Pull "--config <file>" out of args, leaving positional arguments.
 *
 * Defaults, then the file, then REPEALER_* environment variables.
 */
inline EngineConfig load_config(std::vector<std::string>& args) {
    EngineConfig config;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != "--config") continue;
        if (i + 1 >= args.size()) throw ConfigError("--config requires a file path");
        config = EngineConfig::load_file(args[i + 1]);
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(i), args.begin() + static_cast<std::ptrdiff_t>(i) + 2);
        break;
    }
    config.apply_env();
    return config;
}

inline int report(const std::exception& e) {
    if (auto integrity = dynamic_cast<const IntegrityError*>(&e)) {
        std::cerr << "Error: " << e.what() << "\n";
        if (integrity->recoverable()) {
            std::cerr << "Run 'repeal_corpus <dir> rebuild' to restore the corpus.\n";
        } else {
            std::cerr << "The corpus must be reset and re-ingested.\n";
        }
        return Fatal;
    }
    if (auto err = dynamic_cast<const RepealerError*>(&e)) {
        std::cerr << "Error: " << e.what() << "\n";
        return err->retryable() ? Retryable : UserError;
    }
    std::cerr << "Error: " << e.what() << "\n";
    return Fatal;
}

} // namespace Repealer::tools
