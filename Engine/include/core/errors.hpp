/**
 * @file errors.hpp
 * @brief Typed error kinds raised by the engine
 *
 * Callers distinguish three families:
 *   - user-facing: EmptyDocumentError, IndexNotReadyError, ConfigError
 *   - retryable:   EmbeddingProviderError (and its timeout), IngestionBusyError
 *   - fatal:       IntegrityError when the chunk store cannot be repaired
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Repealer {

class RepealerError : public std::runtime_error {
public:
    explicit RepealerError(const std::string& what) : std::runtime_error(what) {}

    /// True when repeating the same call later may succeed.
    virtual bool retryable() const noexcept { return false; }
};

/// No text to process. Nothing was mutated.
class EmptyDocumentError : public RepealerError {
public:
    explicit EmptyDocumentError(const std::string& what) : RepealerError(what) {}
};

/// Search or analysis before any document was ingested.
class IndexNotReadyError : public RepealerError {
public:
    IndexNotReadyError() : RepealerError("Corpus is empty: ingest a specification document first") {}
    explicit IndexNotReadyError(const std::string& what) : RepealerError(what) {}
};

/**
 * @brief Store counts disagree, or a store cannot be read.
 *
 * recoverable() is true when the chunk store is intact and a rebuild from it can
 * restore consistency; false means the corpus must be re-ingested.
 */
class IntegrityError : public RepealerError {
public:
    IntegrityError(const std::string& what, bool recoverable)
        : RepealerError(what), recoverable_(recoverable) {}

    bool recoverable() const noexcept { return recoverable_; }

private:
    bool recoverable_;
};

class EmbeddingProviderError : public RepealerError {
public:
    explicit EmbeddingProviderError(const std::string& what) : RepealerError(what) {}
    bool retryable() const noexcept override { return true; }
};

class EmbeddingTimeoutError : public EmbeddingProviderError {
public:
    explicit EmbeddingTimeoutError(const std::string& what) : EmbeddingProviderError(what) {}
};

/// A concurrent ingestion holds the write lock (non-blocking mode only).
class IngestionBusyError : public RepealerError {
public:
    IngestionBusyError() : RepealerError("Another ingestion is in progress") {}
    bool retryable() const noexcept override { return true; }
};

class ConfigError : public RepealerError {
public:
    explicit ConfigError(const std::string& what) : RepealerError(what) {}
};

} // namespace Repealer
