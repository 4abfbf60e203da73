#pragma once

#include <export.hpp>
#include <filesystem>
#include <functional>
#include <ostream>

namespace Repealer {

/**
 * @brief Replace a file so readers see either the old or the new content.
 *
 * The writer fills "<path>.tmp"; on success the temp file is synced to disk,
 * renamed over path, and the directory entry synced. On any failure the temp
 * file is removed and the original is untouched.
 *
 * @throws std::runtime_error on I/O failure, or whatever the writer throws
 */
REPEALER_API void write_file_atomic(const std::filesystem::path& path,
                                    const std::function<void(std::ostream&)>& writer);

/// Same, for writers that insist on opening the file themselves.
REPEALER_API void write_path_atomic(const std::filesystem::path& path,
                                    const std::function<void(const std::filesystem::path& tmp)>& writer);

} // namespace Repealer
