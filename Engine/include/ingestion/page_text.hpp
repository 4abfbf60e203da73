#pragma once

#include <export.hpp>
#include <core/types.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace Repealer {

/**
 * @brief Split extracted text into pages at form feeds (pdftotext convention).
 *
 * Pages are numbered from 1 in order. Text without a form feed is one page.
 */
REPEALER_API std::vector<PageText> split_pages(const std::string& text);

/// Whole file as bytes. @throws std::runtime_error if it cannot be read
REPEALER_API std::string read_file(const std::filesystem::path& path);

} // namespace Repealer
