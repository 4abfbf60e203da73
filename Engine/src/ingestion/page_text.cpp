#include <ingestion/page_text.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Repealer {

std::vector<PageText> split_pages(const std::string& text) {
    std::vector<PageText> pages;
    uint32_t number = 1;
    size_t pos = 0;
    while (true) {
        size_t ff = text.find('\f', pos);
        pages.push_back({text.substr(pos, ff == std::string::npos ? std::string::npos : ff - pos), number++});
        if (ff == std::string::npos) break;
        pos = ff + 1;
    }
    // pdftotext ends the last page with a form feed too
    if (pages.size() > 1 && pages.back().text.empty()) pages.pop_back();
    return pages;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw std::runtime_error("Failed reading " + path.string());
    return ss.str();
}

} // namespace Repealer
