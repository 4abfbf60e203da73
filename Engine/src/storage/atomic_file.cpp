#include <storage/atomic_file.hpp>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace Repealer {

namespace {

std::filesystem::path temp_for(const std::filesystem::path& path) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    return tmp;
}

void discard(const std::filesystem::path& tmp) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
}

// fsync a file, or a directory so a rename in it is durable
void sync_path(const std::filesystem::path& path, bool directory) {
#ifndef _WIN32
    const int fd = ::open(path.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot open " + path.string() + " to sync");
    }
    const int rc = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) throw std::system_error(err, std::generic_category(), "fsync failed for " + path.string());
#else
    (void)path;
    (void)directory;
#endif
}

void commit(const std::filesystem::path& tmp, const std::filesystem::path& path) {
    try {
        sync_path(tmp, false);
    } catch (...) {
        discard(tmp);
        throw;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        discard(tmp);
        throw std::runtime_error("Cannot replace " + path.string() + ": " + ec.message());
    }

    const auto dir = path.parent_path().empty() ? std::filesystem::path(".") : path.parent_path();
    sync_path(dir, true);
}

} // namespace

void write_file_atomic(const std::filesystem::path& path,
                       const std::function<void(std::ostream&)>& writer) {
    const auto tmp = temp_for(path);
    try {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
        writer(out);
        out.flush();
        if (!out) throw std::runtime_error("Failed writing " + tmp.string());
    } catch (...) {
        discard(tmp);
        throw;
    }
    commit(tmp, path);
}

void write_path_atomic(const std::filesystem::path& path,
                       const std::function<void(const std::filesystem::path& tmp)>& writer) {
    const auto tmp = temp_for(path);
    try {
        writer(tmp);
    } catch (...) {
        discard(tmp);
        throw;
    }
    if (!std::filesystem::exists(tmp)) {
        throw std::runtime_error("Writer produced no file at " + tmp.string());
    }
    commit(tmp, path);
}

} // namespace Repealer
