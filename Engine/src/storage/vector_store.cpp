#include <storage/vector_store.hpp>
#include <storage/atomic_file.hpp>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace Repealer {

namespace {
constexpr char k_vector_magic[8] = {'R', 'P', 'V', 'E', 'C', '0', '0', '1'};
constexpr uint32_t k_max_model_id = 4096;
}

void VectorStore::save(const std::filesystem::path& path, const VectorFile& file) {
    if (file.data.size() != file.count * file.dimension) {
        throw std::runtime_error("Vector payload does not match count x dimension");
    }

    write_file_atomic(path, [&](std::ostream& out) {
        uint32_t id_len = static_cast<uint32_t>(file.model_id.size());
        out.write(k_vector_magic, sizeof(k_vector_magic));
        out.write(reinterpret_cast<const char*>(&file.dimension), sizeof(file.dimension));
        out.write(reinterpret_cast<const char*>(&file.count), sizeof(file.count));
        out.write(reinterpret_cast<const char*>(&file.generation), sizeof(file.generation));
        out.write(reinterpret_cast<const char*>(&id_len), sizeof(id_len));
        out.write(file.model_id.data(), id_len);
        out.write(reinterpret_cast<const char*>(file.data.data()),
                  static_cast<std::streamsize>(file.data.size() * sizeof(float)));
    });
}

VectorFile VectorStore::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open vector store " + path.string());

    VectorFile f;
    char magic[sizeof(k_vector_magic)];
    uint32_t id_len = 0;
    in.read(magic, sizeof(magic));
    in.read(reinterpret_cast<char*>(&f.dimension), sizeof(f.dimension));
    in.read(reinterpret_cast<char*>(&f.count), sizeof(f.count));
    in.read(reinterpret_cast<char*>(&f.generation), sizeof(f.generation));
    in.read(reinterpret_cast<char*>(&id_len), sizeof(id_len));
    if (!in || std::memcmp(magic, k_vector_magic, sizeof(magic)) != 0 || id_len > k_max_model_id) {
        throw std::runtime_error("Not a vector store: " + path.string());
    }

    f.model_id.resize(id_len);
    in.read(f.model_id.data(), id_len);

    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(path, ec);
    const uint64_t header = sizeof(k_vector_magic) + sizeof(f.dimension) + sizeof(f.count) +
                            sizeof(f.generation) + sizeof(id_len) + id_len;
    const uint64_t row_bytes = uint64_t{f.dimension} * sizeof(float);
    if (ec || file_size < header || (row_bytes > 0 && f.count > (file_size - header) / row_bytes)) {
        throw std::runtime_error("Vector store header claims " + std::to_string(f.count) +
                                 " rows that the file does not hold: " + path.string());
    }

    f.data.resize(static_cast<size_t>(f.count) * f.dimension);
    in.read(reinterpret_cast<char*>(f.data.data()), static_cast<std::streamsize>(f.data.size() * sizeof(float)));
    if (!in) throw std::runtime_error("Truncated vector store: " + path.string());
    return f;
}

} // namespace Repealer
