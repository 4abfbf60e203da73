#include <storage/chunk_store.hpp>
#include <storage/atomic_file.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <stdexcept>

namespace Repealer {

void to_json(nlohmann::json& j, const SourceRecord& s) {
    j = nlohmann::json{
        {"name", s.name},
        {"content_hash", s.content_hash},
        {"chunk_count", s.chunk_count},
        {"planned_chunks", s.planned_chunks},
        {"complete", s.complete},
        {"ingested_at", s.ingested_at}
    };
}

void from_json(const nlohmann::json& j, SourceRecord& s) {
    j.at("name").get_to(s.name);
    j.at("content_hash").get_to(s.content_hash);
    j.at("chunk_count").get_to(s.chunk_count);
    s.planned_chunks = j.value("planned_chunks", s.chunk_count);
    j.at("complete").get_to(s.complete);
    s.ingested_at = j.value("ingested_at", std::string());
}

void ChunkStore::save(const std::filesystem::path& path, const ChunkManifest& manifest) {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto& c : manifest.chunks) chunks.push_back(*c);

    nlohmann::json j{
        {"format_version", manifest.format_version},
        {"model_id", manifest.model_id},
        {"embedding_dim", manifest.embedding_dim},
        {"generation", manifest.generation},
        {"dirty", manifest.dirty},
        {"sources", manifest.sources},
        {"chunks", std::move(chunks)}
    };

    write_file_atomic(path, [&](std::ostream& out) { out << j.dump(); });
}

ChunkManifest ChunkStore::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw IntegrityError("Cannot open chunk store " + path.string(), false);

    ChunkManifest m;
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        j.at("format_version").get_to(m.format_version);
        if (m.format_version != ChunkManifest::FORMAT_VERSION) {
            throw IntegrityError("Unsupported chunk store format " + std::to_string(m.format_version) +
                                 " in " + path.string(), false);
        }
        j.at("model_id").get_to(m.model_id);
        j.at("embedding_dim").get_to(m.embedding_dim);
        m.generation = j.value("generation", uint64_t{0});
        m.dirty = j.value("dirty", false);
        j.at("sources").get_to(m.sources);

        const auto& chunks = j.at("chunks");
        m.chunks.reserve(chunks.size());
        for (const auto& c : chunks) {
            m.chunks.push_back(std::make_shared<const SpecChunk>(c.get<SpecChunk>()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw IntegrityError("Chunk store " + path.string() + " is corrupt: " + e.what(), false);
    } catch (const std::invalid_argument& e) {
        throw IntegrityError("Chunk store " + path.string() + " is corrupt: " + e.what(), false);
    }
    return m;
}

} // namespace Repealer
