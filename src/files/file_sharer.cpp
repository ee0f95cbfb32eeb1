#include "files/file_sharer.hpp"
#include "files/chunker.hpp"
#include "common/logger.hpp"
#include <fstream>

void FileSharer::add_share(const Manifest& manifest, const std::filesystem::path& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    shares_[manifest.content_id] = Entry{manifest, file_path};
}

bool FileSharer::remove_share(const content_id_t& content_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_.erase(content_id) > 0;
}

std::optional<Manifest> FileSharer::get_manifest(const content_id_t& content_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(content_id);
    if (it != shares_.end()) {
        return it->second.manifest;
    }
    return std::nullopt;
}

std::vector<Manifest> FileSharer::get_all_manifests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Manifest> manifests;
    manifests.reserve(shares_.size());
    for (const auto& [id, entry] : shares_) {
        manifests.push_back(entry.manifest);
    }
    return manifests;
}

size_t FileSharer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_.size();
}

std::optional<std::vector<uint8_t>> FileSharer::get_chunk(const content_id_t& content_id, uint32_t chunk_index) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = shares_.find(content_id);
        if (it == shares_.end()) {
            LOG_DEBUG("Chunk request for unknown content ", content_id);
            return std::nullopt;
        }
        entry = it->second;
    }

    const Manifest& manifest = entry.manifest;
    if (chunk_index >= manifest.chunk_count()) {
        LOG_DEBUG("Chunk ", chunk_index, " out of range (count: ", manifest.chunk_count(), ") for ", content_id);
        return std::nullopt;
    }

    ChunkSpec spec = Chunker::chunk_spec(static_cast<int64_t>(manifest.file_size), manifest.chunk_size,
                                         chunk_index, content_id);

    std::ifstream file(entry.file_path, std::ios::binary);
    if (!file.is_open()) {
        LOG_ERR("Failed to open shared file for reading: ", entry.file_path.string());
        return std::nullopt;
    }

    file.seekg(static_cast<std::streamoff>(spec.offset));
    std::vector<uint8_t> chunk_data(spec.length);
    file.read(reinterpret_cast<char*>(chunk_data.data()), spec.length);

    if (static_cast<uint64_t>(file.gcount()) != spec.length) {
        LOG_ERR("Failed to read the full chunk ", chunk_index, " from ", entry.file_path.string());
        return std::nullopt;
    }
    return chunk_data;
}
