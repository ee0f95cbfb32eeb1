#include "files/chunker.hpp"
#include "crypto/hasher.hpp"
#include "common/error.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace {

void check_partition_args(int64_t file_size, int64_t chunk_size) {
    if (file_size < 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument,
                              "file_size must not be negative: " + std::to_string(file_size));
    }
    if (chunk_size <= 0 || chunk_size > std::numeric_limits<uint32_t>::max()) {
        throw ChunkShareError(ErrorCode::InvalidArgument,
                              "chunk_size out of range: " + std::to_string(chunk_size));
    }
    // file_size + chunk_size - 1 would overflow near INT64_MAX
    int64_t count = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "too many chunks for file_size " +
                              std::to_string(file_size));
    }
}

} // namespace

content_id_t Chunker::identify(const std::vector<uint8_t>& bytes) {
    return Hasher::to_hex(Hasher::sha1(bytes));
}

content_id_t Chunker::identify_file(const fs::path& file_path) {
    try {
        return Hasher::to_hex(Hasher::sha1_file(file_path));
    } catch (const std::runtime_error& e) {
        throw ChunkShareError(ErrorCode::StorageError, e.what());
    }
}

uint32_t Chunker::chunk_count(int64_t file_size, int64_t chunk_size) {
    check_partition_args(file_size, chunk_size);
    return static_cast<uint32_t>(file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0));
}

ChunkSpec Chunker::chunk_spec(int64_t file_size, int64_t chunk_size, uint32_t chunk_index,
                              const content_id_t& content_id) {
    uint32_t count = chunk_count(file_size, chunk_size);
    if (chunk_index >= count) {
        throw ChunkShareError(ErrorCode::InvalidArgument,
                              "chunk index " + std::to_string(chunk_index) +
                              " out of range (count " + std::to_string(count) + ")");
    }

    ChunkSpec spec;
    spec.content_id = content_id;
    spec.chunk_index = chunk_index;
    spec.offset = static_cast<uint64_t>(chunk_index) * static_cast<uint64_t>(chunk_size);
    uint64_t remaining = static_cast<uint64_t>(file_size) - spec.offset;
    spec.length = static_cast<uint32_t>(std::min<uint64_t>(remaining, static_cast<uint64_t>(chunk_size)));
    return spec;
}

std::vector<ChunkSpec> Chunker::partition(int64_t file_size, int64_t chunk_size,
                                          const content_id_t& content_id) {
    uint32_t count = chunk_count(file_size, chunk_size);
    std::vector<ChunkSpec> chunks;
    chunks.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        chunks.push_back(chunk_spec(file_size, chunk_size, i, content_id));
    }
    return chunks;
}

Manifest Chunker::create_manifest_from_file(const fs::path& file_path, uint32_t chunk_size) {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw ChunkShareError(ErrorCode::InvalidArgument,
                              "File does not exist or is not a regular file: " + file_path.string());
    }
    if (chunk_size == 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "chunk_size must be positive");
    }

    Manifest manifest;
    manifest.file_name = file_path.filename().string();
    manifest.file_size = fs::file_size(file_path, ec);
    if (ec) {
        throw ChunkShareError(ErrorCode::StorageError,
                              "Cannot stat " + file_path.string() + ": " + ec.message());
    }
    manifest.chunk_size = chunk_size;
    manifest.content_id = identify_file(file_path);
    return manifest;
}
