#ifndef CHUNKSHARE_CHUNKER_HPP
#define CHUNKSHARE_CHUNKER_HPP

#include "manifest.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

class Chunker {
public:
    static constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024;

    // ContentId of an in-memory byte sequence.
    static content_id_t identify(const std::vector<uint8_t>& bytes);

    // ContentId of a file, streamed from disk.
    static content_id_t identify_file(const fs::path& file_path);

    /**
     * @brief Splits [0, file_size) into consecutive chunks of chunk_size bytes.
     *
     * Every chunk but the last is exactly chunk_size long; the lengths sum to
     * file_size. A zero-byte file yields no chunks.
     *
     * @throws ChunkShareError(InvalidArgument) if file_size < 0 or chunk_size <= 0.
     */
    static std::vector<ChunkSpec> partition(int64_t file_size, int64_t chunk_size,
                                            const content_id_t& content_id = {});

    static uint32_t chunk_count(int64_t file_size, int64_t chunk_size);

    // Single entry of partition(); throws InvalidArgument for an index past the end.
    static ChunkSpec chunk_spec(int64_t file_size, int64_t chunk_size, uint32_t chunk_index,
                                const content_id_t& content_id = {});

    /**
     * @brief Creates a manifest for a given file.
     *
     * @throws ChunkShareError(InvalidArgument) if the path is not a regular file,
     *         ChunkShareError(StorageError) if it cannot be read.
     */
    static Manifest create_manifest_from_file(const fs::path& file_path,
                                              uint32_t chunk_size = DEFAULT_CHUNK_SIZE);
};

#endif // CHUNKSHARE_CHUNKER_HPP
