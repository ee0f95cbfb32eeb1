#ifndef CHUNKSHARE_MANIFEST_HPP
#define CHUNKSHARE_MANIFEST_HPP

#include <string>
#include <cstdint>
#include <iostream>

// 40 lowercase hex characters of the SHA-1 over the whole file.
using content_id_t = std::string;

struct ChunkSpec {
    content_id_t content_id;
    uint32_t chunk_index = 0;
    uint64_t offset = 0;
    uint32_t length = 0;

    bool operator==(const ChunkSpec& other) const {
        return content_id == other.content_id && chunk_index == other.chunk_index &&
               offset == other.offset && length == other.length;
    }
};

// Describes one file a peer holds in full.
struct Manifest {
    content_id_t content_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t chunk_size = 0;

    uint32_t chunk_count() const {
        if (chunk_size == 0) return 0;
        return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
    }

    void print(std::ostream& out = std::cout) const {
        out << "--- Manifest ---\n"
            << "Content ID:   " << content_id << "\n"
            << "File Name:    " << file_name << "\n"
            << "File Size:    " << file_size << " bytes\n"
            << "Chunk Size:   " << chunk_size << " bytes\n"
            << "Chunk Count:  " << chunk_count() << "\n"
            << "----------------\n";
    }
};

#endif // CHUNKSHARE_MANIFEST_HPP
