#ifndef CHUNKSHARE_HASHER_HPP
#define CHUNKSHARE_HASHER_HPP

#include <vector>
#include <string>
#include <array>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <filesystem>

namespace Hasher {

constexpr size_t SHA1_SIZE = 20;
using digest_t = std::array<uint8_t, SHA1_SIZE>;

/**
 * @brief Calculates the SHA-1 digest of a data buffer.
 * @throws std::runtime_error if the OpenSSL digest context fails.
 */
digest_t sha1(const uint8_t* data, size_t len);
digest_t sha1(const std::vector<uint8_t>& data);
digest_t sha1(const std::string& data);

/**
 * @brief Streams a file through SHA-1 in fixed blocks.
 * @throws std::runtime_error if the file cannot be read.
 */
digest_t sha1_file(const std::filesystem::path& path);

// Incremental SHA-1 for data that arrives in pieces
class Sha1Stream {
public:
    Sha1Stream();
    ~Sha1Stream();
    Sha1Stream(const Sha1Stream&) = delete;
    Sha1Stream& operator=(const Sha1Stream&) = delete;

    void update(const uint8_t* data, size_t len);
    digest_t finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Lowercase hex
std::string to_hex(const digest_t& digest);
// Accepts either case; throws std::invalid_argument on bad length or characters
digest_t from_hex(const std::string& hex);

bool is_hex_digest(const std::string& hex);

} // namespace Hasher

#endif // CHUNKSHARE_HASHER_HPP
