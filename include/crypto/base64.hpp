#ifndef CHUNKSHARE_BASE64_HPP
#define CHUNKSHARE_BASE64_HPP

#include <vector>
#include <string>
#include <optional>
#include <cstdint>

// RFC 4648 standard alphabet with padding, backed by OpenSSL's EVP block codec.
namespace Base64 {

std::string encode(const std::vector<uint8_t>& data);

// Returns nullopt on characters outside the alphabet or a bad length.
// Surrounding whitespace (CR/LF) is ignored.
std::optional<std::vector<uint8_t>> decode(const std::string& text);

} // namespace Base64

#endif // CHUNKSHARE_BASE64_HPP
