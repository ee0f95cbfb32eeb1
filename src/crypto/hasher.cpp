#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <cctype>

namespace Hasher {

namespace {

struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };

constexpr size_t FILE_BLOCK_SIZE = 64 * 1024;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

struct Sha1Stream::Impl {
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx;
    bool finished = false;
};

Sha1Stream::Sha1Stream() : impl_(std::make_unique<Impl>()) {
    impl_->ctx.reset(EVP_MD_CTX_new());
    if (!impl_->ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (!EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha1(), nullptr)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha1Stream::~Sha1Stream() = default;

void Sha1Stream::update(const uint8_t* data, size_t len) {
    if (impl_->finished) {
        throw std::logic_error("Sha1Stream::update after finish");
    }
    if (len == 0) return;
    if (!EVP_DigestUpdate(impl_->ctx.get(), data, len)) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

digest_t Sha1Stream::finish() {
    if (impl_->finished) {
        throw std::logic_error("Sha1Stream::finish called twice");
    }
    digest_t digest{};
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) || len != SHA1_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    impl_->finished = true;
    return digest;
}

digest_t sha1(const uint8_t* data, size_t len) {
    Sha1Stream stream;
    stream.update(data, len);
    return stream.finish();
}

digest_t sha1(const std::vector<uint8_t>& data) {
    return sha1(data.data(), data.size());
}

digest_t sha1(const std::string& data) {
    return sha1(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

digest_t sha1_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for hashing: " + path.string());
    }

    Sha1Stream stream;
    std::vector<char> block(FILE_BLOCK_SIZE);
    while (file) {
        file.read(block.data(), block.size());
        std::streamsize got = file.gcount();
        if (got > 0) {
            stream.update(reinterpret_cast<const uint8_t*>(block.data()), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }
    return stream.finish();
}

std::string to_hex(const digest_t& digest) {
    std::stringstream ss;
    for (uint8_t byte : digest) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

digest_t from_hex(const std::string& hex) {
    if (!is_hex_digest(hex)) {
        throw std::invalid_argument("Not a SHA-1 hex digest: " + hex);
    }
    digest_t digest{};
    for (size_t i = 0; i < SHA1_SIZE; ++i) {
        digest[i] = static_cast<uint8_t>((hex_value(hex[i * 2]) << 4) | hex_value(hex[i * 2 + 1]));
    }
    return digest;
}

bool is_hex_digest(const std::string& hex) {
    if (hex.size() != SHA1_SIZE * 2) return false;
    for (char c : hex) {
        if (hex_value(c) < 0) return false;
    }
    return true;
}

} // namespace Hasher
