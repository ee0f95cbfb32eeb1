#ifndef CHUNKSHARE_HTTP_REGISTRY_CLIENT_HPP
#define CHUNKSHARE_HTTP_REGISTRY_CLIENT_HPP

#include <string>
#include <chrono>

#include "registry_client.hpp"

/**
 * @brief RegistryClient speaking the tracker's HTTP/JSON API through libcurl.
 *
 * Every call uses its own easy handle, so one instance may be shared between
 * threads.
 */
class HttpRegistryClient : public RegistryClient {
public:
    HttpRegistryClient(std::string base_url, std::chrono::milliseconds timeout);

    PublishResult publish(const PublishRequest& request) override;
    std::optional<LookupResult> lookup(const std::string& file_name) override;
    std::vector<FileListing> list_files() override;

    const std::string& base_url() const { return base_url_; }

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    // Throws ChunkShareError(RegistryUnreachable) on transport failure.
    HttpResponse perform(const std::string& method, const std::string& path, const std::string& body = "");

    // Builds RegistryRejected from an error reply's {"error": ...} body.
    [[noreturn]] void throw_rejected(const std::string& operation, const HttpResponse& response);

    std::string escape(const std::string& value);

    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

#endif // CHUNKSHARE_HTTP_REGISTRY_CLIENT_HPP
