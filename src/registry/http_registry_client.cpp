#include "registry/http_registry_client.hpp"
#include "registry/registry_json.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

using json = nlohmann::json;

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

struct CurlDeleter { void operator()(CURL* c) { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* l) { curl_slist_free_all(l); } };

size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

template<typename T>
T parse_reply(const std::string& operation, const std::string& body) {
    try {
        return json::parse(body).get<T>();
    } catch (const json::exception& e) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable,
                              "Malformed " + operation + " reply from registry: " + e.what());
    } catch (const ChunkShareError& e) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable,
                              "Malformed " + operation + " reply from registry: " + e.what());
    }
}

} // namespace

HttpRegistryClient::HttpRegistryClient(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    ensure_curl_initialized();
}

HttpRegistryClient::HttpResponse HttpRegistryClient::perform(const std::string& method,
                                                             const std::string& path,
                                                             const std::string& body) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable, "curl_easy_init failed");
    }

    std::string url = base_url_ + path;
    HttpResponse response;
    std::unique_ptr<curl_slist, SlistDeleter> headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    if (method == "POST") {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    LOG_DEBUG("Registry ", method, " ", url);
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable,
                              "Failed to connect to tracker at " + base_url_ + ": " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

void HttpRegistryClient::throw_rejected(const std::string& operation, const HttpResponse& response) {
    std::string reason = "HTTP " + std::to_string(response.status);
    try {
        json j = json::parse(response.body);
        if (j.contains("error") && j["error"].is_string()) {
            reason += ": " + j["error"].get<std::string>();
        }
    } catch (const json::exception&) {
        // body was not JSON; the status code is all we have
    }
    if (response.status >= 500) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable, "Tracker " + operation + " failed: " + reason);
    }
    throw ChunkShareError(ErrorCode::RegistryRejected, "Tracker " + operation + " rejected: " + reason);
}

std::string HttpRegistryClient::escape(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable, "curl_easy_init failed");
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "Cannot URL-encode: " + value);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

PublishResult HttpRegistryClient::publish(const PublishRequest& request) {
    json body = request;
    HttpResponse response = perform("POST", "/register", body.dump());
    if (response.status != 200) {
        throw_rejected("registration", response);
    }
    auto result = parse_reply<PublishResult>("register", response.body);
    LOG_INFO("Registered with tracker: ", result.message, " (peers: ", result.peers_count, ")");
    return result;
}

std::optional<LookupResult> HttpRegistryClient::lookup(const std::string& file_name) {
    HttpResponse response = perform("GET", "/lookup?file_name=" + escape(file_name));
    if (response.status == 404) {
        LOG_INFO("Tracker has no record of ", file_name);
        return std::nullopt;
    }
    if (response.status != 200) {
        throw_rejected("lookup", response);
    }
    return parse_reply<LookupResult>("lookup", response.body);
}

std::vector<FileListing> HttpRegistryClient::list_files() {
    HttpResponse response = perform("GET", "/files");
    if (response.status != 200) {
        throw_rejected("file listing", response);
    }
    try {
        return json::parse(response.body).at("files").get<std::vector<FileListing>>();
    } catch (const json::exception& e) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable,
                              std::string("Malformed files reply from registry: ") + e.what());
    } catch (const ChunkShareError& e) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable,
                              std::string("Malformed files reply from registry: ") + e.what());
    }
}
