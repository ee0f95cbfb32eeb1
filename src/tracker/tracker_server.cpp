#include "tracker/tracker_server.hpp"
#include "registry/registry_json.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

using json = nlohmann::json;

namespace {

void set_json(httplib::Response& response, int status, const json& body) {
    response.status = status;
    response.set_content(body.dump(), "application/json");
}

void set_error(httplib::Response& response, int status, const std::string& message) {
    set_json(response, status, json{{"error", message}});
}

const char* default_error_message(int status) {
    switch (status) {
        case 404: return "Not found";
        case 405: return "Method not allowed";
        case 413: return "Request too large";
        case 500: return "Internal server error";
        default:  return "Bad request";
    }
}

using RouteHandler = std::function<void(const httplib::Request&, httplib::Response&)>;

// Turns an escaped exception into a JSON 500 instead of httplib's bare one.
httplib::Server::Handler guarded(RouteHandler handler) {
    return [handler](const httplib::Request& request, httplib::Response& response) {
        try {
            handler(request, response);
        } catch (const std::exception& e) {
            LOG_ERR("Tracker failed handling ", request.method, " ", request.path, ": ", e.what());
            set_error(response, 500, "Internal server error");
        }
    };
}

void method_not_allowed(const httplib::Request&, httplib::Response& response) {
    set_error(response, 405, "Method not allowed");
}

} // namespace

TrackerServer::TrackerServer(uint16_t port, TrackerState& state, size_t threads,
                             std::chrono::milliseconds read_timeout)
    : state_(state), thread_count_(threads), port_(0) {

    if (thread_count_ == 0) {
        thread_count_ = std::max<size_t>(2, std::thread::hardware_concurrency());
    }
    size_t pool_size = thread_count_;
    server_.new_task_queue = [pool_size]() { return new httplib::ThreadPool(pool_size); };

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(read_timeout);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(read_timeout - seconds);
    server_.set_read_timeout(seconds.count(), micros.count());
    server_.set_write_timeout(seconds.count(), micros.count());
    server_.set_keep_alive_max_count(1);
    server_.set_payload_max_length(MAX_BODY_SIZE);

    install_routes();

    if (port == 0) {
        int bound = server_.bind_to_any_port("0.0.0.0");
        if (bound <= 0) {
            throw std::runtime_error("Failed to bind tracker to an ephemeral port");
        }
        port_ = static_cast<uint16_t>(bound);
    } else {
        if (!server_.bind_to_port("0.0.0.0", port)) {
            throw std::runtime_error("Failed to bind tracker to port " + std::to_string(port));
        }
        port_ = port;
    }

    LOG_INFO("Tracker listening on HTTP port ", port_);
}

TrackerServer::~TrackerServer() {
    stop();
}

void TrackerServer::start() {
    if (running()) return;
    if (stopped_) {
        throw std::logic_error("TrackerServer cannot be restarted after stop()");
    }

    listen_returned_ = false;
    listener_ = std::thread([this]() {
        if (!server_.listen_after_bind()) {
            LOG_ERR("Tracker on port ", port_, " stopped listening with an error");
        }
        listen_returned_ = true;
    });

    // stop() is a no-op until the accept loop is running
    while (!server_.is_running() && !listen_returned_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void TrackerServer::stop() {
    if (!running()) return;

    server_.stop();
    listener_.join();
    stopped_ = true;
    LOG_INFO("Tracker on port ", port_, " stopped (", state_.file_count(), " files known)");
}

void TrackerServer::install_routes() {
    static const char* get_file_pattern = R"(/get_file/(.+))";

    server_.Post("/register", guarded([this](const httplib::Request& request, httplib::Response& response) {
        handle_register(request, response);
    }));

    server_.Get("/lookup", guarded([this](const httplib::Request& request, httplib::Response& response) {
        std::string file_name = request.has_param("file_name") ? request.get_param_value("file_name") : "";
        if (file_name.empty()) {
            set_error(response, 400, "Missing file_name parameter");
            return;
        }
        handle_lookup(file_name, response);
    }));

    // Path is already URL-decoded by httplib
    server_.Get(get_file_pattern, guarded([this](const httplib::Request& request, httplib::Response& response) {
        handle_lookup(request.matches[1].str(), response);
    }));

    server_.Get("/files", guarded([this](const httplib::Request&, httplib::Response& response) {
        handle_files(response);
    }));

    // Known routes under the wrong method
    server_.Get("/register", method_not_allowed);
    for (const char* path : {"/lookup", "/files", get_file_pattern}) {
        server_.Post(path, method_not_allowed);
        server_.Put(path, method_not_allowed);
        server_.Delete(path, method_not_allowed);
    }
    server_.Put("/register", method_not_allowed);
    server_.Delete("/register", method_not_allowed);

    // Unmatched routes, oversized bodies and parse failures get a JSON body too
    server_.set_error_handler([](const httplib::Request&, httplib::Response& response) {
        if (response.body.empty()) {
            set_error(response, response.status, default_error_message(response.status));
        }
    });

    server_.set_logger([](const httplib::Request& request, const httplib::Response& response) {
        LOG_DEBUG(request.method, " ", request.path, " -> ", response.status);
    });
}

void TrackerServer::handle_register(const httplib::Request& request, httplib::Response& response) {
    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        set_error(response, 400, "Invalid JSON body");
        return;
    }

    static const char* required[] = {"file_name", "file_hash", "file_size", "chunks", "ip", "port"};
    for (const char* field : required) {
        if (!body.contains(field)) {
            set_error(response, 400, std::string("Missing field: ") + field);
            return;
        }
    }

    PublishRequest publish_request;
    try {
        publish_request = body.get<PublishRequest>();
    } catch (const json::exception& e) {
        set_error(response, 400, std::string("Invalid field: ") + e.what());
        return;
    } catch (const ChunkShareError& e) {
        set_error(response, 400, std::string("Invalid field: ") + e.what());
        return;
    }

    set_json(response, 200, state_.publish(publish_request));
}

void TrackerServer::handle_lookup(const std::string& file_name, httplib::Response& response) {
    auto result = state_.lookup(file_name);
    if (!result) {
        set_error(response, 404, "File not found");
        return;
    }
    set_json(response, 200, *result);
}

void TrackerServer::handle_files(httplib::Response& response) {
    set_json(response, 200, json{{"files", state_.list_files()}});
}
