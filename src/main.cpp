#include <iostream>
#include <string>
#include <asio.hpp>
#include <csignal>

#include "cli/cli.hpp"
#include "cli/options.hpp"
#include "node/peer_node.hpp"
#include "registry/http_registry_client.hpp"
#include "tracker/tracker_server.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"

namespace {

// Blocks until SIGINT or SIGTERM.
void wait_for_interrupt() {
    asio::io_context io_context;
    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([](const asio::error_code&, int signal_number) {
        LOG_INFO("Received signal ", signal_number, ", shutting down");
    });
    io_context.run();
}

int run_tracker(const Config& config) {
    TrackerState state;
    TrackerServer server(config.tracker_port, state, config.server_threads);
    server.start();
    std::cout << "Tracker running on port " << server.port() << " (Ctrl+C to stop)" << std::endl;
    wait_for_interrupt();
    server.stop();
    return EXIT_STATUS_OK;
}

int run_list(const Config& config) {
    HttpRegistryClient registry(config.tracker_url, config.registry_timeout);
    auto files = registry.list_files();
    std::cout << files.size() << " files on " << registry.base_url() << std::endl;
    for (const auto& f : files) {
        std::cout << f.content_id << "  " << f.file_size << " bytes  " << f.peer_count
                  << " peers  " << f.file_name << std::endl;
    }
    return EXIT_STATUS_OK;
}

int run_peer(const CommandLine& cmd) {
    Config config = cmd.config;
    if (cmd.mode == "download" && !cmd.stay) {
        // A one-shot download neither listens on the shared port nor announces itself
        if (!cmd.port_given) config.port = 0;
        config.reshare_downloads = false;
    }

    HttpRegistryClient registry(config.tracker_url, config.registry_timeout);
    PeerNode node(config, registry);
    node.start();

    if (cmd.mode == "interactive") {
        std::cout << "Peer started on " << node.address().to_string() << std::endl;
        try {
            size_t count = node.republish_all();
            if (count > 0) std::cout << "Republished " << count << " shared files" << std::endl;
        } catch (const ChunkShareError& e) {
            std::cout << "Could not republish shared files [" << error_code_name(e.code()) << "]: "
                      << e.what() << std::endl;
        }
        CLI cli(node);
        cli.run();
        node.stop();
        return EXIT_STATUS_OK;
    }

    if (cmd.mode == "share") {
        ShareRecord record = node.share(cmd.positional[0]);
        std::cout << "Sharing " << record.manifest.file_name << " (" << record.manifest.content_id << ", "
                  << record.manifest.chunk_count() << " chunks) on " << node.address().to_string()
                  << "\nPress Ctrl+C to stop." << std::endl;
        wait_for_interrupt();
        node.stop();
        return EXIT_STATUS_OK;
    }

    // download
    node.set_progress_callback([](const SessionProgress& p) {
        LOG_DEBUG("Progress: ", p.done, "/", p.total, " chunks");
    });
    DownloadResult result = node.download(cmd.positional[0]);
    std::cout << (result.from_store ? "Already downloaded: " : "Downloaded: ") << result.path.string()
              << " (" << result.file_size << " bytes, " << result.content_id << ")" << std::endl;
    if (cmd.stay) {
        std::cout << "Serving on " << node.address().to_string() << ". Press Ctrl+C to stop." << std::endl;
        wait_for_interrupt();
    }
    node.stop();
    return EXIT_STATUS_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parse_command_line(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage_text();
        return EXIT_STATUS_USAGE;
    } catch (const ChunkShareError& e) {
        std::cerr << "Error [" << error_code_name(e.code()) << "]: " << e.what() << std::endl;
        return EXIT_STATUS_USAGE;
    }

    Logger::instance().init(cmd.config.log_file);
    Logger::instance().set_level(cmd.config.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    LOG_INFO("Starting chunkshare in ", cmd.mode, " mode");

    try {
        if (cmd.mode == "tracker") return run_tracker(cmd.config);
        if (cmd.mode == "list") return run_list(cmd.config);
        return run_peer(cmd);
    } catch (const ChunkShareError& e) {
        if (is_unavailable(e.code())) {
            LOG_INFO(error_code_name(e.code()), ": ", e.what());
            std::cout << "Not available [" << error_code_name(e.code()) << "]: " << e.what() << std::endl;
        } else {
            LOG_ERR(error_code_name(e.code()), ": ", e.what());
            std::cerr << "Error [" << error_code_name(e.code()) << "]: " << e.what() << std::endl;
        }
        return exit_status_for(e.code());
    } catch (const std::exception& e) {
        LOG_ERR("Fatal Error: ", e.what());
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return EXIT_STATUS_FAILURE;
    }
}
