#include "cli/cli.hpp"
#include "common/error.hpp"
#include <sstream>
#include <iomanip>

CLI::CLI(PeerNode& node, std::istream& in, std::ostream& out)
    : node_(node), in_(in), out_(out), running_(false) {}

void CLI::run() {
    running_ = true;
    print_help();

    std::string line;
    while (running_) {
        out_ << "> " << std::flush;
        if (!std::getline(in_, line)) break;
        if (line.empty()) continue;
        running_ = handle_command(line);
    }
}

void CLI::print_help() {
    out_ << "Available commands:\n"
         << "  share <file_path>       - Share a file with the network\n"
         << "  download <file_name>    - Download a file by name\n"
         << "  files                   - List files known to the tracker\n"
         << "  status                  - Show this peer and its shared files\n"
         << "  help                    - Show this help\n"
         << "  quit / exit             - Exit\n"
         << std::endl;
}

bool CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string rest;
    std::getline(iss >> std::ws, rest);
    // File names and paths may contain spaces
    if (!rest.empty()) args.push_back(rest);

    if (cmd == "share") cmd_share(args);
    else if (cmd == "download") cmd_download(args);
    else if (cmd == "files") cmd_files(args);
    else if (cmd == "status") cmd_status(args);
    else if (cmd == "help") print_help();
    else if (cmd == "quit" || cmd == "exit") return false;
    else out_ << "Unknown command: " << cmd << std::endl;
    return true;
}

void CLI::report_error(const std::string& action, const std::exception& e) {
    auto* error = dynamic_cast<const ChunkShareError*>(&e);
    if (error && is_unavailable(error->code())) {
        out_ << "Not available [" << error_code_name(error->code()) << "]: " << e.what() << std::endl;
    } else if (error) {
        out_ << action << " failed [" << error_code_name(error->code()) << "]: " << e.what() << std::endl;
    } else {
        out_ << action << " failed: " << e.what() << std::endl;
    }
}

void CLI::cmd_share(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: share <file_path>" << std::endl;
        return;
    }
    try {
        ShareRecord record = node_.share(args[0]);
        out_ << "File shared successfully!\n"
             << "Content ID: " << record.manifest.content_id << "\n"
             << "Size: " << record.manifest.file_size << " bytes\n"
             << "Chunks: " << record.manifest.chunk_count() << std::endl;
    } catch (const std::exception& e) {
        report_error("Share", e);
    }
}

void CLI::cmd_download(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: download <file_name>" << std::endl;
        return;
    }
    try {
        DownloadResult result = node_.download(args[0]);
        if (result.from_store) {
            out_ << "Already downloaded: " << result.path.string() << std::endl;
        } else {
            out_ << "Downloaded " << result.file_name << " (" << result.file_size << " bytes)\n"
                 << "Saved to: " << result.path.string() << std::endl;
        }
    } catch (const std::exception& e) {
        report_error("Download", e);
    }
}

void CLI::cmd_files(const std::vector<std::string>&) {
    try {
        auto files = node_.list_registry_files();
        out_ << "Files on tracker: " << files.size() << std::endl;
        for (const auto& f : files) {
            out_ << " - " << std::left << std::setw(30) << f.file_name
                 << std::right << std::setw(12) << f.file_size << " bytes  "
                 << f.peer_count << " peers  " << f.content_id << std::endl;
        }
    } catch (const std::exception& e) {
        report_error("Listing", e);
    }
}

void CLI::cmd_status(const std::vector<std::string>&) {
    out_ << "Peer address: " << node_.address().to_string() << std::endl;
    try {
        auto shares = node_.shared_files();
        out_ << "Shared Files: " << shares.size() << std::endl;
        for (const auto& s : shares) {
            out_ << " - " << s.manifest.file_name << " (" << s.manifest.content_id << ") "
                 << s.file_path << std::endl;
        }
    } catch (const std::exception& e) {
        report_error("Status", e);
    }
}
