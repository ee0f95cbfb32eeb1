#ifndef CHUNKSHARE_CLI_HPP
#define CHUNKSHARE_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

#include "../node/peer_node.hpp"

// Interactive shell over a running peer.
class CLI {
public:
    explicit CLI(PeerNode& node, std::istream& in = std::cin, std::ostream& out = std::cout);

    void run();

    // Returns false once the user asked to quit.
    bool handle_command(const std::string& line);

private:
    void print_help();

    void cmd_share(const std::vector<std::string>& args);
    void cmd_download(const std::vector<std::string>& args);
    void cmd_files(const std::vector<std::string>& args);
    void cmd_status(const std::vector<std::string>& args);

    void report_error(const std::string& action, const std::exception& e);

    PeerNode& node_;
    std::istream& in_;
    std::ostream& out_;
    bool running_;
};

#endif // CHUNKSHARE_CLI_HPP
