#include "network/chunk_server.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

ChunkServer::ChunkServer(uint16_t port, const FileSharer& sharer, size_t threads,
                         std::chrono::milliseconds session_deadline)
    : io_context_(),
      acceptor_(asio::make_strand(io_context_)),
      sharer_(sharer),
      thread_count_(threads),
      session_deadline_(session_deadline),
      port_(0) {

    if (thread_count_ == 0) {
        thread_count_ = std::max<size_t>(2, std::thread::hardware_concurrency());
    }

    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();

    LOG_INFO("Chunk server listening on TCP port ", port_);
}

ChunkServer::~ChunkServer() {
    stop();
}

void ChunkServer::start() {
    if (running()) return;
    if (!acceptor_.is_open()) {
        throw std::logic_error("ChunkServer cannot be restarted after stop()");
    }

    work_guard_.emplace(asio::make_work_guard(io_context_));
    start_accept();

    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                LOG_ERR("Chunk server IO thread error: ", e.what());
            }
        });
    }
    LOG_DEBUG("Chunk server started with ", thread_count_, " IO threads");
}

void ChunkServer::stop() {
    if (!running()) return;

    asio::post(acceptor_.get_executor(), [this]() {
        asio::error_code ignored;
        acceptor_.close(ignored);
    });
    work_guard_.reset();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    io_context_.restart();
    LOG_INFO("Chunk server on port ", port_, " stopped (served ", stats_.served.load(),
             ", rejected ", stats_.rejected.load(), ")");
}

void ChunkServer::start_accept() {
    auto session = std::make_shared<ChunkSession>(io_context_, sharer_, stats_, session_deadline_);

    acceptor_.async_accept(session->socket(),
        [this, session](const asio::error_code& error) {
            if (error == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!error) {
                stats_.accepted++;
                session->start();
            } else {
                LOG_ERR("Error accepting connection: ", error.message());
            }
            start_accept();
        });
}
