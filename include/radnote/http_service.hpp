// === HTTP Service ============================================================
//
// Accepts TCP connections and performs all socket I/O asynchronously on a
// background io_context thread, with a deadline on every read and write.
// Each parsed request is routed on a worker from a thread pool, so a slow
// store operation never stalls I/O and an idle client never holds a worker.

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "radnote/logging.hpp"
#include "radnote/request_router.hpp"

namespace radnote {

/** @brief Listen endpoint, worker sizing and I/O deadline for the HTTP service. */
struct HttpServiceConfig final {
    std::string address{};                  /**< Listen address, e.g. 0.0.0.0. */
    std::uint16_t port{};                   /**< Listen port; 0 picks an ephemeral port. */
    std::size_t worker_count{};             /**< Request workers; 0 uses hardware concurrency. */
    std::chrono::seconds io_timeout{30};    /**< Deadline for reading a request or writing a response. */
};

class HttpService final {
  public:
    HttpService(HttpServiceConfig config, RequestRouter& router);
    ~HttpService();

    HttpService(const HttpService&) = delete;
    HttpService& operator=(const HttpService&) = delete;

    /** @brief Bind, listen, and start accepting on a background thread. */
    void start();
    /** @brief Stop accepting, abandon open connections, and join all threads. */
    void stop();

    /** @brief Port actually bound (useful when configured with 0). */
    [[nodiscard]] std::uint16_t bound_port() const noexcept;

  private:
    void accept_next();

    HttpServiceConfig config_;
    RequestRouter& router_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unique_ptr<boost::asio::thread_pool> workers_;
    std::thread accept_thread_;
    std::atomic<bool> flag_running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace radnote
