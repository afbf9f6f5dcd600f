#include "radnote/http_service.hpp"

#include <algorithm>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace radnote {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::size_t k_minimum_workers{2};

/**
 * @brief One request/response exchange on an accepted connection.
 *
 * Stream operations run only on the io_context thread. The parsed request is
 * handed to the worker pool for routing and the response is posted back to
 * the stream's executor for writing, after which the connection is closed.
 */
class HttpSession final : public std::enable_shared_from_this<HttpSession> {
  public:
    HttpSession(tcp::socket&& socket,
                RequestRouter& router,
                asio::thread_pool& workers,
                std::chrono::seconds io_timeout,
                std::shared_ptr<spdlog::logger> logger)
        : stream_(std::move(socket)),
          router_(router),
          workers_(workers),
          io_timeout_(io_timeout),
          logger_(std::move(logger)) {}

    void run() {
        stream_.expires_after(io_timeout_);
        http::async_read(stream_, buffer_, request_,
            [self = shared_from_this()](beast::error_code error, std::size_t) {
                self->on_read(error);
            });
    }

  private:
    void on_read(beast::error_code error) {
        if (error) {
            if (error == beast::error::timeout) {
                logger_->debug("Closing connection idle for {}s", io_timeout_.count());
            } else if (error != http::error::end_of_stream) {
                logger_->debug("Read failed: {}", error.message());
            }
            close();
            return;
        }
        asio::post(workers_, [self = shared_from_this()]() {
            self->route_request();
        });
    }

    void route_request() {
        std::shared_ptr<HttpResponse> response;
        try {
            response = std::make_shared<HttpResponse>(router_.handle(request_));
        } catch (const std::exception& exc) {
            logger_->error("Connection handler failed: {}", exc.what());
        }
        asio::post(stream_.get_executor(), [self = shared_from_this(), response]() {
            if (response) {
                self->write_response(response);
            } else {
                self->close();
            }
        });
    }

    void write_response(const std::shared_ptr<HttpResponse>& response) {
        stream_.expires_after(io_timeout_);
        http::async_write(stream_, *response,
            [self = shared_from_this(), response](beast::error_code error, std::size_t) {
                if (error) {
                    self->logger_->debug("Write failed: {}", error.message());
                }
                self->close();
            });
    }

    void close() {
        beast::error_code error_shutdown;
        stream_.socket().shutdown(tcp::socket::shutdown_send, error_shutdown);
        stream_.close();
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    RequestRouter& router_;
    asio::thread_pool& workers_;
    std::chrono::seconds io_timeout_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace

HttpService::HttpService(HttpServiceConfig config, RequestRouter& router)
    : config_(std::move(config)),
      router_(router),
      io_context_(),
      acceptor_(io_context_),
      logger_(get_logger()) {}

HttpService::~HttpService() {
    stop();
}

std::uint16_t HttpService::bound_port() const noexcept {
    return bound_port_.load();
}

/**
 * @brief Bind the listening socket and launch the accept loop.
 */
void HttpService::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    try {
        const tcp::endpoint endpoint{asio::ip::make_address(config_.address), config_.port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
        bound_port_.store(acceptor_.local_endpoint().port());
    } catch (const std::exception&) {
        flag_running_.store(false);
        throw;
    }

    const std::size_t worker_count = config_.worker_count > 0
        ? config_.worker_count
        : std::max<std::size_t>(k_minimum_workers, std::thread::hardware_concurrency());
    workers_ = std::make_unique<asio::thread_pool>(worker_count);

    accept_next();
    accept_thread_ = std::thread([this]() { io_context_.run(); });
    logger_->info("HTTP service listening on {}:{} with {} workers", config_.address, bound_port(), worker_count);
}

/**
 * @brief Close the acceptor, stop the I/O loop, and join all threads.
 *
 * Sessions still pending in the io_context are destroyed with it, which
 * closes their sockets.
 */
void HttpService::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Stopping HTTP service");
    asio::post(io_context_, [this]() {
        boost::system::error_code error_close;
        acceptor_.close(error_close);
        io_context_.stop();
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (workers_) {
        workers_->join();
        workers_.reset();
    }
}

void HttpService::accept_next() {
    acceptor_.async_accept([this](boost::system::error_code error, tcp::socket socket) {
        if (!flag_running_.load()) {
            return;
        }
        if (error) {
            logger_->warn("Accept failed: {}", error.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), router_, *workers_, config_.io_timeout, logger_)->run();
        }
        accept_next();
    });
}

}  // namespace radnote
