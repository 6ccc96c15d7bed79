#include "aegis/runtime/OperatorServer.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <iostream>
#include <thread>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace aegis {

OperatorServer::OperatorServer(OperatorApi& api, std::string bind, uint16_t port,
                               std::chrono::milliseconds io_timeout)
    : api_(api), bind_(std::move(bind)), port_(port), io_timeout_(io_timeout) {}

void OperatorServer::run(const std::atomic<bool>& running) {
    try {
        asio::io_context ioc;
        tcp::endpoint ep(asio::ip::make_address(bind_), port_);
        tcp::acceptor acceptor(ioc);
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        acceptor.non_blocking(true);
        bound_port_.store(acceptor.local_endpoint().port());

        std::cout << "[HTTP] Operator API on " << bind_ << ":" << bound_port_.load() << "\n";

        while (running.load()) {
            tcp::socket socket(ioc);
            beast::error_code ec;
            acceptor.accept(socket, ec);

            if (ec == asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) {
                std::cerr << "[HTTP] accept: " << ec.message() << "\n";
                continue;
            }

            // The stream's deadline only covers async operations, so each
            // step is started async and driven to completion on this thread.
            beast::tcp_stream stream(std::move(socket));
            beast::flat_buffer buffer;
            http::request<http::string_body> req;

            stream.expires_after(io_timeout_);
            http::async_read(stream, buffer, req,
                             [&ec](beast::error_code e, std::size_t) { ec = e; });
            ioc.restart();
            ioc.run();
            if (ec == beast::error::timeout) {
                timed_out_++;
                std::cerr << "[HTTP] read: client idle for " << io_timeout_.count()
                          << "ms, dropped\n";
                continue;
            }
            if (ec) {
                // Malformed or truncated request; drop the connection.
                std::cerr << "[HTTP] read: " << ec.message() << "\n";
                continue;
            }

            ApiResponse out = api_.handle(std::string(req.method_string()),
                                          std::string(req.target()),
                                          req.body());

            http::response<http::string_body> res;
            res.version(req.version());
            res.result(static_cast<http::status>(out.status));
            res.set(http::field::server, "aegisd");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = out.body.dump();
            res.prepare_payload();

            stream.expires_after(io_timeout_);
            http::async_write(stream, res,
                              [&ec](beast::error_code e, std::size_t) { ec = e; });
            ioc.restart();
            ioc.run();
            if (ec) {
                if (ec == beast::error::timeout) timed_out_++;
                std::cerr << "[HTTP] write: " << ec.message() << "\n";
                continue;
            }
            served_++;

            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << e.what() << "\n";
    }
    std::cout << "[HTTP] Operator API stopped\n";
}

} // namespace aegis
