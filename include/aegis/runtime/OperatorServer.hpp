#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "aegis/runtime/OperatorApi.hpp"

namespace aegis {

// Synchronous Boost.Beast front for OperatorApi. One request per connection.
// run() returns once `running` goes false (polled between accepts).
//
// Each connection gets io_timeout to deliver its request and take the
// response; a client that stalls is dropped so the loop keeps serving.
// Port 0 binds an ephemeral port, reported by bound_port() once listening.
class OperatorServer {
public:
    OperatorServer(OperatorApi& api, std::string bind, uint16_t port,
                   std::chrono::milliseconds io_timeout = std::chrono::seconds(5));

    void run(const std::atomic<bool>& running);

    uint64_t served() const { return served_.load(); }
    uint64_t timed_out() const { return timed_out_.load(); }
    uint16_t bound_port() const { return bound_port_.load(); }

private:
    OperatorApi& api_;
    std::string bind_;
    uint16_t port_;
    std::chrono::milliseconds io_timeout_;
    std::atomic<uint64_t> served_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint16_t> bound_port_{0};
};

} // namespace aegis
