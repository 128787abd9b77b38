#pragma once
#include "hs602/net/NetConfig.hpp"
#include "hs602/net/Deadline.hpp"

#include <cstdint>
#include <memory>

namespace hs602::net {

/**
 * UdpSocket
 *
 * Small helper for discovery broadcasts and the control-port knock.
 * `send_to` / `recv_from` use the same `with_deadline` pattern as the TCP
 * client. The socket is closed by the destructor, so a scoped UdpSocket is
 * released on every exit path.
 */
class UdpSocket {
public:
    explicit UdpSocket(asio::io_context& io) : sock_(io) {}
    ~UdpSocket() { close(); }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind_any(std::uint16_t port) {
        error_code ec;
        sock_.set_option(asio::socket_base::reuse_address(true), ec);
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on=true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    // Send a datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        auto ex = sock_.get_executor();
        return with_deadline(ex, timeout,
            [&](auto cb){ sock_.async_send_to(asio::buffer(data, n), ep, 0, cb); },
            [this]{ error_code ignore; sock_.cancel(ignore); });
    }

    // Receive one datagram, with timeout. Fills out_ep + out_n on success.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        auto ex = sock_.get_executor();
        auto received = std::make_shared<std::size_t>(0);
        auto sender = std::make_shared<udp::endpoint>();
        auto ec = with_deadline(ex, timeout,
            [&](auto cb){
                sock_.async_receive_from(asio::buffer(data, max), *sender, 0,
                    [received, sender, cb](const error_code& op_ec, std::size_t n){
                        *received = n;
                        cb(op_ec);
                    });
            },
            [this]{ error_code ignore; sock_.cancel(ignore); });
        out_n = ec ? 0 : *received;
        if (!ec) {
            out_ep = *sender;
        }
        return ec;
    }

    bool is_open() const { return sock_.is_open(); }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    udp::socket sock_;
};

} // namespace hs602::net
