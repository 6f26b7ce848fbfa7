#pragma once
/*
  Loopback HTTP server for selftests

  Accepts exactly one connection on 127.0.0.1 (ephemeral port), reads the
  request head, then one of:
    - kRespond          write the canned response verbatim, then close
    - kRespondKeepOpen  write it, then keep the socket open until the client
                        hangs up (a device ignoring "Connection: close")
    - kStall            write nothing until the client gives up
  Verbatim means the response can carry deliberately broken framing.
*/

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace devcfg::selftest {

class LoopbackHttpServer final {
public:
    enum class Mode { kRespond, kRespondKeepOpen, kStall };

    explicit LoopbackHttpServer(std::string response, Mode mode = Mode::kRespond);
    ~LoopbackHttpServer();

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    std::uint16_t port() const noexcept { return port_; }
    std::string url(std::string_view target = "/DbXmlInfo.xml") const;

    // Request head as received (empty until a client connected).
    std::string last_request() const;
    // True once the canned response was written.
    bool served() const noexcept { return served_.load(); }

private:
    void serve();

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::string response_;
    Mode mode_;

    mutable std::mutex mu_;
    std::string request_;
    std::atomic<bool> accepted_{false};
    std::atomic<bool> served_{false};
    std::thread thread_;
};

// A loopback port nothing listens on (bound, then released).
std::uint16_t unused_loopback_port();

// Canned response helpers.
std::string http_response(unsigned status, std::string_view reason, std::string_view body);

} // namespace devcfg::selftest
