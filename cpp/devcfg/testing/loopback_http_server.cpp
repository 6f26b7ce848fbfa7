#include "loopback_http_server.hpp"

#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <utility>

namespace devcfg::selftest {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

tcp::endpoint loopback(std::uint16_t port) {
    return tcp::endpoint(net::ip::make_address_v4("127.0.0.1"), port);
}

} // namespace

LoopbackHttpServer::LoopbackHttpServer(std::string response, Mode mode)
    : acceptor_(ioc_, loopback(0)), response_(std::move(response)), mode_(mode) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve(); });
}

LoopbackHttpServer::~LoopbackHttpServer() {
    if (!accepted_.load()) {
        // Nobody connected: wake the blocking accept() with a throwaway client.
        boost::system::error_code ec;
        tcp::socket poke(ioc_);
        poke.connect(loopback(port_), ec);
        poke.close(ec);
    }
    if (thread_.joinable()) thread_.join();
}

std::string LoopbackHttpServer::url(std::string_view target) const {
    return "http://127.0.0.1:" + std::to_string(port_) + std::string(target);
}

std::string LoopbackHttpServer::last_request() const {
    std::lock_guard<std::mutex> lk(mu_);
    return request_;
}

void LoopbackHttpServer::serve() {
    boost::system::error_code ec;
    tcp::socket sock(ioc_);
    acceptor_.accept(sock, ec);
    accepted_.store(true);
    if (ec) return;

    std::string head;
    net::read_until(sock, net::dynamic_buffer(head), "\r\n\r\n", ec);
    {
        std::lock_guard<std::mutex> lk(mu_);
        request_ = head;
    }
    if (ec) return;

    if (mode_ != Mode::kStall) {
        net::write(sock, net::buffer(response_), ec);
        if (!ec) served_.store(true);
    }

    if (mode_ == Mode::kRespond) {
        sock.shutdown(tcp::socket::shutdown_send, ec);
        sock.close(ec);
        return;
    }

    // Hold the connection open until the client gives up or hangs up.
    char buf[256];
    while (!ec) sock.read_some(net::buffer(buf), ec);
}

std::uint16_t unused_loopback_port() {
    net::io_context ioc;
    tcp::acceptor a(ioc, loopback(0));
    const std::uint16_t port = a.local_endpoint().port();
    a.close();
    return port;
}

std::string http_response(unsigned status, std::string_view reason, std::string_view body) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + std::string(reason) + "\r\n";
    out += "Content-Type: text/xml\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out.append(body.data(), body.size());
    return out;
}

} // namespace devcfg::selftest
