/*
===============================================================================
HTTP Fetcher
File: http_fetcher.cpp
===============================================================================

Blocking from the caller's point of view, asynchronous underneath: every
network step is started on a private io_context and the context is drained
before the next step. beast::tcp_stream only enforces its expiry on async
operations, which is what bounds the exchange.
===============================================================================
*/

#include "http_fetcher.hpp"

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"
#include "devcfg/sanitize/transport_sanitizer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <utility>

namespace devcfg::fetch {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

// Run the context until every pending handler has been invoked.
void drain(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

[[noreturn]] void fail_network(const RemoteEndpoint& ep,
                               const char* step,
                               const beast::error_code& ec,
                               std::chrono::milliseconds budget) {
    if (ec == beast::error::timeout || ec == net::error::operation_aborted) {
        throw TransportError("could not reach device at " + ep.to_string() + ": " + step +
                             " timed out (budget " + std::to_string(budget.count()) + " ms)");
    }
    if (ec == net::error::connection_refused) {
        throw TransportError("could not reach device at " + ep.to_string() +
                             ": connection refused");
    }
    throw TransportError("could not reach device at " + ep.to_string() + ": " + step +
                         " failed: " + ec.message());
}

tcp::resolver::results_type resolve(net::io_context& ioc,
                                    const RemoteEndpoint& ep,
                                    Clock::time_point deadline,
                                    std::chrono::milliseconds budget) {
    tcp::resolver resolver(ioc);
    net::steady_timer timer(ioc);
    tcp::resolver::results_type results;
    beast::error_code ec;
    bool done = false;

    timer.expires_at(deadline);
    timer.async_wait([&](const beast::error_code& tec) {
        if (!tec && !done) resolver.cancel();
    });
    resolver.async_resolve(ep.host, std::to_string(ep.port),
        [&](const beast::error_code& rec, tcp::resolver::results_type res) {
            ec = rec;
            results = std::move(res);
            done = true;
            timer.cancel();
        });
    drain(ioc);

    if (ec) fail_network(ep, "name resolution", ec, budget);
    return results;
}

using ResponseParser = http::response_parser<http::string_body>;

// Feeds raw[*fed..] to the parser. Running out of input is not an error; the
// caller decides whether more bytes or end of stream follow.
beast::error_code feed(ResponseParser& p, std::string_view raw, std::size_t* fed) {
    beast::error_code ec;
    while (*fed < raw.size() && !p.is_done()) {
        const std::size_t n = p.put(net::const_buffer(raw.data() + *fed, raw.size() - *fed), ec);
        if (ec == http::error::need_more) return {};
        if (ec) return ec;
        if (n == 0) break;
        *fed += n;
    }
    return ec;
}

ParsedResponse release_parsed(ResponseParser& p) {
    auto msg = p.release();
    ParsedResponse out;
    out.status = msg.result_int();
    const auto reason = msg.reason();
    out.reason.assign(reason.data(), reason.size());
    out.body = std::move(msg.body());
    return out;
}

[[noreturn]] void fail_too_large(const RemoteEndpoint& ep, const FetchSettings& cfg) {
    throw TransportError("response from " + ep.to_string() + " exceeds max_bytes (" +
                         std::to_string(cfg.max_bytes) + ")");
}

} // namespace

std::optional<ParsedResponse> parse_response(std::string_view raw,
                                             std::uint64_t body_limit,
                                             std::string* err) {
    ResponseParser p;
    p.eager(true);
    p.body_limit(body_limit);

    std::size_t fed = 0;
    beast::error_code ec = feed(p, raw, &fed);

    // Connection close delimits bodies without Content-Length and exposes
    // truncated ones.
    if (!ec && !p.is_done()) p.put_eof(ec);
    if (ec) {
        if (err) *err = ec.message();
        return std::nullopt;
    }
    return release_parsed(p);
}

FetchResult fetch_manifest(const RemoteEndpoint& ep, const FetchSettings& cfg) {
    cfg.validate_or_throw();

    const auto budget = std::chrono::milliseconds(cfg.timeout_ms);
    const auto deadline = Clock::now() + budget;

    log_debug("fetch: GET " + ep.to_string() + " (timeout " + std::to_string(cfg.timeout_ms) + " ms)");

    net::io_context ioc;
    const auto endpoints = resolve(ioc, ep, deadline, budget);

    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    stream.expires_at(deadline);
    stream.async_connect(endpoints, [&](const beast::error_code& cec, const tcp::endpoint&) {
        ec = cec;
    });
    drain(ioc);
    if (ec) fail_network(ep, "connect", ec, budget);

    // HTTP/1.0 + Connection: close: the device ends the body by closing.
    http::request<http::empty_body> req{http::verb::get, ep.target, 10};
    req.set(http::field::host, ep.host_header());
    req.set(http::field::user_agent, cfg.user_agent);
    req.set(http::field::accept, "application/xml, text/xml, */*");
    req.set(http::field::connection, "close");

    http::async_write(stream, req, [&](const beast::error_code& wec, std::size_t) {
        ec = wec;
    });
    drain(ioc);
    if (ec) fail_network(ep, "sending request", ec, budget);

    // Read until the parser sees the framed end of the message, so a device
    // that ignores "Connection: close" cannot hold a complete response
    // hostage. Once the bytes stop parsing as HTTP, keep reading until the
    // peer closes and give the framing repair the whole response.
    ResponseParser parser;
    parser.eager(true);
    parser.body_limit(cfg.max_bytes);

    const auto cap = static_cast<std::size_t>(cfg.max_bytes);
    std::string raw;
    std::size_t fed = 0;
    beast::error_code perr;
    bool closed = false;

    for (;;) {
        if (!perr) {
            perr = feed(parser, raw, &fed);
            if (perr == http::error::body_limit) fail_too_large(ep, cfg);
            if (!perr && parser.is_done()) break;
        }
        if (closed) break;
        if (raw.size() > cap) fail_too_large(ep, cfg);

        // cap + 1 so that a response of exactly max_bytes is still accepted.
        net::async_read(stream, net::dynamic_buffer(raw, cap + 1), net::transfer_at_least(1),
            [&](const beast::error_code& rec, std::size_t) {
                ec = rec;
            });
        drain(ioc);
        if (ec == net::error::eof) closed = true;
        else if (ec) fail_network(ep, "reading response", ec, budget);
    }
    if (raw.size() > cap) fail_too_large(ep, cfg);

    // Close-delimited body, or a message cut short.
    if (!perr && !parser.is_done()) parser.put_eof(perr);

    beast::error_code sec;
    stream.socket().shutdown(tcp::socket::shutdown_both, sec);
    if (sec && sec != beast::errc::not_connected) {
        log_debug("fetch: socket shutdown: " + sec.message());
    }

    FetchResult out;
    out.endpoint = ep;
    out.bytes_received = raw.size();

    std::optional<ParsedResponse> parsed;
    if (!perr) {
        parsed = release_parsed(parser);
    } else if (auto repaired = sanitize::repair_header_framing(raw)) {
        std::string rerr;
        parsed = parse_response(*repaired, cfg.max_bytes, &rerr);
        if (parsed) {
            out.header_repaired = true;
            log_warn("fetch: repaired non-compliant HTTP header framing from " + ep.to_string() +
                     " (" + perr.message() + ")");
        }
    }
    if (!parsed) {
        throw TransportError("malformed HTTP response from " + ep.to_string() + ": " + perr.message());
    }

    out.status = parsed->status;
    out.reason = std::move(parsed->reason);
    if (out.status < 200 || out.status > 299) {
        throw TransportError("device at " + ep.to_string() + " answered HTTP " +
                             std::to_string(out.status) + " " + out.reason);
    }
    out.body = std::move(parsed->body);

    log_info("fetch: HTTP " + std::to_string(out.status) + ", " +
             std::to_string(out.body.size()) + " body bytes (" +
             std::to_string(out.bytes_received) + " on the wire)");
    return out;
}

} // namespace devcfg::fetch
