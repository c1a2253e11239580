#include <sitecache/system/liveness_prober.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace sitecache::system {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;

namespace {

struct ProbeState {
    bool done{false};
    Error error{ErrorCode::Success, ""};
};

// Read one "\r\n"-terminated reply line, without the terminator
awaitable<std::string> readLine(tcp::socket& socket, std::string& buffer,
                                boost::system::error_code& ec) {
    auto n = co_await boost::asio::async_read_until(socket, boost::asio::dynamic_buffer(buffer),
                                                    "\r\n", redirect_error(use_awaitable, ec));
    if (ec) {
        co_return std::string{};
    }
    std::string line = buffer.substr(0, n - 2);
    buffer.erase(0, n);
    co_return line;
}

awaitable<void> runProbe(tcp::socket& socket, std::string host, Port port,
                         const std::string& credential, ProbeState& state) {
    boost::system::error_code ec;
    tcp::resolver resolver(socket.get_executor());
    auto endpoints = co_await resolver.async_resolve(host, std::to_string(port),
                                                     redirect_error(use_awaitable, ec));
    if (ec) {
        state.error = Error{ErrorCode::NetworkError, "Cannot resolve " + host + ": " + ec.message()};
        state.done = true;
        co_return;
    }

    co_await boost::asio::async_connect(socket, endpoints, redirect_error(use_awaitable, ec));
    if (ec) {
        state.error = Error{ErrorCode::NetworkError, fmt::format("Connection to {}:{} failed: {}",
                                                                 host, port, ec.message())};
        state.done = true;
        co_return;
    }

    const std::string request = RespLivenessProber::encodeCommand({"AUTH", credential}) +
                                RespLivenessProber::encodeCommand({"PING"});
    co_await boost::asio::async_write(socket, boost::asio::buffer(request),
                                      redirect_error(use_awaitable, ec));
    if (ec) {
        state.error = Error{ErrorCode::NetworkError, "Write failed: " + ec.message()};
        state.done = true;
        co_return;
    }

    std::string buffer;
    auto authReply = co_await readLine(socket, buffer, ec);
    if (ec) {
        state.error = Error{ErrorCode::NetworkError, "No reply to AUTH: " + ec.message()};
        state.done = true;
        co_return;
    }
    if (authReply != "+OK") {
        state.error = Error{ErrorCode::AuthenticationFailed,
                            "Credential rejected: " +
                                (authReply.empty() ? std::string("empty reply") : authReply)};
        state.done = true;
        co_return;
    }

    auto pingReply = co_await readLine(socket, buffer, ec);
    if (ec) {
        state.error = Error{ErrorCode::NetworkError, "No reply to PING: " + ec.message()};
    } else if (pingReply != "+PONG") {
        state.error = Error{ErrorCode::ProbeFailed, "Unexpected PING reply: " + pingReply};
    }
    state.done = true;
}

} // namespace

std::string RespLivenessProber::encodeCommand(const std::vector<std::string_view>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (auto a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out.append(a.data(), a.size());
        out += "\r\n";
    }
    return out;
}

Result<void> RespLivenessProber::probe(const std::string& host, Port port,
                                       const std::string& credential,
                                       std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    tcp::socket socket(io);
    ProbeState state;

    boost::asio::co_spawn(io, runProbe(socket, host, port, credential, state),
                          boost::asio::detached);
    io.run_for(timeout);

    if (!state.done) {
        // Abort outstanding operations and let the coroutine unwind
        boost::system::error_code ignored;
        socket.close(ignored);
        io.restart();
        io.run();
        spdlog::debug("Probe of {}:{} timed out after {}ms", host, port, timeout.count());
        return Error{ErrorCode::Timeout,
                     fmt::format("No answer from {}:{} within {}ms", host, port, timeout.count())};
    }
    if (state.error.code != ErrorCode::Success) {
        return state.error;
    }
    return {};
}

} // namespace sitecache::system
