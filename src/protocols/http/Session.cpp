#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/Dispatcher.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace tl::protocols::http;

static constexpr auto READ_TIMEOUT = std::chrono::seconds(60);

Session::Session(tcp::socket socket, std::shared_ptr<Dispatcher> dispatcher, const uint64_t maxBodyBytes)
    : stream_(std::move(socket)), dispatcher_(std::move(dispatcher)), maxBodyBytes_(maxBodyBytes) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(maxBodyBytes_);
    stream_.expires_after(READ_TIMEOUT);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    auto self = shared_from_this();

    if (ec == http::error::body_limit) {
        log::Registry::http()->warn("[HttpSession] Request body exceeds {} bytes", maxBodyBytes_);
        auto res = std::make_shared<string_response>(
            Router::makeErrorResponse(parser_->get(), "Request body too large", status::payload_too_large));
        res->keep_alive(false);
        http::async_write(stream_, *res, [self, res](beast::error_code e, std::size_t n) {
            self->on_write(true, e, n);
        });
        return;
    }

    if (ec) {
        if (ec != beast::error::timeout) log::Registry::http()->error("[HttpSession] Read error: {}", ec.message());
        return do_close();
    }

    log::Registry::http()->debug("[HttpSession] Read {} bytes: {}", bytes, std::string(parser_->get().target()));

    auto req = parser_->release();
    const bool close = !req.keep_alive();

    string_response out;
    try {
        out = Router::route(std::move(req), *dispatcher_);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[HttpSession] Exception during request handling: {}", e.what());
        out = Router::makeErrorResponse(req, "Internal server error", status::internal_server_error, "Error");
    }

    auto msg = std::make_shared<string_response>(std::move(out));
    http::async_write(stream_, *msg,
                      [self, msg, close](beast::error_code e, std::size_t n) {
                          self->on_write(close, e, n);
                      });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        log::Registry::http()->error("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    // Clear buffer and start next request
    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}
