#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "logging/LogRegistry.hpp"

using namespace bk::protocols::http;
using namespace bk::logging;

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router)
    : socket_(std::move(socket)), router_(std::move(router)) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_ = std::make_unique<http::request_parser<http::string_body>>();
    parser_->body_limit(MAX_BODY_BYTES);

    auto self = shared_from_this();
    http::async_read(socket_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        LogRegistry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    auto req = parser_->release();
    LogRegistry::http()->debug("[Session] {} {} ({} bytes)",
                               std::string(req.method_string()), std::string(req.target()), bytes);

    auto self = shared_from_this();
    const auto version = req.version();

    try {
        auto res = router_->route(std::move(req));

        std::visit([self](auto&& response) {
            using T = std::decay_t<decltype(response)>;
            auto msg = std::make_shared<T>(std::forward<decltype(response)>(response));
            const bool close = msg->need_eof();
            http::async_write(self->socket_, *msg,
                              [self, msg, close](beast::error_code ec, std::size_t bytes) {
                                  self->on_write(close, ec, bytes);
                              });
        }, std::move(res));
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Session] Exception during request handling: {}", e.what());

        auto err = std::make_shared<http::response<http::string_body>>(
            Router::makeErrorResponse({}, "Internal server error", http::status::internal_server_error));
        err->version(version);
        err->set(http::field::access_control_allow_origin, "*");
        err->keep_alive(false);

        http::async_write(socket_, *err,
            [self, err](beast::error_code, std::size_t) {
                self->on_write(true, {}, 0);
            });
    }
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes;

    if (ec) {
        LogRegistry::http()->error("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // shutdown errors are not actionable
}
