#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "logging/LogRegistry.hpp"

using namespace bk::protocols::http;
using namespace bk::logging;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router)
    : ioc_(ioc), acceptor_(ioc), router_(std::move(router)) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void Server::run() {
    const auto ep = acceptor_.local_endpoint();
    LogRegistry::http()->info("[Server] Listening on http://{}:{}", ep.address().to_string(), ep.port());
    do_accept();
}

void Server::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

void Server::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;

        if (ec) LogRegistry::http()->warn("[Server] Accept failed: {}", ec.message());
        else std::make_shared<Session>(std::move(socket), self->router_)->run();

        if (self->acceptor_.is_open()) self->do_accept();
    });
}
