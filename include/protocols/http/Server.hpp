#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace bk::protocols::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

class Server : public std::enable_shared_from_this<Server> {
public:
    // Binds and listens immediately. Throws beast::system_error.
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router);

    void run();

    void stop();

private:
    void do_accept();

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;
};

}
