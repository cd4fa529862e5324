#include "onion/infrastructure/net/listener.h"
#include "onion/infrastructure/net/http_session.h"

#include <boost/log/trivial.hpp>

#include <stdexcept>

namespace onion::infrastructure::net {

Listener::Listener(
    boost::asio::io_context& io_context,
    const Tcp::endpoint& endpoint,
    core::Application::RequestHandler handler
)
    : io_context_(io_context)
    , acceptor_(io_context)
    , handler_(std::move(handler))
{
    boost::system::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Listener: open failed: " + ec.message());
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Listener: set_option failed: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Listener: bind failed: " + ec.message());
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Listener: listen failed: " + ec.message());
    }
}

void Listener::run() {
    if (stopped_) {
        return;
    }
    do_accept();
}

void Listener::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }

    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    BOOST_LOG_TRIVIAL(debug) << "[Listener] stopped";
}

Listener::Tcp::endpoint Listener::local_endpoint() const {
    return acceptor_.local_endpoint();
}

void Listener::do_accept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_context_),
        [self = shared_from_this()](boost::system::error_code ec,
                                    Tcp::socket socket) {
            if (self->stopped_) {
                return;
            }

            if (ec) {
                BOOST_LOG_TRIVIAL(warning) << "[Listener] accept error: " << ec.message();
            } else {
                std::make_shared<HttpSession>(std::move(socket), self->handler_)->run();
            }

            self->do_accept();
        }
    );
}

std::shared_ptr<Listener> listen(
    core::Application& app,
    boost::asio::io_context& io_context,
    const Listener::Tcp::endpoint& endpoint
) {
    auto listener = std::make_shared<Listener>(io_context, endpoint, app.callback());
    listener->run();
    BOOST_LOG_TRIVIAL(debug) << "listen " << listener->local_endpoint();
    return listener;
}

} // namespace onion::infrastructure::net
