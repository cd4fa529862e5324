#pragma once

#include "onion/core/application.h"

#include <boost/asio.hpp>
#include <atomic>
#include <memory>

namespace onion::infrastructure::net {

// Accept loop: every accepted connection becomes an HttpSession serving
// `handler`.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    using Tcp = boost::asio::ip::tcp;

    // Throws std::runtime_error if the endpoint cannot be bound.
    Listener(
        boost::asio::io_context& io_context,
        const Tcp::endpoint& endpoint,
        core::Application::RequestHandler handler
    );

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Start the accept loop.
    void run();

    // Stop accepting (graceful); open sessions finish on their own.
    void stop();

    Tcp::endpoint local_endpoint() const;

private:
    void do_accept();

    boost::asio::io_context& io_context_;
    Tcp::acceptor acceptor_;
    core::Application::RequestHandler handler_;
    std::atomic<bool> stopped_{false};
};

// Serves `app` on `endpoint` using the chain as composed right now.
std::shared_ptr<Listener> listen(
    core::Application& app,
    boost::asio::io_context& io_context,
    const Listener::Tcp::endpoint& endpoint
);

} // namespace onion::infrastructure::net
