#pragma once

#include "onion/core/application.h"
#include "onion/infrastructure/net/beast_transport.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>

namespace onion::infrastructure::net {

// One client connection: reads a request, passes it to the application's
// handler, waits until the response was ended and written, then reads the
// next one (or closes).
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using Tcp = boost::asio::ip::tcp;
    using Request  = BeastIncoming::Request;
    using Response = BeastOutgoing::Response;

    HttpSession(Tcp::socket socket, core::Application::RequestHandler handler);

    // Entry point, called by the listener.
    void run();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);

    void handle_request(Request&& req);

    // Aborts `outgoing` if the peer closes the connection before the
    // response was handed off.
    void watch_for_close(std::weak_ptr<BeastOutgoing> outgoing);
    bool peer_closed();
    void send(Response&& res, BeastOutgoing::WriteDone done);

    void on_write(bool close,
                  boost::beast::error_code ec,
                  std::size_t bytes);

    void do_close();

private:
    Tcp::socket socket_;
    boost::beast::flat_buffer buffer_;
    Request request_;
    core::Application::RequestHandler handler_;
    std::string remote_address_;
};

} // namespace onion::infrastructure::net
