#include "onion/infrastructure/net/http_session.h"

#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace onion::infrastructure::net {

namespace http = boost::beast::http;

HttpSession::HttpSession(Tcp::socket socket, core::Application::RequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler)) {
    boost::system::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string();
    }
}

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    request_ = {};

    http::async_read(
        socket_,
        buffer_,
        request_,
        boost::beast::bind_front_handler(
            &HttpSession::on_read,
            shared_from_this()));
}

void HttpSession::on_read(boost::beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }

    if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "[HttpSession] read error: " << ec.message();
        return;
    }

    handle_request(std::move(request_));
}

void HttpSession::handle_request(Request&& req) {
    const auto version = req.version();
    const auto keep_alive = req.keep_alive();
    const auto head = req.method() == http::verb::head;

    auto incoming = std::make_shared<BeastIncoming>(std::move(req), remote_address_);
    auto outgoing = std::make_shared<BeastOutgoing>(
        version,
        keep_alive,
        head,
        socket_.get_executor(),
        [self = shared_from_this()](Response&& res, BeastOutgoing::WriteDone done) {
            self->send(std::move(res), std::move(done));
        });

    watch_for_close(outgoing);

    try {
        handler_(incoming, outgoing);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[HttpSession] request handler failed: " << e.what();
        outgoing->abort(boost::asio::error::operation_aborted);
        do_close();
    }
}

void HttpSession::watch_for_close(std::weak_ptr<BeastOutgoing> outgoing) {
    socket_.async_wait(
        Tcp::socket::wait_read,
        [self = shared_from_this(), outgoing = std::move(outgoing)](boost::beast::error_code ec) {
            auto res = outgoing.lock();
            if (ec || !res || res->finished() || res->headers_sent()) {
                return;
            }
            // Readable with a pending response: either a pipelined request
            // or the peer hung up.
            if (!self->peer_closed()) {
                return;
            }
            BOOST_LOG_TRIVIAL(debug) << "[HttpSession] peer closed before the response was sent";
            res->abort(boost::asio::error::connection_reset);
            self->do_close();
        });
}

bool HttpSession::peer_closed() {
    char byte = 0;
    boost::beast::error_code ec;
    socket_.receive(boost::asio::buffer(&byte, 1), Tcp::socket::message_peek, ec);
    return ec && ec != boost::asio::error::would_block;
}

void HttpSession::send(Response&& res, BeastOutgoing::WriteDone done) {
    auto message = std::make_shared<Response>(std::move(res));
    const auto close = message->need_eof();

    http::async_write(
        socket_,
        *message,
        [self = shared_from_this(), message, close, done = std::move(done)](
            boost::beast::error_code ec, std::size_t bytes) {
            done(ec);
            self->on_write(close, ec, bytes);
        });
}

void HttpSession::on_write(bool close,
                           boost::beast::error_code ec,
                           std::size_t) {
    if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "[HttpSession] write error: " << ec.message();
        return;
    }

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    boost::beast::error_code ec;
    socket_.shutdown(Tcp::socket::shutdown_send, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        BOOST_LOG_TRIVIAL(debug) << "[HttpSession] shutdown: " << ec.message();
    }
}

} // namespace onion::infrastructure::net
