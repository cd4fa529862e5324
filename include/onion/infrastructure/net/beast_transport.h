#pragma once

#include "onion/core/transport.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http.hpp>

#include <functional>
#include <memory>
#include <string>

namespace onion::infrastructure::net {

namespace http = boost::beast::http;

class BeastIncoming : public core::IncomingMessage {
public:
    using Request = http::request<http::string_body>;

    BeastIncoming(Request request, std::string remote_address);

    const std::string& url() const override;
    const std::string& method() const override;
    int http_version_major() const override;
    const core::HeaderMap& headers() const override;
    std::string remote_address() const override;
    bool encrypted() const override;

    // Raw request body as read off the wire.
    const std::string& body() const noexcept;

private:
    Request request_;
    std::string url_;
    std::string method_;
    core::HeaderMap headers_;
    std::string remote_address_;
};

// Collects status, headers and body and hands one complete Beast message to
// the session on end(). Headers count as sent from that point on.
class BeastOutgoing : public core::OutgoingMessage,
                      public std::enable_shared_from_this<BeastOutgoing> {
public:
    using Response = http::response<http::string_body>;
    using WriteDone = std::function<void(boost::system::error_code)>;
    using Sender = std::function<void(Response&&, WriteDone)>;

    BeastOutgoing(unsigned version,
                  bool keep_alive,
                  bool head,
                  boost::asio::any_io_executor executor,
                  Sender sender);

    int status_code() const override;
    void set_status_code(int code) override;
    const std::string& status_message() const override;
    void set_status_message(std::string message) override;

    const core::HeaderMap& headers() const override;
    void set_header(std::string name, std::string value) override;
    void remove_header(std::string_view name) override;
    bool headers_sent() const override;

    bool writable() const override;
    void write(std::string_view chunk, WriteHandler handler) override;
    void end(std::string_view chunk = {}) override;

    // The connection went away before the response was ended.
    void abort(boost::system::error_code ec);

private:
    Response build();

    unsigned version_;
    bool keep_alive_;
    bool head_;
    boost::asio::any_io_executor executor_;
    Sender sender_;

    int status_ = 200;
    std::string status_message_;
    core::HeaderMap headers_;
    std::string body_;
    bool ended_ = false;
};

} // namespace onion::infrastructure::net
