#include "onion/infrastructure/net/beast_transport.h"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace onion::infrastructure::net {

namespace {

std::string to_string(boost::beast::string_view value) {
    return std::string(value.data(), value.size());
}

} // namespace

BeastIncoming::BeastIncoming(Request request, std::string remote_address)
    : request_(std::move(request))
    , url_(to_string(request_.target()))
    , method_(to_string(request_.method_string()))
    , remote_address_(std::move(remote_address)) {
    for (const auto& field : request_) {
        const auto name = to_string(field.name_string());
        const auto value = to_string(field.value());
        auto it = headers_.find(name);
        if (it == headers_.end()) {
            headers_.emplace(name, value);
        } else {
            it->second += ", " + value;
        }
    }
}

const std::string& BeastIncoming::url() const {
    return url_;
}

const std::string& BeastIncoming::method() const {
    return method_;
}

int BeastIncoming::http_version_major() const {
    return static_cast<int>(request_.version() / 10);
}

const core::HeaderMap& BeastIncoming::headers() const {
    return headers_;
}

std::string BeastIncoming::remote_address() const {
    return remote_address_;
}

bool BeastIncoming::encrypted() const {
    return false;
}

const std::string& BeastIncoming::body() const noexcept {
    return request_.body();
}

BeastOutgoing::BeastOutgoing(unsigned version,
                             bool keep_alive,
                             bool head,
                             boost::asio::any_io_executor executor,
                             Sender sender)
    : version_(version)
    , keep_alive_(keep_alive)
    , head_(head)
    , executor_(std::move(executor))
    , sender_(std::move(sender)) {}

int BeastOutgoing::status_code() const {
    return status_;
}

void BeastOutgoing::set_status_code(int code) {
    status_ = code;
}

const std::string& BeastOutgoing::status_message() const {
    return status_message_;
}

void BeastOutgoing::set_status_message(std::string message) {
    status_message_ = std::move(message);
}

const core::HeaderMap& BeastOutgoing::headers() const {
    return headers_;
}

void BeastOutgoing::set_header(std::string name, std::string value) {
    headers_[std::move(name)] = std::move(value);
}

void BeastOutgoing::remove_header(std::string_view name) {
    auto it = headers_.find(name);
    if (it != headers_.end()) {
        headers_.erase(it);
    }
}

bool BeastOutgoing::headers_sent() const {
    return ended_;
}

bool BeastOutgoing::writable() const {
    return !ended_;
}

void BeastOutgoing::write(std::string_view chunk, WriteHandler handler) {
    boost::system::error_code ec;
    if (ended_) {
        ec = boost::asio::error::shut_down;
    } else {
        body_.append(chunk.data(), chunk.size());
    }
    boost::asio::post(executor_, [handler = std::move(handler), ec] { handler(ec); });
}

void BeastOutgoing::end(std::string_view chunk) {
    if (ended_) {
        return;
    }
    body_.append(chunk.data(), chunk.size());
    ended_ = true;

    sender_(build(), [self = shared_from_this()](boost::system::error_code ec) {
        self->notify_finished(ec);
    });
}

void BeastOutgoing::abort(boost::system::error_code ec) {
    if (ended_) {
        return;
    }
    ended_ = true;
    sender_ = nullptr;
    notify_finished(ec);
}

BeastOutgoing::Response BeastOutgoing::build() {
    Response res;
    res.version(version_);
    res.result(static_cast<unsigned>(status_));
    if (!status_message_.empty()) {
        res.reason(status_message_);
    }
    for (const auto& [name, value] : headers_) {
        res.set(name, value);
    }
    res.keep_alive(keep_alive_);
    res.body() = std::move(body_);

    const bool sized = headers_.count("Content-Length") != 0 ||
                       headers_.count("Transfer-Encoding") != 0;
    if (!sized && !head_) {
        res.prepare_payload();
    }
    return res;
}

} // namespace onion::infrastructure::net
