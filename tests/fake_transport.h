#pragma once

#include "onion/core/transport.h"

#include <memory>
#include <string>
#include <utility>

namespace onion::test {

class FakeIncoming : public core::IncomingMessage {
public:
    FakeIncoming(std::string method, std::string url, int version_major = 1)
        : method_(std::move(method))
        , url_(std::move(url))
        , version_major_(version_major) {}

    const std::string& url() const override { return url_; }
    const std::string& method() const override { return method_; }
    int http_version_major() const override { return version_major_; }
    const core::HeaderMap& headers() const override { return headers_; }
    std::string remote_address() const override { return remote_address_; }
    bool encrypted() const override { return encrypted_; }

    FakeIncoming& with_header(std::string name, std::string value) {
        headers_[std::move(name)] = std::move(value);
        return *this;
    }

    std::string remote_address_ = "127.0.0.1";
    bool encrypted_ = false;

private:
    std::string method_;
    std::string url_;
    int version_major_;
    core::HeaderMap headers_;
};

// Records everything written to it. Writes complete inline; end() finishes
// the message successfully.
class FakeOutgoing : public core::OutgoingMessage {
public:
    int status_code() const override { return status_; }
    void set_status_code(int code) override { status_ = code; }
    const std::string& status_message() const override { return status_message_; }
    void set_status_message(std::string message) override { status_message_ = std::move(message); }

    const core::HeaderMap& headers() const override { return headers_; }
    void set_header(std::string name, std::string value) override {
        headers_[std::move(name)] = std::move(value);
    }
    void remove_header(std::string_view name) override {
        auto it = headers_.find(name);
        if (it != headers_.end()) {
            headers_.erase(it);
        }
    }
    bool headers_sent() const override { return headers_sent_; }

    bool writable() const override { return writable_ && !ended_; }

    void write(std::string_view chunk, WriteHandler handler) override {
        headers_sent_ = true;
        data_.append(chunk.data(), chunk.size());
        ++writes_;
        handler({});
    }

    void end(std::string_view chunk = {}) override {
        headers_sent_ = true;
        data_.append(chunk.data(), chunk.size());
        ended_ = true;
        ++end_calls_;
        notify_finished({});
    }

    // Simulates the connection failing underneath the response.
    void fail(boost::system::error_code ec) {
        writable_ = false;
        notify_finished(ec);
    }

    void mark_headers_sent() { headers_sent_ = true; }

    const std::string& data() const noexcept { return data_; }
    bool ended() const noexcept { return ended_; }
    int end_calls() const noexcept { return end_calls_; }
    int writes() const noexcept { return writes_; }

private:
    int status_ = 200;
    std::string status_message_;
    core::HeaderMap headers_;
    std::string data_;
    bool headers_sent_ = false;
    bool writable_ = true;
    bool ended_ = false;
    int end_calls_ = 0;
    int writes_ = 0;
};

struct Exchange {
    std::shared_ptr<FakeIncoming> req;
    std::shared_ptr<FakeOutgoing> res;
};

inline Exchange make_exchange(std::string method = "GET", std::string url = "/", int version_major = 1) {
    return {
        std::make_shared<FakeIncoming>(std::move(method), std::move(url), version_major),
        std::make_shared<FakeOutgoing>(),
    };
}

} // namespace onion::test
