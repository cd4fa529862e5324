#pragma once

#include <boost/system/error_code.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace onion::core {

// Header names compare case-insensitively.
struct HeaderNameLess {
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

// Read side of one HTTP exchange as delivered by a transport.
class IncomingMessage {
public:
    virtual ~IncomingMessage() = default;

    virtual const std::string& url() const = 0;
    virtual const std::string& method() const = 0;
    virtual int http_version_major() const = 0;
    virtual const HeaderMap& headers() const = 0;

    // --- connection ---
    virtual std::string remote_address() const = 0;
    virtual bool encrypted() const = 0;
};

// Write side of one HTTP exchange.
//
// Finish handlers run exactly once, when the transport is done with the
// message: after the last byte was handed off, or on a premature close or
// write failure (non-empty error code). They are released once they ran, so
// handlers may hold the objects that own this message.
class OutgoingMessage {
public:
    using WriteHandler = std::function<void(boost::system::error_code)>;
    using FinishHandler = std::function<void(boost::system::error_code)>;

    virtual ~OutgoingMessage() = default;

    // --- status line ---
    virtual int status_code() const = 0;
    virtual void set_status_code(int code) = 0;
    virtual const std::string& status_message() const = 0;
    virtual void set_status_message(std::string message) = 0;

    // --- headers ---
    virtual const HeaderMap& headers() const = 0;
    virtual void set_header(std::string name, std::string value) = 0;
    virtual void remove_header(std::string_view name) = 0;
    virtual bool headers_sent() const = 0;

    std::optional<std::string> header(std::string_view name) const;
    bool has_header(std::string_view name) const;
    void clear_headers();

    // --- body ---
    virtual bool writable() const = 0;
    virtual void write(std::string_view chunk, WriteHandler handler) = 0;
    virtual void end(std::string_view chunk = {}) = 0;

    // --- lifecycle ---
    bool finished() const noexcept;

    // Runs `handler` on finish; if the message already finished it runs
    // right away with the recorded result.
    void on_finished(FinishHandler handler);

protected:
    void notify_finished(boost::system::error_code ec);

private:
    std::vector<FinishHandler> finish_handlers_;
    std::optional<boost::system::error_code> finish_result_;
};

} // namespace onion::core
