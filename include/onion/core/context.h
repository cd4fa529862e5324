#pragma once

#include "onion/core/properties.h"
#include "onion/core/request.h"
#include "onion/core/response.h"
#include "onion/core/transport.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace onion::core {

class Application;

// Everything about one request: the transport pair, request and response
// views over it, and a state bag for middleware. Created by
// Application::create_context and never reused.
class Context : public std::enable_shared_from_this<Context> {
public:
    Context(Application& app,
            std::shared_ptr<IncomingMessage> req,
            std::shared_ptr<OutgoingMessage> res);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    Application& app() const noexcept;

    // --- transport ---
    IncomingMessage& req() const noexcept;
    OutgoingMessage& res() const noexcept;
    const std::shared_ptr<OutgoingMessage>& outgoing() const noexcept;

    // --- views ---
    Request& request() noexcept;
    const Request& request() const noexcept;
    Response& response() noexcept;
    const Response& response() const noexcept;

    // --- user data ---
    PropertyBag& state() noexcept;
    const PropertyBag& state() const noexcept;
    // Falls back to the application's context template.
    PropertyBag& properties() noexcept;
    const PropertyBag& properties() const noexcept;

    const std::string& original_url() const noexcept;

    // false hands the response over to the middleware entirely.
    bool respond() const noexcept;
    void set_respond(bool respond) noexcept;

    // --- response delegates ---
    int status() const;
    void set_status(int code);
    std::string message() const;
    void set_message(std::string message);

    const Response::Body& body() const noexcept;
    template<typename T>
    void set_body(T&& body) {
        response_.set_body(std::forward<T>(body));
    }

    std::optional<std::size_t> length() const;
    void set_length(std::size_t length);
    std::string type() const;
    void set_type(std::string_view type);

    void set(std::string name, std::string value);
    void remove(std::string_view name);
    void redirect(const std::string& url);

    bool writable() const;
    bool header_sent() const;

    // --- request delegates ---
    const std::string& method() const noexcept;
    const std::string& url() const noexcept;
    std::string path() const;
    std::string get(std::string_view name) const;
    std::string host() const;
    std::string ip() const;

    // --- errors ---
    [[noreturn]] void throw_error(int status, std::string message = {}) const;
    void assert_that(bool condition, int status, std::string message = {}) const;

    // Reports `error` to the application and, if nothing was sent yet,
    // replaces the response with a plain-text error response.
    void onerror(std::exception_ptr error);

    nlohmann::json to_json() const;

private:
    Application& app_;
    std::shared_ptr<IncomingMessage> req_;
    std::shared_ptr<OutgoingMessage> res_;
    PropertyBag properties_;
    Request request_;
    Response response_;
    PropertyBag state_;
    std::string original_url_;
    bool respond_ = true;
};

} // namespace onion::core
