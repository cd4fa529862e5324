#include "onion/core/context.h"
#include "onion/core/application.h"
#include "onion/core/errors.h"
#include "onion/core/status.h"

#include <boost/system/system_error.hpp>

namespace onion::core {

Context::Context(Application& app,
                 std::shared_ptr<IncomingMessage> req,
                 std::shared_ptr<OutgoingMessage> res)
    : app_(app)
    , req_(std::move(req))
    , res_(std::move(res))
    , properties_(&app.context_template())
    , request_(app, req_, &app.request_template())
    , response_(res_, req_, &app.response_template())
    , original_url_(req_->url()) {}

Application& Context::app() const noexcept {
    return app_;
}

IncomingMessage& Context::req() const noexcept {
    return *req_;
}

OutgoingMessage& Context::res() const noexcept {
    return *res_;
}

const std::shared_ptr<OutgoingMessage>& Context::outgoing() const noexcept {
    return res_;
}

Request& Context::request() noexcept {
    return request_;
}

const Request& Context::request() const noexcept {
    return request_;
}

Response& Context::response() noexcept {
    return response_;
}

const Response& Context::response() const noexcept {
    return response_;
}

PropertyBag& Context::state() noexcept {
    return state_;
}

const PropertyBag& Context::state() const noexcept {
    return state_;
}

PropertyBag& Context::properties() noexcept {
    return properties_;
}

const PropertyBag& Context::properties() const noexcept {
    return properties_;
}

const std::string& Context::original_url() const noexcept {
    return original_url_;
}

bool Context::respond() const noexcept {
    return respond_;
}

void Context::set_respond(bool respond) noexcept {
    respond_ = respond;
}

int Context::status() const {
    return response_.status();
}

void Context::set_status(int code) {
    response_.set_status(code);
}

std::string Context::message() const {
    return response_.message();
}

void Context::set_message(std::string message) {
    response_.set_message(std::move(message));
}

const Response::Body& Context::body() const noexcept {
    return response_.body();
}

std::optional<std::size_t> Context::length() const {
    return response_.length();
}

void Context::set_length(std::size_t length) {
    response_.set_length(length);
}

std::string Context::type() const {
    return response_.type();
}

void Context::set_type(std::string_view type) {
    response_.set_type(type);
}

void Context::set(std::string name, std::string value) {
    response_.set(std::move(name), std::move(value));
}

void Context::remove(std::string_view name) {
    response_.remove(name);
}

void Context::redirect(const std::string& url) {
    response_.redirect(url);
}

bool Context::writable() const {
    return response_.writable();
}

bool Context::header_sent() const {
    return response_.headers_sent();
}

const std::string& Context::method() const noexcept {
    return request_.method();
}

const std::string& Context::url() const noexcept {
    return request_.url();
}

std::string Context::path() const {
    return request_.path();
}

std::string Context::get(std::string_view name) const {
    return request_.get(name);
}

std::string Context::host() const {
    return request_.host();
}

std::string Context::ip() const {
    return request_.ip();
}

void Context::throw_error(int status, std::string message) const {
    throw HttpError(status, std::move(message));
}

void Context::assert_that(bool condition, int status, std::string message) const {
    if (!condition) {
        throw_error(status, std::move(message));
    }
}

void Context::onerror(std::exception_ptr error) {
    if (!error) {
        return;
    }
    error = to_native_error(error);

    const bool header_sent = this->header_sent() || !writable();
    app_.emit_error(error, this);
    if (header_sent) {
        return;
    }

    int status = 0;
    bool expose = false;
    std::string text;
    HeaderMap extra_headers;
    try {
        std::rethrow_exception(error);
    } catch (const HttpError& e) {
        status = e.status();
        expose = e.expose();
        text = e.what();
        extra_headers = e.headers();
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::system::errc::no_such_file_or_directory) {
            status = 404;
        }
        text = e.what();
    } catch (const std::exception& e) {
        text = e.what();
    }

    res_->clear_headers();
    for (const auto& [name, value] : extra_headers) {
        res_->set_header(name, value);
    }

    if (status == 0 || !status_is_known(status)) {
        status = 500;
    }
    const std::string body = expose ? text : std::string(status_message(status));

    response_.set_type("text");
    response_.set_status(status);
    response_.set_length(body.size());
    res_->end(body);
}

nlohmann::json Context::to_json() const {
    return {
        {"request", request_.to_json()},
        {"response", response_.to_json()},
        {"app", app_.to_json()},
        {"originalUrl", original_url_},
    };
}

} // namespace onion::core
