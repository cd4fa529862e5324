#include "onion/core/errors.h"
#include "onion/core/status.h"

#include <boost/core/demangle.hpp>
#include <nlohmann/json.hpp>

#include <typeinfo>

namespace onion::core {

namespace {

std::string default_message(int status, std::string message) {
    if (!message.empty()) {
        return message;
    }
    const auto text = status_message(status);
    return text.empty() ? std::to_string(status) : std::string(text);
}

std::string thrown_value(const std::exception_ptr& error) {
    if (!error) {
        return "null";
    }
    try {
        std::rethrow_exception(error);
    } catch (const char* value) {
        return nlohmann::json(value).dump();
    } catch (const std::string& value) {
        return nlohmann::json(value).dump();
    } catch (long long value) {
        return std::to_string(value);
    } catch (int value) {
        return std::to_string(value);
    } catch (...) {
        return "<unknown value>";
    }
}

void append_nested(const std::exception& error, std::string& out) {
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& cause) {
        out += "\ncaused by: ";
        out += boost::core::demangle(typeid(cause).name());
        out += ": ";
        out += cause.what();
        append_nested(cause, out);
    } catch (...) {
        out += "\ncaused by: <non-error value>";
    }
}

} // namespace

MultipleCallError::MultipleCallError()
    : std::logic_error("next() called multiple times") {}

HttpError::HttpError(int status, std::string message)
    : HttpError(status, std::move(message), status < 500) {}

HttpError::HttpError(int status, std::string message, bool expose)
    : std::runtime_error(default_message(status, std::move(message)))
    , status_(status)
    , expose_(expose) {}

int HttpError::status() const noexcept {
    return status_;
}

bool HttpError::expose() const noexcept {
    return expose_;
}

const HeaderMap& HttpError::headers() const noexcept {
    return headers_;
}

HttpError& HttpError::with_header(std::string name, std::string value) {
    headers_[std::move(name)] = std::move(value);
    return *this;
}

bool is_native_error(const std::exception_ptr& error) {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception&) {
        return true;
    } catch (...) {
        return false;
    }
}

std::exception_ptr to_native_error(const std::exception_ptr& error) {
    if (is_native_error(error)) {
        return error;
    }
    return std::make_exception_ptr(
        std::runtime_error("non-error thrown: " + thrown_value(error)));
}

std::string describe_error(const std::exception& error) {
    std::string out = boost::core::demangle(typeid(error).name());
    out += ": ";
    out += error.what();
    append_nested(error, out);
    return out;
}

} // namespace onion::core
