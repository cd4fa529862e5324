#pragma once

#include "onion/core/transport.h"

#include <exception>
#include <stdexcept>
#include <string>

namespace onion::core {

// Raised for values that are not usable where a callable or an exception
// object is required.
class TypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class MultipleCallError : public std::logic_error {
public:
    MultipleCallError();
};

// An error that knows which HTTP status it maps to.
// `expose` marks the message as safe to show to the client; it defaults to
// true for 4xx and false for 5xx.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(int status, std::string message = {});
    HttpError(int status, std::string message, bool expose);

    int status() const noexcept;
    bool expose() const noexcept;

    // --- extra response headers ---
    const HeaderMap& headers() const noexcept;
    HttpError& with_header(std::string name, std::string value);

private:
    int status_;
    bool expose_;
    HeaderMap headers_;
};

// True when `error` holds an object derived from std::exception.
bool is_native_error(const std::exception_ptr& error);

// Returns `error` unchanged if it is native, otherwise a std::runtime_error
// describing the thrown value ("non-error thrown: ...").
std::exception_ptr to_native_error(const std::exception_ptr& error);

// Multi-line report: the dynamic type and message of `error`, followed by
// one "caused by" line per nested exception.
std::string describe_error(const std::exception& error);

} // namespace onion::core
