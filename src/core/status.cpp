#include "onion/core/status.h"

#include <ostream>

#include <boost/beast/http/status.hpp>

namespace onion::core {

namespace http = boost::beast::http;

std::string_view status_message(int code) {
    if (code < 0) {
        return {};
    }
    const auto status = http::int_to_status(static_cast<unsigned>(code));
    if (status == http::status::unknown) {
        return {};
    }
    const auto reason = http::obsolete_reason(status);
    return std::string_view(reason.data(), reason.size());
}

bool status_is_known(int code) {
    return !status_message(code).empty();
}

bool status_is_empty(int code) {
    switch (code) {
    case 204:
    case 205:
    case 304:
        return true;
    default:
        return false;
    }
}

bool status_is_redirect(int code) {
    switch (code) {
    case 300:
    case 301:
    case 302:
    case 303:
    case 305:
    case 307:
    case 308:
        return true;
    default:
        return false;
    }
}

} // namespace onion::core
