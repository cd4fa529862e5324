#include "onion/core/response.h"
#include "onion/core/status.h"

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace onion::core {

namespace {

const std::unordered_map<std::string, std::string>& known_types() {
    static const std::unordered_map<std::string, std::string> types = {
        {"text", "text/plain"},
        {"txt", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"json", "application/json"},
        {"js", "application/javascript"},
        {"xml", "application/xml"},
        {"form", "application/x-www-form-urlencoded"},
        {"bin", "application/octet-stream"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
    };
    return types;
}

bool is_textual(const std::string& mime) {
    return boost::algorithm::starts_with(mime, "text/") ||
           mime == "application/json" ||
           mime == "application/javascript";
}

// Leading decimal digits of `value`; 0 when there are none.
std::size_t parse_length(const std::string& value) {
    std::size_t result = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            break;
        }
        result = result * 10 + static_cast<std::size_t>(c - '0');
    }
    return result;
}

bool looks_like_html(const std::string& body) {
    for (char c : body) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return c == '<';
        }
    }
    return false;
}

} // namespace

std::string content_type_for(std::string_view type) {
    auto value = boost::algorithm::trim_copy(std::string(type));
    if (value.empty()) {
        return {};
    }
    if (value.find(';') != std::string::npos) {
        return value;
    }

    std::string mime;
    if (value.find('/') != std::string::npos) {
        mime = boost::algorithm::to_lower_copy(value);
    } else {
        if (value.front() == '.') {
            value.erase(0, 1);
        }
        auto it = known_types().find(boost::algorithm::to_lower_copy(value));
        if (it == known_types().end()) {
            return {};
        }
        mime = it->second;
    }

    if (is_textual(mime)) {
        mime += "; charset=utf-8";
    }
    return mime;
}

Response::Response(std::shared_ptr<OutgoingMessage> res,
                   std::shared_ptr<IncomingMessage> req,
                   const PropertyBag* prototype)
    : res_(std::move(res))
    , req_(std::move(req))
    , properties_(prototype) {}

OutgoingMessage& Response::res() const noexcept {
    return *res_;
}

PropertyBag& Response::properties() noexcept {
    return properties_;
}

const PropertyBag& Response::properties() const noexcept {
    return properties_;
}

int Response::status() const {
    return res_->status_code();
}

void Response::set_status(int code) {
    if (headers_sent()) {
        return;
    }
    if (code < 100 || code > 999) {
        throw std::invalid_argument("invalid status code: " + std::to_string(code));
    }

    explicit_status_ = true;
    res_->set_status_code(code);
    if (req_->http_version_major() < 2) {
        res_->set_status_message(std::string(status_message(code)));
    }
    if (has_body() && status_is_empty(code)) {
        set_body(nullptr);
    }
}

bool Response::explicit_status() const noexcept {
    return explicit_status_;
}

std::string Response::message() const {
    if (!res_->status_message().empty()) {
        return res_->status_message();
    }
    return std::string(status_message(status()));
}

void Response::set_message(std::string message) {
    res_->set_status_message(std::move(message));
}

const Response::Body& Response::body() const noexcept {
    return body_;
}

bool Response::has_body() const noexcept {
    return !std::holds_alternative<std::monostate>(body_);
}

void Response::set_body(std::nullptr_t) {
    body_.emplace<std::monostate>();
    if (!status_is_empty(status())) {
        set_status(204);
    }
    explicit_null_body_ = true;
    remove("Content-Type");
    remove("Content-Length");
    remove("Transfer-Encoding");
}

void Response::set_body(std::string body) {
    const auto type = looks_like_html(body) ? "html" : "text";
    const auto size = body.size();
    body_.emplace<std::string>(std::move(body));
    prepare_for_value(type);
    set_length(size);
}

void Response::set_body(std::string_view body) {
    set_body(std::string(body));
}

void Response::set_body(const char* body) {
    set_body(std::string(body));
}

void Response::set_body(Buffer body) {
    const auto size = body.size();
    body_.emplace<Buffer>(std::move(body));
    prepare_for_value("bin");
    set_length(size);
}

void Response::set_body(ReadableStreamPtr body) {
    if (!body) {
        set_body(nullptr);
        return;
    }
    const auto* original = std::get_if<ReadableStreamPtr>(&body_);
    const bool replaced = has_body() && (original == nullptr || *original != body);
    body_.emplace<ReadableStreamPtr>(std::move(body));
    if (replaced) {
        remove("Content-Length");
    }
    prepare_for_value("bin");
}

void Response::set_body(nlohmann::json body) {
    body_.emplace<nlohmann::json>(std::move(body));
    prepare_for_value({});
    remove("Content-Length");
    set_type("json");
}

void Response::prepare_for_value(std::string_view default_type) {
    explicit_null_body_ = false;
    if (!explicit_status_) {
        set_status(200);
    }
    if (!default_type.empty() && !has("Content-Type")) {
        set_type(default_type);
    }
}

bool Response::explicit_null_body() const noexcept {
    return explicit_null_body_;
}

std::optional<std::size_t> Response::length() const {
    if (auto value = res_->header("Content-Length")) {
        return parse_length(*value);
    }

    struct Visitor {
        std::optional<std::size_t> operator()(const std::monostate&) const { return std::nullopt; }
        std::optional<std::size_t> operator()(const Buffer& body) const { return body.size(); }
        std::optional<std::size_t> operator()(const std::string& body) const {
            if (body.empty()) {
                return std::nullopt;
            }
            return body.size();
        }
        std::optional<std::size_t> operator()(const ReadableStreamPtr&) const { return std::nullopt; }
        std::optional<std::size_t> operator()(const nlohmann::json& body) const {
            return body.dump().size();
        }
    };
    return std::visit(Visitor{}, body_);
}

void Response::set_length(std::size_t length) {
    if (!has("Transfer-Encoding")) {
        set("Content-Length", std::to_string(length));
    }
}

std::string Response::type() const {
    auto value = get("Content-Type");
    value = value.substr(0, value.find(';'));
    boost::algorithm::trim(value);
    return value;
}

void Response::set_type(std::string_view type) {
    auto value = content_type_for(type);
    if (value.empty()) {
        remove("Content-Type");
        return;
    }
    set("Content-Type", std::move(value));
}

bool Response::has(std::string_view name) const {
    return res_->has_header(name);
}

std::string Response::get(std::string_view name) const {
    return res_->header(name).value_or(std::string{});
}

void Response::set(std::string name, std::string value) {
    if (headers_sent()) {
        return;
    }
    res_->set_header(std::move(name), std::move(value));
}

void Response::remove(std::string_view name) {
    if (headers_sent()) {
        return;
    }
    res_->remove_header(name);
}

bool Response::headers_sent() const {
    return res_->headers_sent();
}

bool Response::writable() const {
    return !res_->finished() && res_->writable();
}

void Response::redirect(const std::string& url) {
    set("Location", url);
    if (!status_is_redirect(status())) {
        set_status(302);
    }
    set_type("text");
    set_body("Redirecting to " + url + ".");
}

nlohmann::json Response::to_json() const {
    auto header = nlohmann::json::object();
    for (const auto& [name, value] : res_->headers()) {
        header[name] = value;
    }
    return {
        {"status", status()},
        {"message", message()},
        {"header", header},
    };
}

} // namespace onion::core
