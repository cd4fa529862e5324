#include "onion/core/request.h"
#include "onion/core/application.h"

#include <boost/algorithm/string.hpp>
#include <boost/asio/ip/address.hpp>

#include <algorithm>

namespace onion::core {

namespace {

// "a, b ,c" -> {"a", "b", "c"}; blank entries are dropped.
std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, value, boost::algorithm::is_any_of(","));
    for (auto& part : parts) {
        boost::algorithm::trim(part);
    }
    parts.erase(std::remove(parts.begin(), parts.end(), std::string{}), parts.end());
    return parts;
}

std::string first_of_list(const std::string& value) {
    auto parts = split_list(value);
    return parts.empty() ? std::string{} : parts.front();
}

bool is_ip(const std::string& host) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    return !ec;
}

} // namespace

Request::Request(const Application& app,
                 std::shared_ptr<IncomingMessage> req,
                 const PropertyBag* prototype)
    : app_(app)
    , req_(std::move(req))
    , properties_(prototype)
    , url_(req_->url())
    , original_url_(req_->url())
    , method_(req_->method()) {}

IncomingMessage& Request::req() const noexcept {
    return *req_;
}

PropertyBag& Request::properties() noexcept {
    return properties_;
}

const PropertyBag& Request::properties() const noexcept {
    return properties_;
}

const std::string& Request::url() const noexcept {
    return url_;
}

void Request::set_url(std::string url) {
    url_ = std::move(url);
}

const std::string& Request::original_url() const noexcept {
    return original_url_;
}

const std::string& Request::method() const noexcept {
    return method_;
}

void Request::set_method(std::string method) {
    method_ = std::move(method);
}

std::string Request::path() const {
    return url_.substr(0, url_.find('?'));
}

std::string Request::querystring() const {
    const auto pos = url_.find('?');
    if (pos == std::string::npos) {
        return {};
    }
    return url_.substr(pos + 1, url_.find('#', pos) - pos - 1);
}

std::string Request::search() const {
    auto query = querystring();
    return query.empty() ? std::string{} : "?" + query;
}

const HeaderMap& Request::headers() const noexcept {
    return req_->headers();
}

std::optional<std::string> Request::header(std::string_view name) const {
    const auto& all = req_->headers();
    auto it = all.find(name);
    if (it == all.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Request::get(std::string_view name) const {
    if (boost::algorithm::iequals(name, "referer") || boost::algorithm::iequals(name, "referrer")) {
        if (auto value = header("Referrer")) {
            return *value;
        }
        return header("Referer").value_or(std::string{});
    }
    return header(name).value_or(std::string{});
}

std::string Request::host() const {
    std::string host;
    if (app_.proxy()) {
        host = get("X-Forwarded-Host");
    }
    if (host.empty()) {
        host = get("Host");
    }
    return first_of_list(host);
}

std::string Request::hostname() const {
    const auto host = this->host();
    if (host.empty()) {
        return {};
    }
    if (host.front() == '[') {
        const auto end = host.find(']');
        return end == std::string::npos ? std::string{} : host.substr(1, end - 1);
    }
    return host.substr(0, host.find(':'));
}

std::string Request::origin() const {
    return protocol() + "://" + host();
}

std::string Request::href() const {
    if (boost::algorithm::istarts_with(original_url_, "http://") ||
        boost::algorithm::istarts_with(original_url_, "https://")) {
        return original_url_;
    }
    return origin() + original_url_;
}

std::string Request::protocol() const {
    if (req_->encrypted()) {
        return "https";
    }
    if (!app_.proxy()) {
        return "http";
    }
    auto proto = first_of_list(get("X-Forwarded-Proto"));
    return proto.empty() ? "http" : proto;
}

bool Request::secure() const {
    return protocol() == "https";
}

std::vector<std::string> Request::ips() const {
    if (!app_.proxy()) {
        return {};
    }
    auto ips = split_list(get(app_.proxy_ip_header()));
    const auto limit = app_.max_ips_count();
    if (limit > 0 && ips.size() > limit) {
        ips.erase(ips.begin(), ips.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return ips;
}

std::string Request::ip() const {
    auto ips = this->ips();
    if (!ips.empty()) {
        return ips.front();
    }
    return req_->remote_address();
}

std::vector<std::string> Request::subdomains() const {
    const auto hostname = this->hostname();
    if (hostname.empty() || is_ip(hostname)) {
        return {};
    }
    std::vector<std::string> labels;
    boost::algorithm::split(labels, hostname, boost::algorithm::is_any_of("."));
    std::reverse(labels.begin(), labels.end());

    const auto offset = static_cast<std::size_t>(std::max(app_.subdomain_offset(), 0));
    if (offset >= labels.size()) {
        return {};
    }
    labels.erase(labels.begin(), labels.begin() + static_cast<std::ptrdiff_t>(offset));
    return labels;
}

nlohmann::json Request::to_json() const {
    auto header = nlohmann::json::object();
    for (const auto& [name, value] : req_->headers()) {
        header[name] = value;
    }
    return {
        {"method", method_},
        {"url", url_},
        {"header", header},
    };
}

} // namespace onion::core
