#pragma once

#include "onion/core/properties.h"
#include "onion/core/transport.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace onion::core {

class Application;

// Request view of one exchange. Reads the transport, honours the
// application's proxy settings, and keeps request-local overrides.
class Request {
public:
    Request(const Application& app,
            std::shared_ptr<IncomingMessage> req,
            const PropertyBag* prototype);

    IncomingMessage& req() const noexcept;
    PropertyBag& properties() noexcept;
    const PropertyBag& properties() const noexcept;

    // --- url / method ---
    const std::string& url() const noexcept;
    void set_url(std::string url);
    const std::string& original_url() const noexcept;

    const std::string& method() const noexcept;
    void set_method(std::string method);

    std::string path() const;
    std::string querystring() const;
    std::string search() const;

    // --- headers ---
    const HeaderMap& headers() const noexcept;
    std::optional<std::string> header(std::string_view name) const;
    // Empty string when absent; "Referer" and "Referrer" are interchangeable.
    std::string get(std::string_view name) const;

    // --- host / protocol ---
    std::string host() const;
    std::string hostname() const;
    std::string origin() const;
    std::string href() const;
    std::string protocol() const;
    bool secure() const;

    // --- client address ---
    std::vector<std::string> ips() const;
    std::string ip() const;

    std::vector<std::string> subdomains() const;

    nlohmann::json to_json() const;

private:
    const Application& app_;
    std::shared_ptr<IncomingMessage> req_;
    PropertyBag properties_;
    std::string url_;
    std::string original_url_;
    std::string method_;
};

} // namespace onion::core
