#pragma once

#include "onion/core/middleware.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace onion::core {

// Constructor-time settings of an Application.
struct Options {
    // Trust X-Forwarded-* headers.
    bool proxy = false;
    // Number of trailing hostname labels that are not subdomains.
    int subdomain_offset = 2;
    std::string proxy_ip_header = "X-Forwarded-For";
    // Keep only the last N proxy hops; 0 keeps all.
    std::size_t max_ips_count = 0;
    // Falls back to $ONION_ENV, then "development".
    std::optional<std::string> env;
    std::optional<std::vector<std::string>> keys;
    // Replaces the default composition algorithm when set.
    ComposeFn compose;
    bool async_local_storage = false;
};

} // namespace onion::core
