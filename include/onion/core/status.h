#pragma once

#include <string_view>

namespace onion::core {

// Reason phrase for a status code, empty when the registry does not know it.
std::string_view status_message(int code);

bool status_is_known(int code);

// 204, 205 and 304 never carry a body.
bool status_is_empty(int code);

bool status_is_redirect(int code);

} // namespace onion::core
