#include "onion/core/transport.h"

#include <boost/algorithm/string/predicate.hpp>

namespace onion::core {

bool HeaderNameLess::operator()(std::string_view lhs, std::string_view rhs) const {
    return boost::algorithm::ilexicographical_compare(lhs, rhs);
}

std::optional<std::string> OutgoingMessage::header(std::string_view name) const {
    const auto& all = headers();
    auto it = all.find(name);
    if (it == all.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool OutgoingMessage::has_header(std::string_view name) const {
    return headers().count(name) != 0;
}

void OutgoingMessage::clear_headers() {
    std::vector<std::string> names;
    for (const auto& [name, value] : headers()) {
        names.push_back(name);
    }
    for (const auto& name : names) {
        remove_header(name);
    }
}

bool OutgoingMessage::finished() const noexcept {
    return finish_result_.has_value();
}

void OutgoingMessage::on_finished(FinishHandler handler) {
    if (finish_result_) {
        handler(*finish_result_);
        return;
    }
    finish_handlers_.push_back(std::move(handler));
}

void OutgoingMessage::notify_finished(boost::system::error_code ec) {
    if (finish_result_) {
        return;
    }
    finish_result_ = ec;

    auto handlers = std::move(finish_handlers_);
    finish_handlers_.clear();
    for (auto& handler : handlers) {
        handler(ec);
    }
}

} // namespace onion::core
