#pragma once

#include "onion/core/properties.h"
#include "onion/core/stream.h"
#include "onion/core/transport.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace onion::core {

// Response view of one exchange: the intended status, headers and body,
// kept until the response is serialized.
class Response {
public:
    using Buffer = std::vector<char>;
    // monostate means "no body".
    using Body = std::variant<std::monostate, Buffer, std::string, ReadableStreamPtr, nlohmann::json>;

    Response(std::shared_ptr<OutgoingMessage> res,
             std::shared_ptr<IncomingMessage> req,
             const PropertyBag* prototype);

    OutgoingMessage& res() const noexcept;
    PropertyBag& properties() noexcept;
    const PropertyBag& properties() const noexcept;

    // --- status ---
    int status() const;
    // Throws std::invalid_argument outside 100..999. Ignored once headers
    // are sent.
    void set_status(int code);
    bool explicit_status() const noexcept;

    std::string message() const;
    void set_message(std::string message);

    // --- body ---
    const Body& body() const noexcept;
    bool has_body() const noexcept;

    void set_body(std::nullptr_t);
    void set_body(std::string body);
    void set_body(std::string_view body);
    void set_body(const char* body);
    void set_body(Buffer body);
    void set_body(ReadableStreamPtr body);
    void set_body(nlohmann::json body);

    // Set when the body was cleared with an explicit null.
    bool explicit_null_body() const noexcept;

    // Content-Length if present, else the size the body would serialize to;
    // nullopt for streams and when there is no body.
    std::optional<std::size_t> length() const;
    void set_length(std::size_t length);

    // Media type without parameters, empty when unset.
    std::string type() const;
    // Accepts a full media type or a shorthand: text, html, json, bin, ...
    void set_type(std::string_view type);

    // --- headers ---
    bool has(std::string_view name) const;
    std::string get(std::string_view name) const;
    void set(std::string name, std::string value);
    void remove(std::string_view name);

    bool headers_sent() const;
    bool writable() const;

    void redirect(const std::string& url);

    nlohmann::json to_json() const;

private:
    void prepare_for_value(std::string_view default_type);

    std::shared_ptr<OutgoingMessage> res_;
    std::shared_ptr<IncomingMessage> req_;
    PropertyBag properties_;
    Body body_;
    bool explicit_status_ = false;
    bool explicit_null_body_ = false;
};

// Expands a shorthand or extension to a full Content-Type value, adding
// "; charset=utf-8" to textual types. Empty if unknown.
std::string content_type_for(std::string_view type);

} // namespace onion::core
