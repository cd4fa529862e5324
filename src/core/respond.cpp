#include "onion/core/respond.h"
#include "onion/core/context.h"
#include "onion/core/status.h"
#include "onion/core/stream.h"

#include <string>
#include <string_view>
#include <variant>

namespace onion::core {

namespace {

// Writes whichever body representation is active and ends the response.
class BodyWriter {
public:
    explicit BodyWriter(Context& ctx)
        : ctx_(ctx) {}

    void operator()(const std::monostate&) const {
        ctx_.res().end();
    }

    void operator()(const Response::Buffer& body) const {
        ctx_.res().end(std::string_view(body.data(), body.size()));
    }

    void operator()(const std::string& body) const {
        ctx_.res().end(body);
    }

    void operator()(const ReadableStreamPtr& body) const {
        auto owner = ctx_.shared_from_this();
        pipe(body, ctx_.outgoing(), [owner](std::exception_ptr error) {
            owner->onerror(error);
        });
    }

    void operator()(const nlohmann::json& body) const {
        const auto text = body.dump();
        if (!ctx_.res().headers_sent()) {
            ctx_.set_length(text.size());
        }
        ctx_.res().end(text);
    }

private:
    Context& ctx_;
};

} // namespace

void respond(Context& ctx) {
    if (!ctx.respond()) {
        return;
    }
    if (!ctx.writable()) {
        return;
    }

    auto& res = ctx.res();
    const int code = ctx.status();

    if (status_is_empty(code)) {
        ctx.set_body(nullptr);
        res.end();
        return;
    }

    if (ctx.method() == "HEAD") {
        if (!res.headers_sent() && !ctx.response().has("Content-Length")) {
            if (auto length = ctx.length()) {
                ctx.set_length(*length);
            }
        }
        res.end();
        return;
    }

    if (!ctx.response().has_body()) {
        if (ctx.response().explicit_null_body()) {
            ctx.remove("Content-Type");
            ctx.remove("Transfer-Encoding");
            ctx.set_length(0);
            res.end();
            return;
        }

        std::string body;
        if (ctx.req().http_version_major() >= 2) {
            body = std::to_string(code);
        } else {
            body = ctx.message();
            if (body.empty()) {
                body = std::to_string(code);
            }
        }
        if (!res.headers_sent()) {
            ctx.set_type("text");
            ctx.set_length(body.size());
        }
        res.end(body);
        return;
    }

    std::visit(BodyWriter(ctx), ctx.body());
}

} // namespace onion::core
