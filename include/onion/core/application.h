#pragma once

#include "onion/core/context.h"
#include "onion/core/context_storage.h"
#include "onion/core/middleware.h"
#include "onion/core/options.h"
#include "onion/core/properties.h"
#include "onion/core/transport.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace onion::core {

// Holds configuration, the middleware chain and the template objects every
// request's context delegates to, and turns them into a request handler.
//
// The middleware chain and the templates are shared by all requests; mutate
// them before serving traffic.
class Application {
public:
    using RequestHandler = std::function<void(std::shared_ptr<IncomingMessage>,
                                              std::shared_ptr<OutgoingMessage>)>;
    // `ctx` is null for errors not tied to a request.
    using ErrorHandler = std::function<void(std::exception_ptr, Context*)>;

    explicit Application(Options options = {});

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // --- configuration ---
    bool proxy() const noexcept;
    void set_proxy(bool proxy) noexcept;
    int subdomain_offset() const noexcept;
    void set_subdomain_offset(int offset) noexcept;
    const std::string& proxy_ip_header() const noexcept;
    std::size_t max_ips_count() const noexcept;
    const std::string& env() const noexcept;
    const std::optional<std::vector<std::string>>& keys() const noexcept;
    void set_keys(std::vector<std::string> keys);

    // A silent application never prints unhandled errors.
    bool silent() const noexcept;
    void set_silent(bool silent) noexcept;

    // --- templates ---
    PropertyBag& context_template() noexcept;
    PropertyBag& request_template() noexcept;
    PropertyBag& response_template() noexcept;

    // --- middleware ---
    // Throws TypeError for an empty callable; the chain is left unchanged.
    Application& use(Middleware middleware);
    const MiddlewareChain& middleware() const noexcept;

    // Composes the chain as it is now. Middleware added afterwards only
    // affects handlers returned by later calls.
    RequestHandler callback();

    std::shared_ptr<Context> create_context(std::shared_ptr<IncomingMessage> req,
                                            std::shared_ptr<OutgoingMessage> res);

    void handle_request(const std::shared_ptr<Context>& ctx, const Pipeline& pipeline);

    // --- errors ---
    // Default reporter. Throws TypeError when `error` is not a std::exception.
    void onerror(std::exception_ptr error) const;

    // Replaces the default reporter entirely.
    void on_error(ErrorHandler handler);
    bool has_error_handler() const noexcept;
    void emit_error(std::exception_ptr error, Context* ctx) const;

    std::ostream& error_stream() const noexcept;
    void set_error_stream(std::ostream& stream) noexcept;

    // --- execution-context propagation ---
    // Null when propagation is disabled or no request is being processed.
    Context* current_context() const noexcept;
    const ContextStorage* context_storage() const noexcept;
    // Throws std::logic_error when propagation is disabled.
    Middleware create_context_storage_middleware() const;

    // --- introspection ---
    nlohmann::json to_json() const;
    nlohmann::json inspect() const;

private:
    Options options_;
    bool silent_ = false;
    MiddlewareChain middleware_;

    PropertyBag context_template_;
    PropertyBag request_template_;
    PropertyBag response_template_;

    ErrorHandler error_handler_;
    std::ostream* error_stream_;
    std::unique_ptr<ContextStorage> ctx_storage_;
};

std::ostream& operator<<(std::ostream& os, const Application& app);

} // namespace onion::core
