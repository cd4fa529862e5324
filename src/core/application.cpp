#include "onion/core/application.h"
#include "onion/core/errors.h"
#include "onion/core/respond.h"

#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace onion::core {

namespace {

std::string resolve_env(const std::optional<std::string>& env) {
    if (env && !env->empty()) {
        return *env;
    }
    if (const char* value = std::getenv("ONION_ENV"); value != nullptr && *value != '\0') {
        return value;
    }
    return "development";
}

std::string indent(const std::string& text, const std::string& prefix) {
    std::istringstream lines(text);
    std::string line;
    std::string out;
    while (std::getline(lines, line)) {
        out += prefix;
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace

Application::Application(Options options)
    : options_(std::move(options))
    , error_stream_(&std::cerr) {
    options_.env = resolve_env(options_.env);
    if (!options_.compose) {
        options_.compose = compose;
    }
    if (options_.async_local_storage) {
        ctx_storage_ = std::make_unique<ContextStorage>();
    }
}

bool Application::proxy() const noexcept {
    return options_.proxy;
}

void Application::set_proxy(bool proxy) noexcept {
    options_.proxy = proxy;
}

int Application::subdomain_offset() const noexcept {
    return options_.subdomain_offset;
}

void Application::set_subdomain_offset(int offset) noexcept {
    options_.subdomain_offset = offset;
}

const std::string& Application::proxy_ip_header() const noexcept {
    return options_.proxy_ip_header;
}

std::size_t Application::max_ips_count() const noexcept {
    return options_.max_ips_count;
}

const std::string& Application::env() const noexcept {
    return *options_.env;
}

const std::optional<std::vector<std::string>>& Application::keys() const noexcept {
    return options_.keys;
}

void Application::set_keys(std::vector<std::string> keys) {
    options_.keys = std::move(keys);
}

bool Application::silent() const noexcept {
    return silent_;
}

void Application::set_silent(bool silent) noexcept {
    silent_ = silent;
}

PropertyBag& Application::context_template() noexcept {
    return context_template_;
}

PropertyBag& Application::request_template() noexcept {
    return request_template_;
}

PropertyBag& Application::response_template() noexcept {
    return response_template_;
}

Application& Application::use(Middleware middleware) {
    if (!middleware) {
        throw TypeError("middleware must be a function!");
    }
    middleware_.add(std::move(middleware));
    BOOST_LOG_TRIVIAL(debug) << "use middleware #" << middleware_.size();
    return *this;
}

const MiddlewareChain& Application::middleware() const noexcept {
    return middleware_;
}

Application::RequestHandler Application::callback() {
    auto stack = middleware_.snapshot();
    if (ctx_storage_) {
        for (auto& fn : stack) {
            fn = ctx_storage_->wrap(std::move(fn));
        }
    }
    Pipeline pipeline = options_.compose(std::move(stack));

    return [this, pipeline](std::shared_ptr<IncomingMessage> req,
                            std::shared_ptr<OutgoingMessage> res) {
        auto ctx = create_context(std::move(req), std::move(res));
        if (!ctx_storage_) {
            handle_request(ctx, pipeline);
            return;
        }
        ctx_storage_->run(*ctx, [&] { handle_request(ctx, pipeline); });
    };
}

std::shared_ptr<Context> Application::create_context(std::shared_ptr<IncomingMessage> req,
                                                      std::shared_ptr<OutgoingMessage> res) {
    return std::make_shared<Context>(*this, std::move(req), std::move(res));
}

void Application::handle_request(const std::shared_ptr<Context>& ctx, const Pipeline& pipeline) {
    ctx->res().set_status_code(404);

    // Released by the transport once it fired.
    ctx->res().on_finished([ctx](boost::system::error_code ec) {
        if (ec) {
            ctx->onerror(std::make_exception_ptr(boost::system::system_error(ec)));
        }
    });

    Completion settled = [ctx](std::exception_ptr error) {
        if (error) {
            ctx->onerror(error);
            return;
        }
        try {
            respond(*ctx);
        } catch (...) {
            ctx->onerror(std::current_exception());
        }
    };
    if (ctx_storage_) {
        settled = ctx_storage_->bind(*ctx, std::move(settled));
    }

    try {
        pipeline(*ctx, std::move(settled));
    } catch (...) {
        ctx->onerror(std::current_exception());
    }
}

void Application::onerror(std::exception_ptr error) const {
    if (!is_native_error(error)) {
        auto described = to_native_error(error);
        try {
            std::rethrow_exception(described);
        } catch (const std::exception& e) {
            throw TypeError(e.what());
        }
    }

    try {
        std::rethrow_exception(error);
    } catch (const HttpError& e) {
        if (e.status() == 404 || e.expose()) {
            return;
        }
        if (silent_) {
            return;
        }
        *error_stream_ << '\n' << indent(describe_error(e), "  ") << std::endl;
    } catch (const std::exception& e) {
        if (silent_) {
            return;
        }
        *error_stream_ << '\n' << indent(describe_error(e), "  ") << std::endl;
    }
}

void Application::on_error(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

bool Application::has_error_handler() const noexcept {
    return static_cast<bool>(error_handler_);
}

void Application::emit_error(std::exception_ptr error, Context* ctx) const {
    if (error_handler_) {
        error_handler_(error, ctx);
        return;
    }
    onerror(error);
}

std::ostream& Application::error_stream() const noexcept {
    return *error_stream_;
}

void Application::set_error_stream(std::ostream& stream) noexcept {
    error_stream_ = &stream;
}

Context* Application::current_context() const noexcept {
    return ctx_storage_ ? ctx_storage_->get_store() : nullptr;
}

const ContextStorage* Application::context_storage() const noexcept {
    return ctx_storage_.get();
}

Middleware Application::create_context_storage_middleware() const {
    if (!ctx_storage_) {
        throw std::logic_error("context propagation is disabled, enable Options::async_local_storage");
    }
    const ContextStorage* storage = ctx_storage_.get();
    return [storage](Context& ctx, Next next, Completion done) {
        storage->run(ctx, [&] { next(storage->bind(ctx, std::move(done))); });
    };
}

nlohmann::json Application::to_json() const {
    return {
        {"subdomainOffset", options_.subdomain_offset},
        {"proxy", options_.proxy},
        {"env", env()},
    };
}

nlohmann::json Application::inspect() const {
    return to_json();
}

std::ostream& operator<<(std::ostream& os, const Application& app) {
    return os << app.to_json().dump();
}

} // namespace onion::core
