#include "onion/core/context_storage.h"
#include "onion/core/context.h"

namespace onion::core {

namespace {

thread_local const ContextStorage::Scope* current_scope = nullptr;

} // namespace

ContextStorage::Scope::Scope(const ContextStorage& storage, Context& ctx) noexcept
    : storage_(&storage)
    , ctx_(&ctx)
    , previous_(current_scope) {
    current_scope = this;
}

ContextStorage::Scope::~Scope() {
    current_scope = previous_;
}

Context* ContextStorage::get_store() const noexcept {
    for (const Scope* scope = current_scope; scope != nullptr; scope = scope->previous_) {
        if (scope->storage_ == this) {
            return scope->ctx_;
        }
    }
    return nullptr;
}

Completion ContextStorage::bind(Context& ctx, Completion handler) const {
    return [this, owner = ctx.shared_from_this(), handler = std::move(handler)](std::exception_ptr error) {
        Scope scope(*this, *owner);
        handler(error);
    };
}

Middleware ContextStorage::wrap(Middleware middleware) const {
    return [this, middleware = std::move(middleware)](Context& ctx, Next next, Completion done) {
        Next scoped_next = [this, &ctx, next = std::move(next)](Completion after) {
            next(bind(ctx, std::move(after)));
        };
        Scope scope(*this, ctx);
        middleware(ctx, std::move(scoped_next), std::move(done));
    };
}

} // namespace onion::core
