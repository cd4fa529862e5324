#pragma once

#include "onion/core/middleware.h"

#include <utility>

namespace onion::core {

class Context;

// Makes the context of the request being processed retrievable without
// passing it around.
//
// A scope is bound to the current thread and lasts for one synchronous
// stretch of execution. Continuations that resume the request later must be
// wrapped with `bind` (the pipeline's own continuations are when the
// middleware went through `wrap`).
class ContextStorage {
public:
    ContextStorage() = default;
    ContextStorage(const ContextStorage&) = delete;
    ContextStorage& operator=(const ContextStorage&) = delete;

    // RAII scope; restores whatever was current before it.
    class Scope {
    public:
        Scope(const ContextStorage& storage, Context& ctx) noexcept;
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        const ContextStorage* storage_;
        Context* ctx_;
        const Scope* previous_;

        friend class ContextStorage;
    };

    template<typename F>
    decltype(auto) run(Context& ctx, F&& fn) const {
        Scope scope(*this, ctx);
        return std::forward<F>(fn)();
    }

    // Context of the innermost scope of this storage on this thread.
    Context* get_store() const noexcept;

    // The returned handler keeps `ctx` alive and runs `handler` inside its
    // scope.
    Completion bind(Context& ctx, Completion handler) const;

    // `middleware` runs inside the scope, and so do the continuations it
    // passes to `next`.
    Middleware wrap(Middleware middleware) const;
};

} // namespace onion::core
