#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <vector>

namespace onion::core {

class Context;

// Signals that a step settled; a null pointer means success.
using Completion = std::function<void(std::exception_ptr)>;

// Runs the rest of the chain. The argument is invoked once everything
// downstream has settled. May be called at most once per middleware.
using Next = std::function<void(Completion)>;

// A middleware inspects or mutates the context, optionally calls `next`,
// optionally runs more code once `next` settled, and finally reports its own
// outcome through `done`. Throwing is equivalent to `done(error)`.
using Middleware = std::function<void(Context&, Next, Completion)>;

using Pipeline = std::function<void(Context&, Completion)>;

using ComposeFn = std::function<Pipeline(std::vector<Middleware>)>;

// Folds `middleware` into one pipeline that runs them in order. Code before
// `next` runs top-down, code after it bottom-up. Throws TypeError if any
// entry is empty.
Pipeline compose(std::vector<Middleware> middleware);

// Ordered list of middleware owned by an application.
// Not synchronized: mutate it before serving traffic.
class MiddlewareChain {
public:
    void add(Middleware middleware);

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    // Copy of the current list; later `add` calls do not affect it.
    std::vector<Middleware> snapshot() const;

private:
    std::vector<Middleware> chain_;
};

} // namespace onion::core
