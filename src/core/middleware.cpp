#include "onion/core/middleware.h"
#include "onion/core/errors.h"

#include <boost/log/trivial.hpp>

#include <memory>

namespace onion::core {

namespace {

using Stack = std::shared_ptr<const std::vector<Middleware>>;

void dispatch(const Stack& stack, std::size_t index, Context& ctx, Completion done) {
    if (index == stack->size()) {
        done(nullptr);
        return;
    }

    auto settled = std::make_shared<bool>(false);
    Completion finish = [settled, index, done = std::move(done)](std::exception_ptr error) {
        if (*settled) {
            BOOST_LOG_TRIVIAL(warning)
                << "middleware #" << index << " completed more than once, ignoring";
            return;
        }
        *settled = true;
        done(error);
    };

    auto called = std::make_shared<bool>(false);
    Next next = [stack, index, &ctx, called, finish](Completion after) {
        // Code after `next` belongs to this middleware: if it throws, this
        // middleware failed.
        Completion resume = [after = std::move(after), finish](std::exception_ptr error) {
            try {
                after(error);
            } catch (...) {
                finish(std::current_exception());
            }
        };
        if (*called) {
            resume(std::make_exception_ptr(MultipleCallError()));
            return;
        }
        *called = true;
        dispatch(stack, index + 1, ctx, std::move(resume));
    };

    try {
        (*stack)[index](ctx, std::move(next), finish);
    } catch (...) {
        finish(std::current_exception());
    }
}

} // namespace

Pipeline compose(std::vector<Middleware> middleware) {
    for (const auto& fn : middleware) {
        if (!fn) {
            throw TypeError("middleware must be a function!");
        }
    }

    Stack stack = std::make_shared<const std::vector<Middleware>>(std::move(middleware));
    return [stack](Context& ctx, Completion done) {
        dispatch(stack, 0, ctx, std::move(done));
    };
}

void MiddlewareChain::add(Middleware middleware) {
    chain_.push_back(std::move(middleware));
}

std::size_t MiddlewareChain::size() const noexcept {
    return chain_.size();
}

bool MiddlewareChain::empty() const noexcept {
    return chain_.empty();
}

std::vector<Middleware> MiddlewareChain::snapshot() const {
    return chain_;
}

} // namespace onion::core
