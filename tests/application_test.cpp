#include "fake_transport.h"

#include "onion/core/application.h"
#include "onion/core/errors.h"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <gtest/gtest.h>

#include <sstream>

using namespace onion;

namespace {

core::Middleware pass_through() {
    return [](core::Context&, core::Next next, core::Completion done) { next(done); };
}

class ApplicationTest : public ::testing::Test {
protected:
    ApplicationTest() {
        app.set_error_stream(errors);
    }

    test::Exchange serve(std::string method = "GET", std::string url = "/", int version_major = 1) {
        auto exchange = test::make_exchange(std::move(method), std::move(url), version_major);
        app.callback()(exchange.req, exchange.res);
        return exchange;
    }

    core::Application app;
    std::ostringstream errors;
};

} // namespace

TEST_F(ApplicationTest, UseAppendsAndChains) {
    auto& result = app.use(pass_through()).use(pass_through());

    EXPECT_EQ(&app, &result);
    EXPECT_EQ(2u, app.middleware().size());
}

TEST_F(ApplicationTest, UseRejectsEmptyMiddleware) {
    app.use(pass_through());

    EXPECT_THROW(app.use(core::Middleware{}), core::TypeError);
    EXPECT_EQ(1u, app.middleware().size());
}

TEST_F(ApplicationTest, DefaultOptions) {
    EXPECT_FALSE(app.proxy());
    EXPECT_EQ(2, app.subdomain_offset());
    EXPECT_EQ("X-Forwarded-For", app.proxy_ip_header());
    EXPECT_EQ(0u, app.max_ips_count());
    EXPECT_FALSE(app.keys().has_value());
    EXPECT_FALSE(app.env().empty());
}

TEST_F(ApplicationTest, OptionsAreApplied) {
    core::Options options;
    options.proxy = true;
    options.subdomain_offset = 3;
    options.env = "production";
    options.keys = std::vector<std::string>{"secret"};
    core::Application configured(options);

    EXPECT_TRUE(configured.proxy());
    EXPECT_EQ(3, configured.subdomain_offset());
    EXPECT_EQ("production", configured.env());
    ASSERT_TRUE(configured.keys().has_value());
    EXPECT_EQ(std::vector<std::string>{"secret"}, *configured.keys());
}

TEST_F(ApplicationTest, ToJsonExposesOnlySettings) {
    core::Options options;
    options.env = "test";
    options.proxy_ip_header = "X-Real-IP";
    core::Application configured(options);

    const nlohmann::json expected = {
        {"subdomainOffset", 2},
        {"proxy", false},
        {"env", "test"},
    };
    EXPECT_EQ(expected, configured.to_json());
    EXPECT_EQ(expected, configured.inspect());

    std::ostringstream printed;
    printed << configured;
    EXPECT_EQ(expected.dump(), printed.str());
}

TEST_F(ApplicationTest, CreateContextWiresTheExchange) {
    auto exchange = test::make_exchange("POST", "/users?id=1");
    auto ctx = app.create_context(exchange.req, exchange.res);

    EXPECT_EQ(&app, &ctx->app());
    EXPECT_EQ(exchange.req.get(), &ctx->req());
    EXPECT_EQ(exchange.res.get(), &ctx->res());
    EXPECT_EQ(exchange.req.get(), &ctx->request().req());
    EXPECT_EQ(exchange.res.get(), &ctx->response().res());
    EXPECT_EQ("/users?id=1", ctx->original_url());
    EXPECT_EQ("/users?id=1", ctx->request().original_url());
    EXPECT_TRUE(ctx->state().empty());
    EXPECT_TRUE(ctx->respond());
}

TEST_F(ApplicationTest, ContextsHaveIndependentState) {
    auto first = test::make_exchange();
    auto second = test::make_exchange();
    auto a = app.create_context(first.req, first.res);
    auto b = app.create_context(second.req, second.res);

    ASSERT_NE(a.get(), b.get());
    a->state().set("user", std::string("alice"));

    EXPECT_NE(nullptr, a->state().get<std::string>("user"));
    EXPECT_EQ(nullptr, b->state().get<std::string>("user"));
}

TEST_F(ApplicationTest, TemplatesAreSharedButNotMutatedByRequests) {
    app.context_template().set("greeting", std::string("hello"));
    app.request_template().set("limit", 10);
    app.response_template().set("server", std::string("onion"));

    auto first = test::make_exchange();
    auto second = test::make_exchange();
    auto a = app.create_context(first.req, first.res);
    auto b = app.create_context(second.req, second.res);

    ASSERT_NE(nullptr, a->properties().get<std::string>("greeting"));
    *a->properties().get<std::string>("greeting") = "changed";

    const auto& untouched = static_cast<const core::Context&>(*b).properties();
    EXPECT_EQ("hello", *untouched.get<std::string>("greeting"));
    EXPECT_EQ("changed", *a->properties().get<std::string>("greeting"));
    EXPECT_EQ(10, *b->request().properties().get<int>("limit"));
    EXPECT_EQ("onion", *b->response().properties().get<std::string>("server"));
}

TEST_F(ApplicationTest, UnhandledRequestIsNotFound) {
    auto exchange = serve();

    EXPECT_EQ(404, exchange.res->status_code());
    EXPECT_EQ("Not Found", exchange.res->data());
    EXPECT_TRUE(exchange.res->ended());
}

TEST_F(ApplicationTest, UnhandledHttp2RequestGetsStatusCodeBody) {
    auto exchange = serve("GET", "/", 2);

    EXPECT_EQ("404", exchange.res->data());
}

TEST_F(ApplicationTest, MiddlewareSetsBody) {
    app.use([](core::Context& ctx, core::Next, core::Completion done) {
        ctx.set_body("hi " + ctx.path());
        done(nullptr);
    });

    auto exchange = serve("GET", "/there?x=1");

    EXPECT_EQ(200, exchange.res->status_code());
    EXPECT_EQ("hi /there", exchange.res->data());
}

TEST_F(ApplicationTest, CallbackFreezesTheChain) {
    app.use([](core::Context& ctx, core::Next next, core::Completion done) {
        ctx.set_body("first");
        next(done);
    });
    auto handler = app.callback();
    app.use([](core::Context& ctx, core::Next, core::Completion done) {
        ctx.set_body("second");
        done(nullptr);
    });

    auto old_exchange = test::make_exchange();
    handler(old_exchange.req, old_exchange.res);
    auto new_exchange = serve();

    EXPECT_EQ("first", old_exchange.res->data());
    EXPECT_EQ("second", new_exchange.res->data());
}

TEST_F(ApplicationTest, CustomComposeIsUsed) {
    int composed = 0;
    core::Options options;
    options.compose = [&composed](std::vector<core::Middleware> middleware) {
        ++composed;
        return core::compose(std::move(middleware));
    };
    core::Application custom(options);
    custom.use(pass_through());

    custom.callback();

    EXPECT_EQ(1, composed);
}

TEST_F(ApplicationTest, PipelineErrorBecomesErrorResponse) {
    app.use([](core::Context& ctx, core::Next, core::Completion) {
        ctx.throw_error(500, "database down");
    });

    auto exchange = serve();

    EXPECT_EQ(500, exchange.res->status_code());
    EXPECT_EQ("Internal Server Error", exchange.res->data());
    EXPECT_NE(std::string::npos, errors.str().find("database down"));
}

TEST_F(ApplicationTest, ExposedErrorMessageIsSentAndNotLogged) {
    app.use([](core::Context& ctx, core::Next, core::Completion) {
        ctx.throw_error(422, "name is required");
    });

    auto exchange = serve();

    EXPECT_EQ(422, exchange.res->status_code());
    EXPECT_EQ("name is required", exchange.res->data());
    EXPECT_TRUE(errors.str().empty());
}

TEST_F(ApplicationTest, ErrorHandlerOverrideReplacesDefault) {
    std::vector<std::string> seen;
    app.on_error([&seen](std::exception_ptr error, core::Context* ctx) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            seen.push_back(std::string(e.what()) + " @ " + (ctx ? ctx->path() : "-"));
        }
    });
    app.use([](core::Context&, core::Next, core::Completion done) {
        done(std::make_exception_ptr(std::runtime_error("kaput")));
    });

    auto exchange = serve("GET", "/a");

    ASSERT_TRUE(app.has_error_handler());
    EXPECT_EQ(std::vector<std::string>{"kaput @ /a"}, seen);
    EXPECT_TRUE(errors.str().empty());
    EXPECT_EQ(500, exchange.res->status_code());
}

TEST_F(ApplicationTest, TransportFailureIsReported) {
    std::vector<std::exception_ptr> seen;
    app.on_error([&seen](std::exception_ptr error, core::Context*) { seen.push_back(error); });
    app.use([](core::Context&, core::Next, core::Completion) {
        // Never settles: the connection drops while the request is pending.
    });

    auto exchange = serve();
    exchange.res->fail(boost::asio::error::connection_reset);

    ASSERT_EQ(1u, seen.size());
    try {
        std::rethrow_exception(seen.front());
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(boost::asio::error::connection_reset, e.code());
    } catch (...) {
        FAIL() << "expected boost::system::system_error";
    }
}

TEST_F(ApplicationTest, SuccessfulFinishIsNotReported) {
    int reported = 0;
    app.on_error([&reported](std::exception_ptr, core::Context*) { ++reported; });

    serve();

    EXPECT_EQ(0, reported);
}

TEST_F(ApplicationTest, NonErrorThrownIsWrapped) {
    std::string message;
    app.on_error([&message](std::exception_ptr error, core::Context*) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            message = e.what();
        }
    });
    app.use([](core::Context&, core::Next, core::Completion) {
        throw std::string("oops");
    });

    auto exchange = serve();

    EXPECT_EQ(R"(non-error thrown: "oops")", message);
    EXPECT_EQ(500, exchange.res->status_code());
}

// --- default error policy ---

TEST_F(ApplicationTest, DefaultPolicyIgnoresNotFound) {
    app.onerror(std::make_exception_ptr(core::HttpError(404)));

    EXPECT_TRUE(errors.str().empty());
}

TEST_F(ApplicationTest, DefaultPolicyIgnoresExposedErrors) {
    app.onerror(std::make_exception_ptr(core::HttpError(500, "shown", true)));

    EXPECT_TRUE(errors.str().empty());
}

TEST_F(ApplicationTest, DefaultPolicyReportsServerErrors) {
    app.onerror(std::make_exception_ptr(core::HttpError(500, "boom")));

    const auto report = errors.str();
    EXPECT_NE(std::string::npos, report.find("  onion::core::HttpError: boom"));
    EXPECT_EQ('\n', report.front());
}

TEST_F(ApplicationTest, DefaultPolicyIndentsNestedCauses) {
    try {
        try {
            throw std::runtime_error("socket closed");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("query failed"));
        }
    } catch (...) {
        app.onerror(std::current_exception());
    }

    const auto report = errors.str();
    EXPECT_NE(std::string::npos, report.find("query failed"));
    EXPECT_NE(std::string::npos, report.find("\n  caused by: std::runtime_error: socket closed"));
}

TEST_F(ApplicationTest, DefaultPolicyRespectsSilent) {
    app.set_silent(true);

    app.onerror(std::make_exception_ptr(std::runtime_error("quiet")));
    app.onerror(std::make_exception_ptr(core::HttpError(404)));

    EXPECT_TRUE(errors.str().empty());
}

TEST_F(ApplicationTest, DefaultPolicyRejectsNonErrors) {
    EXPECT_THROW(app.onerror(std::make_exception_ptr(42)), core::TypeError);
    EXPECT_THROW(app.onerror(nullptr), core::TypeError);
}
