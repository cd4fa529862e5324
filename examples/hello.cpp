#include "onion/core/application.h"
#include "onion/infrastructure/net/listener.h"

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace onion;

namespace {

struct Settings {
    std::string address = "127.0.0.1";
    unsigned short port = 3000;
    bool silent = false;
};

Settings parse_args(int argc, char** argv) {
    Settings settings;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            settings.port = static_cast<unsigned short>(std::stoi(argv[++i]));
        } else if (arg == "--address" && i + 1 < argc) {
            settings.address = argv[++i];
        } else if (arg == "--silent") {
            settings.silent = true;
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return settings;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto settings = parse_args(argc, argv);

        core::Application app;
        app.set_silent(settings.silent);

        // x-response-time
        app.use([](core::Context& ctx, core::Next next, core::Completion done) {
            const auto start = std::chrono::steady_clock::now();
            next([&ctx, start, done](std::exception_ptr error) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                ctx.set("X-Response-Time", std::to_string(elapsed.count()) + "ms");
                done(error);
            });
        });

        // logger
        app.use([](core::Context& ctx, core::Next next, core::Completion done) {
            next([&ctx, done](std::exception_ptr error) {
                BOOST_LOG_TRIVIAL(info) << ctx.method() << ' ' << ctx.url() << " - " << ctx.status();
                done(error);
            });
        });

        app.use([](core::Context& ctx, core::Next, core::Completion done) {
            if (ctx.path() == "/boom") {
                ctx.throw_error(500, "boom");
            }
            if (ctx.path() == "/json") {
                ctx.set_body(nlohmann::json{{"hello", "world"}});
            } else {
                ctx.set_body("Hello World");
            }
            done(nullptr);
        });

        boost::asio::io_context io_context;
        const auto endpoint = boost::asio::ip::tcp::endpoint(
            boost::asio::ip::make_address(settings.address), settings.port);
        auto listener = infrastructure::net::listen(app, io_context, endpoint);

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            listener->stop();
            io_context.stop();
        });

        BOOST_LOG_TRIVIAL(info) << "listening on " << listener->local_endpoint()
                                << " " << app;
        io_context.run();
    } catch (const std::exception& e) {
        std::cerr << "onion_hello: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
