#include <asio.hpp>
#include <httplib.h>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <thread>

#include "cli.hpp"
#include "client.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "log.hpp"
#include "myjd_api.hpp"
#include "routes.hpp"

namespace {
// Try once at startup; if the account is unreachable the first API call connects lazily.
void initialize_connection(Connection& connection) {
    try {
        Log::info("Attempting to connect to MyJDownloader...");
        connection.connect();
    } catch (const Error::ConnectionError& e) {
        Log::warn(std::string("Could not connect to MyJDownloader on startup: ") + e.what());
        Log::info("Connection will be attempted when first API call is made");
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!Cli::parse(argc, argv, options)) {
        Cli::print_usage();
        return 1;
    }
    if (options.help) {
        Cli::print_usage();
        return 0;
    }
    if (options.verbose) Log::set_level(Log::Level::Debug);
    if (!options.log_file.empty() && !Log::set_file(options.log_file)) {
        std::cerr << "Cannot open log file: " << options.log_file << std::endl;
        return 1;
    }

    CONFIG config;
    try {
        config = Config::load(options.config_path);
    } catch (const Error::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        std::cerr << "Please check " << options.config_path << std::endl;
        return 1;
    }
    Log::info("jdbridge startup");

    auto api = std::make_shared<MyJDApi>(config.api_url, config.credentials.app_key, config.timeout_seconds);
    Connection connection(api, config.credentials);
    MyJDClient client(connection, config);
    initialize_connection(connection);

    httplib::Server svr;

    // Request logger
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        Log::info(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    // Error logger
    svr.set_error_logger([](const httplib::Error& err, const httplib::Request* req) {
        std::string line = httplib::to_string(err) + " while processing request";
        if (req) {
            line += ", request: '" + req->method + " " + req->path + " " + req->version + "'";
        }
        Log::error(line);
    });

    // 404 and 405 get the same JSON shape as every other failure
    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        Routes::Reply reply = res.status == httplib::StatusCode::MethodNotAllowed_405
                                  ? Routes::error_reply(res.status, "method_not_allowed", "Method not allowed")
                                  : Routes::error_reply(res.status, "not_found", "Endpoint not found");
        res.set_content(reply.body.dump(), "application/json");
    });

    svr.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "Unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            Log::error("Non-standard exception escaped a handler");
        }
        Log::error("Error 500: " + what);
        res.status = httplib::StatusCode::InternalServerError_500;
        res.set_content(Routes::error_reply(res.status, "internal_error", "Internal server error").body.dump(),
                        "application/json");
    });

    Routes::register_routes(svr, client);

    // Enable thread pool for concurrent request handling
    int num_threads = std::max(2, static_cast<int>(std::thread::hardware_concurrency()));
    svr.new_task_queue = [num_threads] { return new httplib::ThreadPool(num_threads); };

    // SIGINT/SIGTERM stop the listener; cleanup happens below once listen() returns
    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&svr](const asio::error_code& ec, int signal_number) {
        if (ec) return;
        Log::info("Received signal " + std::to_string(signal_number) + ", shutting down");
        svr.stop();
    });
    std::thread signal_thread([&io] { io.run(); });

    Log::info("Server listening on " + options.host + ":" + std::to_string(options.port) + " with " +
              std::to_string(num_threads) + " worker threads");
    const bool listened = svr.listen(options.host, options.port);
    if (!listened) {
        Log::error("Failed to listen on " + options.host + ":" + std::to_string(options.port));
    }

    io.stop();
    signal_thread.join();
    connection.disconnect();
    return listened ? 0 : 1;
}
