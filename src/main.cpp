#include <iostream>
#include <vector>
#include <string>
#include <atomic>
#include <csignal>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <instance/single_instance.hpp>
#include <platform/platform.hpp>

static std::atomic<bool> g_stop{false};

static void handle_signal(int) {
    g_stop.store(true);
}

void print_usage() {
    std::cout << "Usage:\n"
              << "    solo [options] [NAME [DATA...]]\n\n"
              << "The first invocation becomes the running instance and prints the\n"
              << "messages it receives. Later invocations forward NAME (default \"open\")\n"
              << "and DATA to it and exit. A message named \"quit\" stops the instance.\n\n"
              << "Options:\n"
              << "    --config FILE   Read settings from FILE instead of solo.yaml\n"
              << "    --lock FILE     Lock file path (overrides the config)\n"
              << "    --version       Show version\n"
              << "    --help          Show this help\n";
}

static int run_first(SingleInstance& app) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    app.on_message([](const Message& message) {
        std::cout << fmt::format("{}: {}", message.name, message.data_string()) << std::endl;
        if (message.name == "quit") {
            g_stop.store(true);
        }
    });

    auto port = app.server_port();
    if (!port) {
        std::cerr << "Failed to start the instance server\n";
        return 1;
    }
    std::cout << fmt::format("Running as pid {} on port {}", platform::current_pid(), *port) << std::endl;

    while (!g_stop.load()) {
        platform::sleep_ms(100);
    }

    app.close();
    return 0;
}

static int run_follower(SingleInstance& app, const Message& message) {
    int status = 0;
    app.on_already_running([&](DistantInstance& first) {
        try {
            first.send(message);
            std::cout << fmt::format("Forwarded \"{}\" to pid {}", message.name, first.pid()) << std::endl;
        } catch (const IllegalStateError& e) {
            std::cerr << fmt::format("Instance {} is not serving yet: {}", first.pid(), e.what()) << "\n";
            status = 1;
        } catch (const IoError& e) {
            std::cerr << fmt::format("Cannot reach instance {}: {}", first.pid(), e.what()) << "\n";
            status = 1;
        }
    });
    return status;
}

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::string lock_path;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--version") {
                std::cout << "solo version 0.1.0\n";
                return 0;
            } else if ((arg == "--config" || arg == "--lock") && i + 1 < argc) {
                (arg == "--config" ? config_path : lock_path) = argv[++i];
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage();
                return 1;
            } else {
                positional.push_back(arg);
            }
        }

        auto config_result = config_path.empty() ? Config::load() : Config::load_file(config_path);
        if (config_result.is_err()) {
            std::cerr << config_result.error << "\n";
            return 1;
        }
        Config config = config_result.value;
        if (!lock_path.empty()) {
            config.set_lock_file(lock_path);
        }
        set_log_path(config.log().file);

        Message message(positional.empty() ? "open" : positional[0]);
        for (std::size_t i = 1; i < positional.size(); ++i) {
            if (i > 1) message.data.push_back(' ');
            message.data.insert(message.data.end(), positional[i].begin(), positional[i].end());
        }

        LockRegistry registry;
        SingleInstance app(registry, config);

        if (app.is_first()) {
            return run_first(app);
        }
        return run_follower(app, message);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
