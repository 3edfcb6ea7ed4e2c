#include "single_instance.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

SingleInstance::SingleInstance(LockRegistry& registry, const Config& config)
    : lock_file_(registry, config.lock_file()),
      coordinator_(lock_file_, config.server()) {
    coordinator_.acquire();
}

SingleInstance::~SingleInstance() {
    try {
        close();
    } catch (const std::exception& e) {
        solo_log(fmt::format("SingleInstance: error while closing: {}", e.what()));
    }
}

bool SingleInstance::is_first() {
    return coordinator_.acquire();
}

void SingleInstance::on_message(MessageHandler handler) {
    if (server_) {
        throw IllegalStateError("IPC server is already started");
    }

    server_ = coordinator_.open_server();
    if (!server_) {
        return;
    }

    LocalServer* server = server_.get();
    worker_ = std::thread([server, handler = std::move(handler)]() {
        try {
            server->consume(handler);
        } catch (const std::exception& e) {
            solo_log(fmt::format("SingleInstance: error while consuming messages: {}", e.what()));
        }
    });
}

void SingleInstance::on_already_running(const std::function<void(DistantInstance&)>& action) {
    if (!distant_) {
        auto found = coordinator_.find_distant();
        if (!found) {
            return;
        }
        // DistantInstance holds a reference, so it can be moved but not assigned
        distant_.emplace(std::move(*found));
    }
    action(*distant_);
}

std::optional<int> SingleInstance::server_port() const {
    if (!server_) {
        return std::nullopt;
    }
    try {
        return server_->port();
    } catch (const IllegalStateError&) {
        return std::nullopt;
    }
}

void SingleInstance::close() {
    if (server_) {
        server_->close();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    server_.reset();
    distant_.reset();
    coordinator_.release();
}
