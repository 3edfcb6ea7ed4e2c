#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <core/config.hpp>
#include <ipc/lock_file.hpp>
#include <ipc/local_server.hpp>
#include "distant_instance.hpp"
#include "instance_coordinator.hpp"

// One-stop setup for applications:
//
//   LockRegistry registry;
//   SingleInstance app(registry, Config::defaults());
//   app.on_already_running([&](DistantInstance& first) { first.send("open", path); exit(0); });
//   app.on_message([](const Message& m) { open_document(m.data_string()); });
//
// Everything is released by close(), which the destructor calls.
class SingleInstance {
public:
    SingleInstance(LockRegistry& registry, const Config& config);
    ~SingleInstance();

    SingleInstance(const SingleInstance&) = delete;
    SingleInstance& operator=(const SingleInstance&) = delete;

    // True if this process holds the lock.
    bool is_first();

    // When first, open the server and consume messages on a worker thread.
    // Does nothing when another process is first. Throws IllegalStateError if
    // the server was already started.
    void on_message(MessageHandler handler);

    // When another process is first, call `action` with a handle on it. The
    // handle is cached and reused on later calls.
    void on_already_running(const std::function<void(DistantInstance&)>& action);

    InstanceCoordinator& coordinator() { return coordinator_; }

    // Port of the running server, or nullopt if this process does not serve.
    std::optional<int> server_port() const;

    // Stop the server, join the worker, forget the distant handle and release
    // the lock. Idempotent.
    void close();

private:
    LockFile lock_file_;
    InstanceCoordinator coordinator_;
    std::unique_ptr<LocalServer> server_;
    std::thread worker_;
    std::optional<DistantInstance> distant_;
};
