#include "event_loop.hpp"
#include <core/errors.hpp>
#include <atomic>
#include <algorithm>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

namespace {

class PollEventLoop : public EventLoop {
public:
    PollEventLoop() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            throw io_error_from_errno("pipe2()");
        }
        wake_read_ = fds[0];
        wake_write_ = fds[1];
        try {
            platform::set_nonblocking(wake_read_);
            platform::set_nonblocking(wake_write_);
        } catch (const IoError&) {
            close(wake_read_);
            close(wake_write_);
            throw;
        }
    }

    ~PollEventLoop() override {
        close(wake_read_);
        close(wake_write_);
    }

    void watch_accept(socket_t fd) override { watched_.push_back({fd, true}); }
    void watch_read(socket_t fd) override { watched_.push_back({fd, false}); }

    void unwatch(socket_t fd) override {
        watched_.erase(std::remove_if(watched_.begin(), watched_.end(),
                                      [fd](const Watch& w) { return w.fd == fd; }),
                       watched_.end());
    }

    bool wait(std::vector<ReadyEvent>& events) override {
        events.clear();

        std::vector<pollfd> pfds;
        pfds.reserve(watched_.size() + 1);
        pfds.push_back({wake_read_, POLLIN, 0});
        for (const auto& w : watched_) {
            pfds.push_back({w.fd, POLLIN, 0});
        }

        while (!stop_.load()) {
            int rc = poll(pfds.data(), static_cast<nfds_t>(pfds.size()), -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw io_error_from_errno("poll()");
            }

            if (pfds[0].revents & POLLIN) {
                char drain[64];
                while (read(wake_read_, drain, sizeof(drain)) > 0) {}
            }
            if (stop_.load()) break;

            for (std::size_t i = 1; i < pfds.size(); ++i) {
                if (pfds[i].revents == 0) continue;
                const Watch& w = watched_[i - 1];
                ReadyEvent ev;
                ev.fd = w.fd;
                ev.acceptable = w.accept;
                ev.readable = !w.accept;
                events.push_back(ev);
            }
            if (!events.empty()) return true;
        }
        return false;
    }

    void interrupt() override {
        stop_.store(true);
        char byte = 1;
        // Pipe full means a wakeup is already pending
        ssize_t ignored = write(wake_write_, &byte, 1);
        (void)ignored;
    }

    bool interrupted() const override { return stop_.load(); }

private:
    struct Watch {
        socket_t fd;
        bool accept;
    };

    std::vector<Watch> watched_;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::atomic<bool> stop_{false};
};

} // namespace

std::unique_ptr<EventLoop> make_event_loop() {
    return std::make_unique<PollEventLoop>();
}
