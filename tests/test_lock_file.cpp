#include <gtest/gtest.h>
#include <ipc/lock_file.hpp>
#include <ipc/instance_state.hpp>
#include <core/errors.hpp>
#include "test_support.hpp"
#include <atomic>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

class LockFileTest : public ::testing::Test {
protected:
    fs::path path;
    LockRegistry registry;

    void SetUp() override {
        path = unique_temp_path("lockfile");
        fs::remove(path);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

TEST_F(LockFileTest, AcquireCreatesAndReleaseDeletes) {
    LockFile lock(registry, path);
    EXPECT_FALSE(lock.held());

    EXPECT_TRUE(lock.acquire());
    EXPECT_TRUE(lock.held());
    EXPECT_TRUE(fs::exists(path));

    // Acquiring again through the same object is a no-op
    EXPECT_TRUE(lock.acquire());
    EXPECT_EQ(registry.holders(path), 1);

    lock.release();
    EXPECT_FALSE(lock.held());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(LockFileTest, LockThenAcquire) {
    LockFile lock(registry, path);
    lock.lock();
    EXPECT_TRUE(fs::exists(path));
    EXPECT_TRUE(lock.acquire());

    lock.release();
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(LockFileTest, ReleaseIsIdempotent) {
    LockFile never(registry, path);
    never.release();
    never.release();

    LockFile lock(registry, path);
    ASSERT_TRUE(lock.acquire());
    lock.release();
    lock.release();
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(LockFileTest, LocalHoldersShareOneLock) {
    LockFile first(registry, path);
    LockFile second(registry, path);
    ASSERT_TRUE(first.acquire());
    ASSERT_TRUE(second.acquire());
    EXPECT_EQ(registry.holders(path), 2);

    LockRegistry other_process;
    LockFile outsider(other_process, path);

    second.release();
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(registry.holders(path), 1);
    EXPECT_FALSE(outsider.acquire());

    first.release();
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(registry.holders(path), 0);
    EXPECT_TRUE(outsider.acquire());
}

TEST_F(LockFileTest, RelativeAndAbsolutePathsShareOneLock) {
    LockFile absolute(registry, path);
    LockFile dotted(registry, path.parent_path() / "." / path.filename());
    ASSERT_TRUE(absolute.acquire());
    ASSERT_TRUE(dotted.acquire());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.holders(path), 2);
}

TEST_F(LockFileTest, SecondRegistryIsExcluded) {
    LockRegistry other_process;
    LockFile mine(registry, path);
    LockFile theirs(other_process, path);

    ASSERT_TRUE(mine.acquire());
    EXPECT_FALSE(theirs.acquire());
    EXPECT_FALSE(theirs.held());

    mine.release();
    EXPECT_TRUE(theirs.acquire());
}

TEST_F(LockFileTest, ExclusiveAcrossProcesses) {
    int ready[2];
    int go[2];
    ASSERT_EQ(pipe(ready), 0);
    ASSERT_EQ(pipe(go), 0);

    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        LockRegistry child_registry;
        LockFile lock(child_registry, path);
        char byte = lock.acquire() ? 'y' : 'n';
        if (write(ready[1], &byte, 1) != 1) _exit(2);
        if (read(go[0], &byte, 1) != 1) _exit(3);
        lock.release();
        _exit(0);
    }

    char byte = 0;
    ASSERT_EQ(read(ready[0], &byte, 1), 1);
    ASSERT_EQ(byte, 'y');

    LockFile lock(registry, path);
    EXPECT_FALSE(lock.acquire());

    ASSERT_EQ(write(go[1], "x", 1), 1);
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    EXPECT_TRUE(lock.acquire());

    for (int fd : {ready[0], ready[1], go[0], go[1]}) close(fd);
}

TEST_F(LockFileTest, BlockingLockWaitsForRelease) {
    LockFile holder(registry, path);
    ASSERT_TRUE(holder.acquire());

    LockRegistry other_process;
    LockFile waiter(other_process, path);
    std::atomic<bool> locked{false};
    std::thread t([&] {
        waiter.lock();
        locked.store(true);
    });

    platform::sleep_ms(100);
    EXPECT_FALSE(locked.load());

    // Release deletes the file; the waiter must end up on the new one
    holder.release();
    EXPECT_TRUE(wait_until([&] { return locked.load(); }));
    t.join();

    EXPECT_TRUE(waiter.held());
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(holder.acquire());
}

TEST_F(LockFileTest, ConcurrentLocalLocksShareOneWait) {
    LockRegistry other_process;
    LockFile holder(other_process, path);
    ASSERT_TRUE(holder.acquire());

    LockFile a(registry, path);
    LockFile b(registry, path);
    std::atomic<bool> a_locked{false};
    std::atomic<bool> b_locked{false};
    std::thread ta([&] {
        a.lock();
        a_locked.store(true);
    });
    std::thread tb([&] {
        b.lock();
        b_locked.store(true);
    });

    platform::sleep_ms(100);
    EXPECT_FALSE(a_locked.load());
    EXPECT_FALSE(b_locked.load());

    // Still held elsewhere: a local try fails instead of joining the wait
    LockFile c(registry, path);
    EXPECT_FALSE(c.acquire());

    holder.release();
    EXPECT_TRUE(wait_until([&] { return a_locked.load() && b_locked.load(); }));
    ta.join();
    tb.join();
    EXPECT_EQ(registry.holders(path), 2);
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_TRUE(c.acquire());
    EXPECT_EQ(registry.holders(path), 3);
    EXPECT_FALSE(holder.acquire());

    a.release();
    c.release();
    EXPECT_TRUE(fs::exists(path));
    b.release();
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(LockFileTest, LockJoinsLocalWaiterAfterAcquireMisses) {
    LockRegistry other_process;
    LockFile holder(other_process, path);
    ASSERT_TRUE(holder.acquire());

    LockFile waiting(registry, path);
    LockFile trying(registry, path);
    std::atomic<bool> waiting_locked{false};
    std::atomic<bool> trying_locked{false};
    std::thread tw([&] {
        waiting.lock();
        waiting_locked.store(true);
    });
    std::thread tt([&] {
        // Try first, then fall back to waiting, as a caller polling would
        if (!trying.acquire()) {
            trying.lock();
        }
        trying_locked.store(true);
    });

    platform::sleep_ms(100);
    EXPECT_FALSE(waiting_locked.load());
    EXPECT_FALSE(trying_locked.load());

    holder.release();
    EXPECT_TRUE(wait_until([&] { return waiting_locked.load() && trying_locked.load(); }));
    tw.join();
    tt.join();
    EXPECT_EQ(registry.holders(path), 2);
}

TEST_F(LockFileTest, WriteRead) {
    LockFile lock(registry, path);
    ASSERT_TRUE(lock.acquire());

    lock.write([](StateWriter& out) {
        out.write_int32(144);
        uint8_t flag = 1;
        out.write_bytes(&flag, 1);
    });

    bool ok = lock.read([](StateReader& in) {
        EXPECT_EQ(in.read_int32(), std::optional<int32_t>(144));
        uint8_t flag = 0;
        EXPECT_EQ(in.read_bytes(&flag, 1), 1u);
        EXPECT_EQ(flag, 1);
        return true;
    });
    EXPECT_TRUE(ok);

    // Rewriting truncates what was there
    lock.write([](StateWriter& out) { out.write_int32(102); });
    EXPECT_EQ(fs::file_size(path), 4u);
    auto values = lock.read([](StateReader& in) {
        auto first = in.read_int32();
        auto second = in.read_int32();
        return std::make_pair(first, second);
    });
    EXPECT_EQ(values.first, std::optional<int32_t>(102));
    EXPECT_FALSE(values.second.has_value());
}

TEST_F(LockFileTest, NegativeValuesRoundTrip) {
    LockFile lock(registry, path);
    lock.write([](StateWriter& out) { out.write_int32(-2); });
    EXPECT_EQ(lock.read([](StateReader& in) { return in.read_int32(); }),
              std::optional<int32_t>(-2));
}

TEST_F(LockFileTest, WriteTakesTheLock) {
    LockFile lock(registry, path);
    lock.write([](StateWriter& out) { out.write_int32(7); });
    EXPECT_TRUE(lock.held());
}

TEST_F(LockFileTest, WriteHeldElsewhereThrows) {
    LockRegistry other_process;
    LockFile owner(other_process, path);
    ASSERT_TRUE(owner.acquire());

    LockFile lock(registry, path);
    EXPECT_THROW(lock.write([](StateWriter& out) { out.write_int32(1); }), IllegalStateError);
}

TEST_F(LockFileTest, ReadWithoutHoldingTheLock) {
    LockRegistry other_process;
    LockFile owner(other_process, path);
    owner.write([](StateWriter& out) { out.write_int32(4242); });

    LockFile reader(registry, path);
    EXPECT_FALSE(reader.acquire());
    EXPECT_EQ(reader.read([](StateReader& in) { return in.read_int32(); }),
              std::optional<int32_t>(4242));
}

TEST_F(LockFileTest, ReadMissingFileThrows) {
    LockFile lock(registry, path);
    EXPECT_THROW(lock.read([](StateReader& in) { return in.read_int32(); }), IoError);
}

TEST_F(LockFileTest, OpenFailureIsIoError) {
    LockFile lock(registry, "/proc/solo-does-not-exist/dir/x.lock");
    EXPECT_THROW(lock.acquire(), IoError);
}

TEST_F(LockFileTest, DestructorReleases) {
    {
        LockFile lock(registry, path);
        ASSERT_TRUE(lock.acquire());
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(registry.size(), 0u);
}

// ── InstanceState ───────────────────────────────────────────

TEST_F(LockFileTest, InstanceStateWithoutPort) {
    LockFile lock(registry, path);
    InstanceState state;
    state.pid = 1234;
    write_instance_state(lock, state);

    EXPECT_EQ(fs::file_size(path), 4u);
    InstanceState read = read_instance_state(lock);
    EXPECT_EQ(read.pid, 1234);
    EXPECT_FALSE(read.has_port());
}

TEST_F(LockFileTest, InstanceStateWithPort) {
    LockFile lock(registry, path);
    InstanceState state;
    state.pid = 1234;
    state.port = 50123;
    write_instance_state(lock, state);

    EXPECT_EQ(fs::file_size(path), 8u);
    InstanceState read = read_instance_state(lock);
    EXPECT_EQ(read.pid, 1234);
    EXPECT_EQ(read.port, std::optional<int32_t>(50123));
    EXPECT_EQ(read.to_string(), "pid=1234 port=50123");
}

TEST_F(LockFileTest, InstanceStateNotWrittenYet) {
    LockFile lock(registry, path);
    ASSERT_TRUE(lock.acquire());
    EXPECT_THROW(read_instance_state(lock), IllegalStateError);
}
