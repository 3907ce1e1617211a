#include <gtest/gtest.h>
#include <managers/connection_registry.hpp>
#include <core/constants.hpp>
#include "fake_transport.hpp"
#include <chrono>
#include <future>
#include <thread>

class ConnectionRegistryTest : public ::testing::Test {
protected:
    std::unique_ptr<ShellSession> make_session(const std::shared_ptr<FakeRemote>& remote,
                                               const std::string& directory = "/home/alice") {
        auto session = std::make_unique<ShellSession>(std::make_unique<FakeTransport>(remote));
        session->set_current_directory(directory);
        return session;
    }
};

TEST_F(ConnectionRegistryTest, UnknownIdIsNotFound) {
    ConnectionRegistry registry;

    auto dir = registry.get_directory("no-such-id");
    EXPECT_TRUE(dir.is_err());
    EXPECT_EQ(dir.kind, ErrorKind::NotFound);
    EXPECT_EQ(dir.error, MSG_NOT_FOUND);

    bool called = false;
    auto r = registry.with_session("no-such-id", [&](ShellSession&) { called = true; return 0; });
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
    EXPECT_FALSE(called);
}

TEST_F(ConnectionRegistryTest, InsertAndLookup) {
    ConnectionRegistry registry;
    auto remote = std::make_shared<FakeRemote>();

    EXPECT_EQ(registry.insert("alice@web:22", make_session(remote, "/srv")), "alice@web:22");
    EXPECT_TRUE(registry.contains("alice@web:22"));
    EXPECT_EQ(registry.size(), 1u);

    auto dir = registry.get_directory("alice@web:22");
    ASSERT_TRUE(dir.is_ok());
    EXPECT_EQ(dir.value, "/srv");

    auto r = registry.with_session("alice@web:22", [](ShellSession& s) {
        return s.current_directory().size();
    });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 4u);
}

TEST_F(ConnectionRegistryTest, RemoveOnceClosesSession) {
    ConnectionRegistry registry;
    auto remote = std::make_shared<FakeRemote>();
    registry.insert("alice@web:22", make_session(remote));

    EXPECT_TRUE(registry.remove("alice@web:22"));
    EXPECT_FALSE(registry.remove("alice@web:22"));
    EXPECT_EQ(remote->closed_count(), 1);
    EXPECT_EQ(registry.get_directory("alice@web:22").kind, ErrorKind::NotFound);
}

TEST_F(ConnectionRegistryTest, ReplaceClosesDisplacedSession) {
    ConnectionRegistry registry;
    auto first = std::make_shared<FakeRemote>();
    auto second = std::make_shared<FakeRemote>();

    registry.insert("alice@web:22", make_session(first, "/first"));
    EXPECT_EQ(registry.insert("alice@web:22", make_session(second, "/second")), "alice@web:22");

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(first->closed_count(), 1);
    EXPECT_EQ(second->closed_count(), 0);
    EXPECT_EQ(registry.get_directory("alice@web:22").value, "/second");
}

TEST_F(ConnectionRegistryTest, UniquePolicySuffixesDuplicates) {
    RegistrySettings settings;
    settings.duplicate_ids = DuplicateIdPolicy::Unique;
    ConnectionRegistry registry(settings);
    auto remote = std::make_shared<FakeRemote>();

    EXPECT_EQ(registry.insert("alice@web:22", make_session(remote)), "alice@web:22");
    EXPECT_EQ(registry.insert("alice@web:22", make_session(remote)), "alice@web:22#2");
    EXPECT_EQ(registry.insert("alice@web:22", make_session(remote)), "alice@web:22#3");
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(remote->closed_count(), 0);
}

TEST_F(ConnectionRegistryTest, ListIds) {
    ConnectionRegistry registry;
    auto remote = std::make_shared<FakeRemote>();
    registry.insert("bob@db:2222", make_session(remote));
    registry.insert("alice@web:22", make_session(remote));

    auto ids = registry.list_ids();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "alice@web:22");
    EXPECT_EQ(ids[1], "bob@db:2222");
}

TEST_F(ConnectionRegistryTest, ClearClosesEverything) {
    ConnectionRegistry registry;
    auto remote = std::make_shared<FakeRemote>();
    registry.insert("a@h:22", make_session(remote));
    registry.insert("b@h:22", make_session(remote));

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(remote->closed_count(), 2);
}

TEST_F(ConnectionRegistryTest, DistinctConnectionsRunConcurrently) {
    ConnectionRegistry registry;
    auto slow = std::make_shared<FakeRemote>();
    auto fast = std::make_shared<FakeRemote>();
    registry.insert("a@slow:22", make_session(slow));
    registry.insert("b@fast:22", make_session(fast));

    auto blocked = std::async(std::launch::async, [&] {
        return registry.with_session("a@slow:22", [](ShellSession& s) {
            return s.transport().exec("block", ExecOptions{}).value.exit_code;
        });
    });
    ASSERT_TRUE(slow->wait_until_blocked());

    auto other = std::async(std::launch::async, [&] {
        return registry.with_session("b@fast:22", [](ShellSession& s) {
            return s.transport().exec("echo hi", ExecOptions{}).value.stdout_data;
        });
    });
    ASSERT_EQ(other.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto r = other.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "hi\n");

    // The directory query does not wait behind the running command either.
    EXPECT_EQ(registry.get_directory("a@slow:22").value, "/home/alice");

    slow->release();
    auto done = blocked.get();
    ASSERT_TRUE(done.is_ok());
    EXPECT_EQ(done.value, 0);
}

TEST_F(ConnectionRegistryTest, BusyConnectionTimesOutWhenLockWaitSet) {
    RegistrySettings settings;
    settings.lock_wait_ms = 50;
    ConnectionRegistry registry(settings);
    auto remote = std::make_shared<FakeRemote>();
    registry.insert("a@h:22", make_session(remote));

    auto blocked = std::async(std::launch::async, [&] {
        return registry.with_session("a@h:22", [](ShellSession& s) {
            return s.transport().exec("block", ExecOptions{}).value.exit_code;
        });
    });
    ASSERT_TRUE(remote->wait_until_blocked());

    auto r = registry.with_session("a@h:22", [](ShellSession&) { return 1; });
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LockUnavailable);
    EXPECT_EQ(r.error, "Lock error: connection a@h:22 is busy");

    remote->release();
    EXPECT_TRUE(blocked.get().is_ok());

    auto after = registry.with_session("a@h:22", [](ShellSession&) { return 2; });
    ASSERT_TRUE(after.is_ok());
    EXPECT_EQ(after.value, 2);
}

TEST_F(ConnectionRegistryTest, GlobalLockingSerializesAcrossConnections) {
    RegistrySettings settings;
    settings.locking = LockingMode::Global;
    settings.lock_wait_ms = 50;
    ConnectionRegistry registry(settings);
    auto slow = std::make_shared<FakeRemote>();
    auto fast = std::make_shared<FakeRemote>();
    registry.insert("a@slow:22", make_session(slow));
    registry.insert("b@fast:22", make_session(fast));

    auto blocked = std::async(std::launch::async, [&] {
        return registry.with_session("a@slow:22", [](ShellSession& s) {
            return s.transport().exec("block", ExecOptions{}).value.exit_code;
        });
    });
    ASSERT_TRUE(slow->wait_until_blocked());

    auto r = registry.with_session("b@fast:22", [](ShellSession&) { return 1; });
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LockUnavailable);
    EXPECT_EQ(r.error, "Lock error: another command is still running");

    slow->release();
    EXPECT_TRUE(blocked.get().is_ok());
    EXPECT_TRUE(registry.with_session("b@fast:22", [](ShellSession&) { return 1; }).is_ok());
}

TEST_F(ConnectionRegistryTest, RemovalDuringCommandClosesAfterwards) {
    ConnectionRegistry registry;
    auto remote = std::make_shared<FakeRemote>();
    registry.insert("a@h:22", make_session(remote));

    auto blocked = std::async(std::launch::async, [&] {
        return registry.with_session("a@h:22", [](ShellSession& s) {
            return s.transport().exec("block", ExecOptions{}).value.stdout_data;
        });
    });
    ASSERT_TRUE(remote->wait_until_blocked());

    EXPECT_TRUE(registry.remove("a@h:22"));
    EXPECT_FALSE(registry.contains("a@h:22"));
    EXPECT_EQ(remote->closed_count(), 0);

    remote->release();
    auto r = blocked.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "unblocked\n");
    EXPECT_EQ(remote->closed_count(), 1);
}

TEST_F(ConnectionRegistryTest, ReplacingBusySessionDoesNotWait) {
    RegistrySettings settings;
    settings.lock_wait_ms = 50;
    ConnectionRegistry registry(settings);
    auto first = std::make_shared<FakeRemote>();
    auto second = std::make_shared<FakeRemote>();
    registry.insert("a@h:22", make_session(first, "/first"));

    auto blocked = std::async(std::launch::async, [&] {
        return registry.with_session("a@h:22", [](ShellSession& s) {
            return s.transport().exec("block", ExecOptions{}).value.stdout_data;
        });
    });
    ASSERT_TRUE(first->wait_until_blocked());

    auto replaced = std::async(std::launch::async, [&] {
        return registry.insert("a@h:22", make_session(second, "/second"));
    });
    ASSERT_EQ(replaced.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(replaced.get(), "a@h:22");
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get_directory("a@h:22").value, "/second");

    // The old session stays open until its command returns.
    EXPECT_EQ(first->closed_count(), 0);
    first->release();
    auto r = blocked.get();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "unblocked\n");
    EXPECT_EQ(first->closed_count(), 1);
    EXPECT_EQ(second->closed_count(), 0);
}
