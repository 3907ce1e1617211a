#include <gtest/gtest.h>
#include <core/connection_id.hpp>
#include <set>

TEST(ConnectionIdTest, Format) {
    EXPECT_EQ(make_connection_id("alice", "web.example.com", 22), "alice@web.example.com:22");
    EXPECT_EQ(make_connection_id("root", "10.0.0.5", 2222), "root@10.0.0.5:2222");
}

TEST(ConnectionIdTest, UniqueReturnsBaseWhenFree) {
    auto taken = [](const std::string&) { return false; };
    EXPECT_EQ(make_unique_connection_id("a@h:22", taken), "a@h:22");
}

TEST(ConnectionIdTest, UniqueSkipsTakenSuffixes) {
    std::set<std::string> live = {"a@h:22", "a@h:22#2", "a@h:22#3"};
    auto taken = [&](const std::string& id) { return live.count(id) > 0; };
    EXPECT_EQ(make_unique_connection_id("a@h:22", taken), "a@h:22#4");
}
