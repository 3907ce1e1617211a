#include <gtest/gtest.h>
#include <shell/command_rewriter.hpp>

TEST(CommandRewriterTest, DetectsDirectoryChange) {
    EXPECT_TRUE(is_directory_change("cd /tmp"));
    EXPECT_TRUE(is_directory_change("cd"));
    EXPECT_TRUE(is_directory_change("  cd ..  "));
    EXPECT_FALSE(is_directory_change("cdrom"));
    EXPECT_FALSE(is_directory_change("ls; cd /tmp"));
    EXPECT_FALSE(is_directory_change("echo cd /tmp"));
}

TEST(CommandRewriterTest, DirectoryChangeArgumentIsTrimmed) {
    EXPECT_EQ(directory_change_argument("cd /tmp"), "/tmp");
    EXPECT_EQ(directory_change_argument("   cd    ~/src   "), "~/src");
    EXPECT_EQ(directory_change_argument("cd"), "");
}

TEST(CommandRewriterTest, DirectoryChangeAppendsPwd) {
    EXPECT_EQ(rewrite_command("cd /tmp", "/home/alice", QuotingMode::Literal), "cd /tmp && pwd");
    EXPECT_EQ(rewrite_command("cd /tmp", "", QuotingMode::Literal), "cd /tmp && pwd");
    EXPECT_EQ(rewrite_command("cd", "/home/alice", QuotingMode::Literal), "cd  && pwd");
}

TEST(CommandRewriterTest, DirectoryChangeArgumentIsVerbatim) {
    // Not quoted, so ~ and $HOME still expand on the remote side.
    EXPECT_EQ(rewrite_command("cd ~/src", "/tmp", QuotingMode::Posix), "cd ~/src && pwd");
    EXPECT_EQ(rewrite_command("cd $HOME", "/tmp", QuotingMode::Posix), "cd $HOME && pwd");
}

TEST(CommandRewriterTest, OtherCommandsArePrefixed) {
    EXPECT_EQ(rewrite_command("ls -la", "/var/log", QuotingMode::Literal),
              "cd '/var/log' && ls -la");
    EXPECT_EQ(rewrite_command("cdrom", "/tmp", QuotingMode::Literal), "cd '/tmp' && cdrom");
}

TEST(CommandRewriterTest, NoPrefixBeforeDirectoryIsKnown) {
    EXPECT_EQ(rewrite_command("ls", "", QuotingMode::Literal), "ls");
    EXPECT_EQ(rewrite_command("ls", "", QuotingMode::Posix), "ls");
}

TEST(CommandRewriterTest, LiteralQuotingKeepsDirectoryAsIs) {
    EXPECT_EQ(quote_directory("/tmp/it's", QuotingMode::Literal), "'/tmp/it's'");
    EXPECT_EQ(rewrite_command("ls", "/tmp/it's", QuotingMode::Literal), "cd '/tmp/it's' && ls");
}

TEST(CommandRewriterTest, PosixQuotingEscapesSingleQuotes) {
    EXPECT_EQ(quote_directory("/tmp/it's", QuotingMode::Posix), "'/tmp/it'\\''s'");
    EXPECT_EQ(quote_directory("/srv/a b", QuotingMode::Posix), "'/srv/a b'");
    EXPECT_EQ(rewrite_command("ls", "/tmp/it's", QuotingMode::Posix),
              "cd '/tmp/it'\\''s' && ls");
}

TEST(CommandRewriterTest, ShellMetacharacters) {
    EXPECT_FALSE(has_shell_metacharacters("/home/alice/src"));
    EXPECT_FALSE(has_shell_metacharacters("/srv/with space"));
    EXPECT_TRUE(has_shell_metacharacters("/tmp/it's"));
    EXPECT_TRUE(has_shell_metacharacters("/tmp/a && rm"));
    EXPECT_TRUE(has_shell_metacharacters("/tmp/a;b"));
    EXPECT_TRUE(has_shell_metacharacters("/tmp/$(id)"));
    EXPECT_TRUE(has_shell_metacharacters("/tmp/`id`"));
}
