#include <gtest/gtest.h>
#include <ssh/command_executor.hpp>
#include "support/mock_transport.hpp"

using namespace std::chrono_literals;

class CommandExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();

    static ConnectionConfig config(std::optional<std::string> su_password = std::nullopt) {
        ConnectionConfig c;
        c.host = "box";
        c.username = "ops";
        c.password = "secret";
        c.su_password = std::move(su_password);
        return c;
    }

    // Channel 0 is the su shell; later channels are exec channels
    void su_then_exec(std::function<std::string(const std::string&)> run,
                      const std::string& exec_out) {
        transport->configure_channel = [run, exec_out](MockChannelState& ch, int index) {
            if (index == 0) {
                script_su_shell(ch, "rootpw", run);
            } else {
                script_exec(ch, exec_out, "", 0);
            }
        };
    }
};

TEST_F(CommandExecutorTest, CollectsStdoutStderrAndStatus) {
    transport->configure_channel = [](MockChannelState& ch, int) {
        script_exec(ch, "hello\n", "warning: x\n", 3);
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto r = exec.exec_command("echo hello", 5s);
    ASSERT_TRUE(r.is_ok()) << r.describe();
    EXPECT_EQ(r.value.stdout_data, "hello\n");
    EXPECT_EQ(r.value.stderr_data, "warning: x\n");
    EXPECT_EQ(r.value.exit_code, std::optional<int>(3));
    EXPECT_FALSE(r.value.success());
    EXPECT_TRUE(transport->exec_log->contains("echo hello"));
    EXPECT_TRUE(transport->channel(0)->closed);
}

TEST_F(CommandExecutorTest, ConnectsLazily) {
    transport->configure_channel = [](MockChannelState& ch, int) {
        script_exec(ch, "ok", "", 0);
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    EXPECT_EQ(transport->opens.load(), 0);
    ASSERT_TRUE(exec.exec_command("true", 5s).is_ok());
    EXPECT_EQ(transport->opens.load(), 1);
}

TEST_F(CommandExecutorTest, MissingExitStatusStillSucceeds) {
    transport->configure_channel = [](MockChannelState& ch, int) {
        script_exec(ch, "partial", "", std::nullopt);
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto r = exec.exec_command("kill -9 $$", 5s);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.exit_code.has_value());
    EXPECT_TRUE(r.value.success());
}

TEST_F(CommandExecutorTest, ChunkedOutputConcatenated) {
    transport->configure_channel = [](MockChannelState& ch, int) {
        ch.on_exec = [](MockChannelState& c, const std::string&) {
            c.push(ChannelEvent::stdout_data("a"));
            c.push(ChannelEvent::stderr_data("x"));
            c.push(ChannelEvent::stdout_data("b"));
            c.push(ChannelEvent::stderr_data("y"));
            c.push(ChannelEvent::eof());
            c.push(ChannelEvent::exit(0));
            c.push(ChannelEvent::closed());
        };
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto r = exec.exec_command("mixed", 5s);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "ab");
    EXPECT_EQ(r.value.stderr_data, "xy");
    EXPECT_EQ(r.value.exit_code, std::optional<int>(0));
}

TEST_F(CommandExecutorTest, TimeoutSendsAbort) {
    // First channel never answers; the abort channel does
    transport->configure_channel = [](MockChannelState& ch, int index) {
        if (index > 0) script_exec(ch, "", "", 0);
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto start = std::chrono::steady_clock::now();
    auto r = exec.exec_command("sleep 100", 200ms);
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_EQ(r.describe(), "Command timeout after 200ms");
    EXPECT_LT(took, 2s);

    conn.wait_background();
    EXPECT_TRUE(transport->channel(0)->closed);
    EXPECT_TRUE(transport->exec_log->contains(
        "timeout 3s pkill -f 'sleep 100' 2>/dev/null || true"));
}

TEST_F(CommandExecutorTest, TimeoutDoesNotWaitForChannelClose) {
    transport->configure_channel = [](MockChannelState& ch, int index) {
        if (index == 0) {
            ch.close_delay = 2s;
        } else {
            script_exec(ch, "", "", 0);
        }
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto start = std::chrono::steady_clock::now();
    auto r = exec.exec_command("sleep 100", 200ms);
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_LT(took, 1s);
    EXPECT_FALSE(transport->channel(0)->closed);

    conn.wait_background();
    EXPECT_TRUE(transport->channel(0)->closed);
}

TEST_F(CommandExecutorTest, HugeTimeoutDoesNotExpireEarly) {
    transport->configure_channel = [](MockChannelState& ch, int) {
        script_exec(ch, "ok\n", "", 0);
    };
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto r = exec.exec_command("echo ok", std::chrono::milliseconds(10000000000000LL));
    ASSERT_TRUE(r.is_ok()) << r.describe();
    EXPECT_EQ(r.value.stdout_data, "ok\n");
    EXPECT_EQ(r.value.exit_code, std::optional<int>(0));

    conn.wait_background();
    EXPECT_FALSE(transport->exec_log->contains(
        "timeout 3s pkill -f 'echo ok' 2>/dev/null || true"));
}

TEST_F(CommandExecutorTest, AbortCommandEscapesQuotes) {
    EXPECT_EQ(build_abort_command("echo 'x'"),
              "timeout 3s pkill -f 'echo '\"'\"'x'\"'\"'' 2>/dev/null || true");
}

TEST_F(CommandExecutorTest, AbortWithoutSessionIsHarmless) {
    ConnectionManager conn(config(), transport);
    abort_remote_command(conn, "sleep 1");
    EXPECT_TRUE(transport->exec_log->snapshot().empty());
}

TEST_F(CommandExecutorTest, ConnectionFailureSurfaces) {
    transport->fail_open = true;
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);

    auto r = exec.exec_command("uptime", 5s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
}

TEST_F(CommandExecutorTest, ChannelOpenFailureSurfaces) {
    ConnectionManager conn(config(), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());

    transport->fail_channel_open = true;
    auto r = exec.exec_command("uptime", 5s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
}

// ── Elevated shell ───────────────────────────────────────────

TEST_F(CommandExecutorTest, ElevatedShellRunsCommand) {
    su_then_exec([](const std::string& cmd) {
        return cmd == "whoami" ? std::string("root\r\n") : std::string();
    }, "unused");
    ConnectionManager conn(config(std::string("rootpw")), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());
    ASSERT_TRUE(conn.is_elevated());

    auto r = exec.exec_command("whoami", 5s);
    ASSERT_TRUE(r.is_ok()) << r.describe();
    EXPECT_EQ(r.value.stdout_data, "root\n");
    EXPECT_TRUE(r.value.stderr_data.empty());
    EXPECT_EQ(r.value.exit_code, std::optional<int>(0));

    // Typed into the root shell, no exec channel
    EXPECT_TRUE(transport->exec_log->snapshot().empty());
    auto writes = transport->channel(0)->writes();
    EXPECT_EQ(writes.back(), "whoami\n");
    EXPECT_TRUE(conn.is_elevated());
}

TEST_F(CommandExecutorTest, ElevatedShellHugeTimeout) {
    su_then_exec([](const std::string&) { return std::string("root\r\n"); }, "unused");
    ConnectionManager conn(config(std::string("rootpw")), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());

    auto r = exec.exec_command("whoami", std::chrono::milliseconds::max());
    ASSERT_TRUE(r.is_ok()) << r.describe();
    EXPECT_EQ(r.value.stdout_data, "root\n");
}

TEST_F(CommandExecutorTest, ElevatedShellReusedAcrossCommands) {
    su_then_exec([](const std::string& cmd) { return cmd + "-out\r\n"; }, "unused");
    ConnectionManager conn(config(std::string("rootpw")), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());

    auto a = exec.exec_command("one", 5s);
    auto b = exec.exec_command("two", 5s);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value.stdout_data, "one-out\n");
    EXPECT_EQ(b.value.stdout_data, "two-out\n");
    EXPECT_EQ(transport->channel_count(), 1u);
}

TEST_F(CommandExecutorTest, ElevatedTimeoutKeepsShell) {
    su_then_exec(nullptr, "unused");
    ConnectionManager conn(config(std::string("rootpw")), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());

    // The shell goes quiet after login
    transport->channel(0)->on_write = nullptr;

    auto r = exec.exec_command("sleep 100", 200ms);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_TRUE(conn.is_elevated());
    EXPECT_TRUE(conn.elevation().has_channel());
}

TEST_F(CommandExecutorTest, ClosedElevatedShellFallsBackToExec) {
    su_then_exec(nullptr, "fallback\n");
    ConnectionManager conn(config(std::string("rootpw")), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());

    transport->channel(0)->on_write = [](MockChannelState& c, const std::string&) {
        c.push(ChannelEvent::closed());
    };

    auto r = exec.exec_command("id", 5s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
    EXPECT_FALSE(conn.is_elevated());

    auto next = exec.exec_command("id", 5s);
    ASSERT_TRUE(next.is_ok()) << next.describe();
    EXPECT_EQ(next.value.stdout_data, "fallback\n");
    EXPECT_TRUE(transport->exec_log->contains("id"));
}

TEST_F(CommandExecutorTest, StaleShellOutputDiscarded) {
    su_then_exec([](const std::string&) { return std::string("fresh\r\n"); }, "unused");
    ConnectionManager conn(config(std::string("rootpw")), transport);
    CommandExecutor exec(conn);
    ASSERT_TRUE(conn.connect().is_ok());

    // Leftover noise from an earlier command
    transport->channel(0)->push_stdout("old junk\r\nroot@box:~# ");

    auto r = exec.exec_command("cat x", 5s);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "fresh\n");
}
