#include <gtest/gtest.h>
#include <managers/channel_runner.hpp>
#include "fake_ssh.hpp"
#include <fmt/format.h>
#include <functional>

using namespace std::chrono;

static bool wait_until(const std::function<bool()>& pred, milliseconds timeout = seconds(5)) {
    auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return pred();
}

class ChannelRunnerTest : public ::testing::Test {
protected:
    FakeConnector connector;
    CancelToken root;
    RunnerOptions options;
    ReconnectionConfig reconnection;

    void SetUp() override {
        options.cycle_pause = milliseconds(20);
        options.timing.accept_poll_ms = 20;
        options.timing.alive_check_ms = 50;
        options.timing.session_tick_ms = 20;
        reconnection.initial_delay_secs = 0;
        reconnection.max_delay_secs = 0;
    }

    void TearDown() override {
        root.cancel();
    }

    ChannelSpec base_spec(const std::string& name, ChannelKind kind) {
        ChannelSpec spec;
        spec.name = name;
        spec.host_name = "fake";
        spec.host = "fake.example.com";
        spec.username = "tester";
        spec.auth = AuthConfig::with_password("pw");
        spec.kind = std::move(kind);
        return spec;
    }

    std::unique_ptr<ChannelRunner> make_runner(ChannelSpec spec) {
        return std::make_unique<ChannelRunner>(std::move(spec), reconnection, connector,
                                               root.child(), options);
    }
};

TEST_F(ChannelRunnerTest, LocalForwardRelaysThroughSession) {
    EchoServer echo;
    int listen_port = free_port();
    ASSERT_GT(listen_port, 0);

    auto runner = make_runner(base_spec("web",
        LocalForward{"127.0.0.1", listen_port, "127.0.0.1", echo.port()}));
    runner->start();

    auto first = runner->wait_first_attempt(seconds(5));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->is_ok()) << first->error;
    EXPECT_EQ(runner->state().phase, RunnerPhase::ChannelActive);
    EXPECT_EQ(runner->state().endpoint, fmt::format("127.0.0.1:{}", listen_port));

    auto client = platform::tcp_connect("127.0.0.1", listen_port, 2000);
    ASSERT_TRUE(client.is_ok()) << client.error;
    ASSERT_TRUE(platform::write_all(client.value, "hello through the tunnel").is_ok());
    EXPECT_EQ(read_exactly(client.value, 24), "hello through the tunnel");
    platform::close_socket(client.value);

    ASSERT_TRUE(runner->stop().is_ok());
    EXPECT_EQ(runner->state().phase, RunnerPhase::Stopped);
}

TEST_F(ChannelRunnerTest, OpenRelayOutlivesStop) {
    EchoServer echo;
    int listen_port = free_port();
    auto runner = make_runner(base_spec("web",
        LocalForward{"127.0.0.1", listen_port, "127.0.0.1", echo.port()}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    auto client = platform::tcp_connect("127.0.0.1", listen_port, 2000);
    ASSERT_TRUE(client.is_ok()) << client.error;
    ASSERT_TRUE(platform::write_all(client.value, "before").is_ok());
    EXPECT_EQ(read_exactly(client.value, 6), "before");

    ASSERT_TRUE(runner->stop().is_ok());
    EXPECT_EQ(connector.state->disconnects(), 1);

    // No new connections, but the one in flight keeps relaying
    EXPECT_TRUE(platform::tcp_connect("127.0.0.1", listen_port, 500).is_err());
    ASSERT_TRUE(platform::write_all(client.value, "after").is_ok());
    EXPECT_EQ(read_exactly(client.value, 5), "after");
    platform::close_socket(client.value);
}

TEST_F(ChannelRunnerTest, FailedRelayLeavesChannelRunning) {
    EchoServer echo;
    int listen_port = free_port();
    auto runner = make_runner(base_spec("web",
        LocalForward{"127.0.0.1", listen_port, "127.0.0.1", echo.port()}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    auto steady = platform::tcp_connect("127.0.0.1", listen_port, 2000);
    ASSERT_TRUE(steady.is_ok()) << steady.error;
    ASSERT_TRUE(platform::write_all(steady.value, "steady").is_ok());
    EXPECT_EQ(read_exactly(steady.value, 6), "steady");

    // Reset one connection so its relay fails on a read error
    auto doomed = platform::tcp_connect("127.0.0.1", listen_port, 2000);
    ASSERT_TRUE(doomed.is_ok()) << doomed.error;
    ASSERT_TRUE(platform::write_all(doomed.value, "first").is_ok());
    EXPECT_EQ(read_exactly(doomed.value, 5), "first");
    struct linger abort_close{1, 0};
    setsockopt(doomed.value, SOL_SOCKET, SO_LINGER, &abort_close, sizeof(abort_close));
    platform::close_socket(doomed.value);
    std::this_thread::sleep_for(milliseconds(200));

    auto st = runner->state();
    EXPECT_EQ(st.phase, RunnerPhase::ChannelActive);
    EXPECT_EQ(st.failed_attempts, 0);
    EXPECT_EQ(connector.state->connects(), 1);

    ASSERT_TRUE(platform::write_all(steady.value, "still here").is_ok());
    EXPECT_EQ(read_exactly(steady.value, 10), "still here");

    auto again = platform::tcp_connect("127.0.0.1", listen_port, 2000);
    ASSERT_TRUE(again.is_ok()) << again.error;
    ASSERT_TRUE(platform::write_all(again.value, "again").is_ok());
    EXPECT_EQ(read_exactly(again.value, 5), "again");

    platform::close_socket(again.value);
    platform::close_socket(steady.value);
}

TEST_F(ChannelRunnerTest, FreshBudgetEachCycleEventuallyConnects) {
    reconnection.max_retries = 2;
    reconnection.use_exponential_backoff = true;
    connector.state->fail_first_connects = 3;

    EchoServer echo;
    int listen_port = free_port();
    auto runner = make_runner(base_spec("flaky",
        LocalForward{"127.0.0.1", listen_port, "127.0.0.1", echo.port()}));
    runner->start();

    // The first attempt fails and is reported as such
    auto first = runner->wait_first_attempt(seconds(5));
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->is_err());
    EXPECT_EQ(first->kind, ErrorKind::Connection);

    // Three failures spend the first cycle; the next cycle succeeds
    ASSERT_TRUE(wait_until([&] { return runner->state().phase == RunnerPhase::ChannelActive; }));
    auto st = runner->state();
    EXPECT_EQ(st.failed_attempts, 3);
    EXPECT_GE(st.cycles, 2);
    EXPECT_EQ(connector.state->connects(), 4);
    EXPECT_EQ(st.last_error_kind, ErrorKind::Connection);
}

TEST_F(ChannelRunnerTest, UnlimitedRetriesStayInOneCycle) {
    reconnection.max_retries = 0;
    connector.state->fail_first_connects = 5;

    EchoServer echo;
    auto runner = make_runner(base_spec("patient",
        LocalForward{"127.0.0.1", free_port(), "127.0.0.1", echo.port()}));
    runner->start();

    ASSERT_TRUE(wait_until([&] { return runner->state().phase == RunnerPhase::ChannelActive; }));
    EXPECT_EQ(runner->state().cycles, 1);
    EXPECT_EQ(runner->state().failed_attempts, 5);
}

TEST_F(ChannelRunnerTest, RemoteForwardReportsGrantedPort) {
    connector.state->granted_port = 43210;
    EchoServer echo;

    auto runner = make_runner(base_spec("callback",
        RemoteForward{8022, "127.0.0.1", echo.port()}));
    runner->start();

    auto first = runner->wait_first_attempt(seconds(5));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->is_ok()) << first->error;

    auto st = runner->state();
    ASSERT_TRUE(st.granted_port.has_value());
    EXPECT_EQ(*st.granted_port, 43210);
    EXPECT_NE(st.endpoint.find("43210"), std::string::npos);
    EXPECT_EQ(st.endpoint.find("8022"), std::string::npos);

    std::lock_guard<std::mutex> l(connector.state->mutex);
    ASSERT_EQ(connector.state->remote_forward_requests.size(), 1u);
    EXPECT_EQ(connector.state->remote_forward_requests[0], 8022);
}

TEST_F(ChannelRunnerTest, RemoteForwardReportsGrantedZero) {
    connector.state->granted_port = 0;
    EchoServer echo;

    auto runner = make_runner(base_spec("callback",
        RemoteForward{8022, "127.0.0.1", echo.port()}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    auto st = runner->state();
    ASSERT_TRUE(st.granted_port.has_value());
    EXPECT_EQ(*st.granted_port, 0);
    EXPECT_EQ(st.endpoint, fmt::format("remote 0 -> 127.0.0.1:{}", echo.port()));
    EXPECT_EQ(st.endpoint.find("8022"), std::string::npos);
}

TEST_F(ChannelRunnerTest, RemoteForwardRelaysToLocalService) {
    EchoServer echo;
    auto runner = make_runner(base_spec("callback",
        RemoteForward{9000, "127.0.0.1", echo.port()}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    socket_t remote_peer = connector.state->inject_forwarded();
    ASSERT_TRUE(platform::write_all(remote_peer, "from the far side").is_ok());
    EXPECT_EQ(read_exactly(remote_peer, 17), "from the far side");
    platform::close_socket(remote_peer);
}

TEST_F(ChannelRunnerTest, RemoteForwardRefusedIsRetried) {
    connector.state->fail_remote_forward = true;
    auto runner = make_runner(base_spec("callback", RemoteForward{9000, "127.0.0.1", 1}));
    runner->start();

    auto first = runner->wait_first_attempt(seconds(5));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, ErrorKind::Channel);
    ASSERT_TRUE(wait_until([&] { return runner->state().failed_attempts >= 3; }));
}

TEST_F(ChannelRunnerTest, SessionRunsCommandAndRestartsWhenClosed) {
    auto runner = make_runner(base_spec("uptime", Session{std::string("uptime")}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());
    EXPECT_EQ(runner->state().endpoint, "exec: uptime");

    {
        std::lock_guard<std::mutex> l(connector.state->mutex);
        ASSERT_EQ(connector.state->exec_commands.size(), 1u);
        EXPECT_EQ(connector.state->exec_commands[0], "uptime");
    }

    // Remote prints and exits: the channel closes and a new cycle runs it again
    auto peer = connector.state->last_session_peer();
    ASSERT_TRUE(peer.has_value());
    ASSERT_TRUE(platform::write_all(*peer, " 10:00:00 up 3 days\n").is_ok());
    platform::close_socket(*peer);

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> l(connector.state->mutex);
        return connector.state->exec_commands.size() >= 2;
    }));
    EXPECT_GE(runner->state().cycles, 2);
    EXPECT_EQ(runner->state().failed_attempts, 0);
}

TEST_F(ChannelRunnerTest, SessionWithoutCommandRequestsPty) {
    auto runner = make_runner(base_spec("shell", Session{}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    std::lock_guard<std::mutex> l(connector.state->mutex);
    EXPECT_EQ(connector.state->pty_requests, 1);
    EXPECT_TRUE(connector.state->exec_commands.empty());
}

TEST_F(ChannelRunnerTest, AuthFailureIsReported) {
    connector.state->fail_auth = true;
    auto runner = make_runner(base_spec("locked", Session{}));
    runner->start();

    auto first = runner->wait_first_attempt(seconds(5));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->is_err());
    EXPECT_EQ(first->kind, ErrorKind::Authentication);
    ASSERT_TRUE(wait_until([&] { return runner->state().last_error_kind == ErrorKind::Authentication; }));
}

TEST_F(ChannelRunnerTest, LostSessionCountsAsFailure) {
    EchoServer echo;
    auto runner = make_runner(base_spec("web",
        LocalForward{"127.0.0.1", free_port(), "127.0.0.1", echo.port()}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    connector.state->sessions_alive.store(false);
    ASSERT_TRUE(wait_until([&] { return runner->state().failed_attempts >= 1; }));
    EXPECT_NE(runner->state().last_error.find("lost"), std::string::npos);

    // Once the transport is back the channel comes up again
    connector.state->sessions_alive.store(true);
    ASSERT_TRUE(wait_until([&] { return runner->state().phase == RunnerPhase::ChannelActive; }));
}

TEST_F(ChannelRunnerTest, ListenerFailureEndsAttemptAndRebinds) {
    EchoServer echo;
    int listen_port = free_port();
    auto runner = make_runner(base_spec("web",
        LocalForward{"127.0.0.1", listen_port, "127.0.0.1", echo.port()}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    socket_t listener = find_listener(listen_port);
    ASSERT_GE(listener, 0);
    shutdown(listener, SHUT_RDWR);

    ASSERT_TRUE(wait_until([&] { return runner->state().failed_attempts >= 1; }));
    EXPECT_EQ(runner->state().last_error_kind, ErrorKind::Channel);
    EXPECT_NE(runner->state().last_error.find("listener"), std::string::npos);

    // The next attempt binds a fresh listener that forwards again
    ASSERT_TRUE(wait_until([&] {
        return connector.state->connects() >= 2 &&
               runner->state().phase == RunnerPhase::ChannelActive;
    }));
    auto client = platform::tcp_connect("127.0.0.1", listen_port, 2000);
    ASSERT_TRUE(client.is_ok()) << client.error;
    ASSERT_TRUE(platform::write_all(client.value, "rebound").is_ok());
    EXPECT_EQ(read_exactly(client.value, 7), "rebound");
    platform::close_socket(client.value);
}

TEST_F(ChannelRunnerTest, StopInterruptsBackoff) {
    reconnection.initial_delay_secs = 60;
    reconnection.max_delay_secs = 60;
    connector.state->unreachable_hosts.insert("fake.example.com");

    auto runner = make_runner(base_spec("down", Session{}));
    runner->start();
    ASSERT_TRUE(wait_until([&] { return runner->state().phase == RunnerPhase::BackoffWait; }));

    auto begin = steady_clock::now();
    ASSERT_TRUE(runner->stop().is_ok());
    EXPECT_LT(steady_clock::now() - begin, seconds(2));
    EXPECT_EQ(runner->state().phase, RunnerPhase::Stopped);
    EXPECT_EQ(runner->state().failed_attempts, 1);
}

TEST_F(ChannelRunnerTest, ParentCancelStopsRunner) {
    auto runner = make_runner(base_spec("shell", Session{}));
    runner->start();
    ASSERT_TRUE(runner->wait_first_attempt(seconds(5)).value_or(Result<void>::Err("timeout")).is_ok());

    root.cancel();
    ASSERT_TRUE(runner->join().is_ok());
    EXPECT_EQ(runner->state().phase, RunnerPhase::Stopped);
}

TEST_F(ChannelRunnerTest, NoFirstAttemptBeforeStart) {
    auto runner = make_runner(base_spec("never", Session{}));
    EXPECT_FALSE(runner->wait_first_attempt(milliseconds(20)).has_value());
}

TEST(RunnerPhase, Names) {
    EXPECT_STREQ(runner_phase_name(RunnerPhase::Idle), "idle");
    EXPECT_STREQ(runner_phase_name(RunnerPhase::ChannelActive), "active");
    EXPECT_STREQ(runner_phase_name(RunnerPhase::BackoffWait), "backoff");
}
