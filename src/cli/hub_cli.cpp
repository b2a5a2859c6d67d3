#include "hub_cli.hpp"
#include "theme.hpp"
#include <core/channel_spec.hpp>
#include <core/constants.hpp>
#include <core/ssh_config.hpp>
#include <core/utils.hpp>
#include <daemon/control_client.hpp>
#include <daemon/control_server.hpp>
#include <daemon/run_files.hpp>
#include <managers/channel_service.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <platform/singleton.hpp>
#include <platform/socket_util.hpp>
#include <ssh/libssh2_client.hpp>
#include <fmt/format.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_signal = 0;

void on_shutdown_signal(int sig) {
    g_shutdown_signal = sig;
}

void install_signal_handlers() {
    std::signal(SIGINT, on_shutdown_signal);
    std::signal(SIGTERM, on_shutdown_signal);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

fs::path absolute_path(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

Result<AppConfig> load_config(const fs::path& path) {
    auto config = AppConfig::load(path);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        std::cout << theme::step("Pass a config with --config <path>, or create " +
                                 std::string(CONFIG_FILE_NAME));
    }
    return config;
}

void print_channel_list(const AppConfig& config) {
    if (config.channels().empty()) {
        std::cout << theme::info("No channels configured");
        return;
    }
    for (const auto& ch : config.channels()) {
        std::cout << theme::kv(ch.name, describe_channel(ch));
    }
}

} // namespace

// ── Command line ─────────────────────────────────────────────

Result<CommandLine> parse_command_line(const std::vector<std::string>& argv) {
    CommandLine cl;

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string& a = argv[i];

        // Flags with a value, anywhere on the line
        if (a == "-c" || a == "--config" || a == "--log") {
            if (i + 1 >= argv.size()) {
                return Result<CommandLine>::Err(ErrorKind::Config, "Missing value for " + a);
            }
            const std::string& v = argv[++i];
            if (a == "--log") {
                cl.options.log_path = v;
            } else {
                cl.options.config_path = v;
            }
            continue;
        }
        if (a == "-d" || a == "--debug") {
            cl.options.debug = true;
            continue;
        }

        if (!cl.command.empty()) {
            cl.args.push_back(a);
        } else if (a == "--version") {
            cl.version = true;
            return Result<CommandLine>::Ok(std::move(cl));
        } else if (a == "--help" || a == "-h") {
            cl.help = true;
            return Result<CommandLine>::Ok(std::move(cl));
        } else if (!a.empty() && a[0] == '-') {
            return Result<CommandLine>::Err(ErrorKind::Config, "Unknown option: " + a);
        } else {
            cl.command = a;
        }
    }
    return Result<CommandLine>::Ok(std::move(cl));
}

std::string describe_channel(const ChannelConfig& ch) {
    auto side = [](const std::optional<int>& p) {
        return p ? std::to_string(*p) : std::string("?");
    };

    if (ch.channel_type == "direct-tcpip") {
        return fmt::format("listen {} -> {}:{} (host: {})",
                           side(ch.ports.first), ch.dest_host, side(ch.ports.second), ch.hostname);
    }
    if (ch.channel_type == "forwarded-tcpip") {
        return fmt::format("remote {} -> local {}:{} (host: {})",
                           side(ch.ports.second), ch.dest_host, side(ch.ports.first), ch.hostname);
    }
    if (ch.channel_type == "session") {
        return fmt::format("session{} (host: {})",
                           ch.command ? ": " + *ch.command : std::string(), ch.hostname);
    }
    return fmt::format("{} (host: {})", ch.channel_type, ch.hostname);
}

HubCLI::HubCLI(CliOptions options) : options_(std::move(options)) {
    config_path_ = absolute_path(options_.config_path.empty() ? AppConfig::default_path()
                                                              : options_.config_path);
}

void HubCLI::init_logging(bool echo_stderr) {
    LogOptions opts;
    opts.path = options_.log_path.empty() ? (run_dir(config_path_) / LOG_FILE_NAME).string()
                                          : options_.log_path;
    opts.min_level = options_.debug ? LogLevel::Debug : LogLevel::Info;
    opts.echo_stderr = echo_stderr;
    log_init(opts);
}

bool HubCLI::daemon_running() const {
    return ControlClient(RunFiles(config_path_)).query_status().is_ok();
}

void HubCLI::stop_daemon() {
    RunFiles files(config_path_);
    if (fs::exists(files.port_path())) {
        auto r = ControlClient(files).send_stop();
        if (r.is_ok()) {
            std::cout << theme::ok("Stop signal sent");
            platform::sleep_ms(STOP_SETTLE_MS);
        } else {
            std::cout << theme::warn("Daemon did not answer: " + r.error);
        }
    } else {
        std::cout << theme::info("Service is not running");
    }
    // Stale files must not outlive a dead daemon
    files.remove();
}

// ── start ─────────────────────────────────────────────────────

int HubCLI::run_start(bool daemon) {
    if (daemon) return spawn_daemon();
    return run_foreground();
}

int HubCLI::spawn_daemon() {
    auto config = load_config(config_path_);
    if (config.is_err()) return 1;

    if (daemon_running()) {
        std::cout << theme::info("Service is already running for " + config_path_.string());
        return 0;
    }

    fs::path exe = platform::executable_path();
    if (exe.empty()) exe = absolute_path(options_.argv0);

    std::vector<std::string> args = {"--config", config_path_.string()};
    if (options_.debug) args.push_back("--debug");
    if (!options_.log_path.empty()) {
        args.push_back("--log");
        args.push_back(options_.log_path);
    }
    args.push_back("start");

    auto pid = platform::spawn_detached(exe.string(), args);
    if (pid.is_err()) {
        std::cout << theme::fail("Failed to spawn daemon: " + pid.error);
        return 1;
    }

    platform::sleep_ms(DAEMON_SPAWN_WAIT_MS);
    std::cout << theme::ok(fmt::format("Service started in daemon mode (pid {})", pid.value));
    std::cout << theme::step("Use 'chanhub status' to check, 'chanhub stop' to stop");
    return 0;
}

int HubCLI::run_foreground() {
    auto config = load_config(config_path_);
    if (config.is_err()) return 1;

    init_logging(true);
    install_signal_handlers();

    SingletonLock lock((run_dir(config_path_) / LOCK_FILE_NAME).string());
    if (!lock.held()) {
        auto holder = lock.holder_pid();
        std::cout << theme::fail(fmt::format("Another chanhub instance{} is serving {}",
            holder ? fmt::format(" (pid {})", *holder) : std::string(), config_path_.string()));
        return 1;
    }

    ServiceContext ctx;
    ctx.config = config.value;
    ctx.config_path = config_path_;
    ctx.connector = std::make_shared<Libssh2Connector>();

    // Turn signals into cancellation, including while start() is waiting
    std::atomic<bool> finished{false};
    std::thread signal_watch([&]() {
        while (!finished.load() && !ctx.root.is_cancelled()) {
            if (g_shutdown_signal) {
                log_info(fmt::format("Received signal {}, shutting down", static_cast<int>(g_shutdown_signal)));
                ctx.root.cancel();
                break;
            }
            platform::sleep_ms(100);
        }
    });

    auto finish = [&](int code) {
        finished.store(true);
        if (signal_watch.joinable()) signal_watch.join();
        return code;
    };

    ChannelService service(ctx);
    auto started = service.start();
    if (started.is_err()) {
        std::cout << theme::fail(started.describe());
        return finish(1);
    }

    for (const auto& name : started.value.started) {
        std::cout << theme::ok(name);
    }
    if (!started.value.failed.empty()) {
        for (const auto& f : started.value.failed) {
            std::cout << theme::fail(fmt::format("{}: {}", f.channel, f.error));
        }
        std::cout << theme::warn(fmt::format("{} channel(s) failed to start, retrying in background",
                                             started.value.failed.size()));
    }

    ControlServer server(RunFiles(config_path_), [&service] { return service.status(); }, ctx.root);
    auto listening = server.start();
    if (listening.is_err()) {
        std::cout << theme::fail(listening.describe());
        auto s = service.stop();
        if (s.is_err()) log_warn(s.error);
        return finish(1);
    }

    auto snap = service.status();
    std::cout << theme::ok(fmt::format("chanhub running: {}/{} channel(s) active",
                                       snap.active_channels, snap.total_channels));

    while (!ctx.root.wait_for(std::chrono::milliseconds(500))) {}

    server.stop();
    auto s = service.stop();
    if (s.is_err()) log_warn(s.error);
    std::cout << theme::ok("chanhub stopped");
    return finish(0);
}

// ── stop / restart ────────────────────────────────────────────

int HubCLI::run_stop() {
    stop_daemon();
    return 0;
}

int HubCLI::run_restart() {
    if (daemon_running()) {
        stop_daemon();
    } else {
        RunFiles(config_path_).remove();
    }
    return spawn_daemon();
}

// ── status ────────────────────────────────────────────────────

int HubCLI::run_status() {
    RunFiles files(config_path_);
    auto live = ControlClient(files).query_status();

    ServiceSnapshot snap;
    std::string pid = "-";
    AppConfig config;

    auto loaded = AppConfig::load(config_path_);
    if (loaded.is_ok()) config = loaded.value;

    if (live.is_ok()) {
        snap = live.value;
        auto p = files.read_pid();
        if (p.is_ok()) pid = std::to_string(p.value);
    } else {
        snap.total_channels = static_cast<int>(config.channels().size());
    }

    std::cout << theme::section("Service");
    std::cout << theme::kv("state", theme::state_word(service_state_wire_name(snap.state.kind)));
    std::cout << theme::kv("channels", fmt::format("{}/{} active", snap.active_channels, snap.total_channels));
    std::cout << theme::kv("config", config_path_.string());
    std::cout << theme::kv("pid", pid);

    std::cout << theme::section("Channels");
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
    } else {
        print_channel_list(config);
    }
    std::cout << "\n";
    return 0;
}

// ── validate ──────────────────────────────────────────────────

int HubCLI::run_validate(const std::string& path_arg) {
    fs::path path = path_arg.empty() ? config_path_ : absolute_path(path_arg);
    auto config = load_config(path);
    if (config.is_err()) return 1;

    std::cout << theme::ok("Configuration parsed: " + path.string());

    std::cout << theme::section("Hosts");
    for (const auto& h : config.value.hosts()) {
        std::string auth = h.auth.type == AuthConfig::Type::Key ? "key " + h.auth.key_path : "password";
        std::cout << theme::kv(h.name, fmt::format("{}@{}:{} ({})", h.username, h.host, h.port, auth));
        if (h.auth.type == AuthConfig::Type::Password && h.auth.password == PASSWORD_PLACEHOLDER) {
            std::cout << theme::warn(fmt::format("{}: password is still the {} placeholder",
                                                 h.name, PASSWORD_PLACEHOLDER));
        }
    }

    std::cout << theme::section("Channels");
    print_channel_list(config.value);

    auto resolution = resolve_channels(config.value);
    std::cout << "\n";
    if (!resolution.failures.empty()) {
        for (const auto& f : resolution.failures) {
            std::cout << theme::fail(f.error);
        }
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} channel(s) valid", resolution.specs.size()));
    return 0;
}

// ── generate ──────────────────────────────────────────────────

int HubCLI::run_generate(const std::string& ssh_config_arg, const std::string& output_arg) {
    fs::path source = ssh_config_arg.empty() ? default_ssh_config_path() : fs::path(ssh_config_arg);
    fs::path output = output_arg.empty() ? fs::current_path() / CONFIG_FILE_NAME : fs::path(output_arg);

    auto entries = parse_ssh_config_file(source);
    if (entries.is_err()) {
        std::cout << theme::fail(entries.error);
        return 1;
    }
    if (entries.value.empty()) {
        std::cout << theme::warn("No usable Host entries in " + source.string());
        return 0;
    }

    AppConfig config = config_from_ssh_entries(entries.value);
    auto saved = config.save(output);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return 1;
    }

    std::cout << theme::ok("Configuration generated: " + output.string());
    std::cout << theme::info(fmt::format("{} host(s)", config.hosts().size()));
    int placeholders = 0;
    for (const auto& h : config.hosts()) {
        std::cout << theme::step(fmt::format("{} ({})", h.name, h.host));
        if (h.auth.type == AuthConfig::Type::Password) placeholders++;
    }
    if (placeholders > 0) {
        std::cout << theme::warn(fmt::format(
            "{} host(s) use password auth with placeholder '{}', edit them before starting",
            placeholders, PASSWORD_PLACEHOLDER));
    }
    std::cout << theme::info("Add a channels: section to define the tunnels");
    return 0;
}

// ── test ──────────────────────────────────────────────────────

int HubCLI::run_test() {
    auto config = load_config(config_path_);
    if (config.is_err()) return 1;

    std::cout << theme::section("Local forwards");
    int tested = 0;
    int failed = 0;
    for (const auto& ch : config.value.channels()) {
        if (ch.channel_type != "direct-tcpip") {
            std::cout << theme::info(fmt::format("{}: {} skipped", ch.name, ch.channel_type));
            continue;
        }
        if (!ch.ports.first) {
            std::cout << theme::fail(fmt::format("{}: no listen port configured", ch.name));
            failed++;
            continue;
        }

        tested++;
        int port = *ch.ports.first;
        auto conn = platform::tcp_connect(DEFAULT_LOOPBACK, port, PORT_TEST_TIMEOUT_MS);
        if (conn.is_ok()) {
            platform::close_socket(conn.value);
            std::cout << theme::ok(fmt::format("{}: 127.0.0.1:{} accepting", ch.name, port));
        } else {
            std::cout << theme::fail(fmt::format("{}: 127.0.0.1:{} {}", ch.name, port, conn.error));
            failed++;
        }
    }

    std::cout << "\n";
    if (failed > 0) {
        std::cout << theme::fail(fmt::format("{} of {} check(s) failed", failed, tested));
        std::cout << theme::step("Is the service running? Try 'chanhub status'");
        std::cout << theme::step("Check the log at " +
            (options_.log_path.empty() ? (run_dir(config_path_) / LOG_FILE_NAME).string()
                                       : options_.log_path));
        std::cout << theme::step("Run 'chanhub --debug start' in the foreground to watch connection attempts");
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} local forward(s) reachable", tested));
    return 0;
}
