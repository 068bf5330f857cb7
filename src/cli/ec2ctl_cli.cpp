#include "ec2ctl_cli.hpp"
#include "instance_table.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/config.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

Ec2ctlCLI* Ec2ctlCLI::active_ = nullptr;

Ec2ctlCLI::Ec2ctlCLI() : BaseCLI() {
    register_all_commands();
}

Ec2ctlCLI::~Ec2ctlCLI() {
    stop_monitor();
}

void Ec2ctlCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quitting_ = true;
    }, "Exit ec2ctl");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quitting_ = true;
    }, "Exit ec2ctl");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_fleet_commands(*this);
    register_instance_commands(*this);
}

// ── Session ──────────────────────────────────────────────────

bool Ec2ctlCLI::start_session(bool quiet) {
    auto issues = run_preflight_checks();
    bool blocking = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            if (!quiet) {
                std::cout << theme::info(issue.message);
                std::cout << theme::step(issue.fix);
            }
            continue;
        }
        blocking = true;
        std::cout << theme::fail(issue.message);
        std::cout << theme::step(issue.fix);
    }
    if (blocking) return false;

    auto callback = [quiet](const std::string& msg) {
        if (!quiet) std::cout << theme::dim("    " + msg) << "\n";
    };

    auto result = fleet->init(callback);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        if (result.kind == ErrorKind::Auth) {
            std::cout << theme::step("Check 'aws sts get-caller-identity' for the configured profile.");
        }
        return false;
    }
    return true;
}

void Ec2ctlCLI::end_session() {
    stop_monitor();
    if (fleet) fleet->teardown();
}

void Ec2ctlCLI::run_repl() {
    std::cout << theme::banner();
    std::cout << theme::section("Starting");

    if (!start_session(false)) {
        std::cout << "\n";
        return;
    }

    const auto& cfg = fleet->config();
    std::cout << theme::section("Ready");
    std::cout << theme::kv("Profile", cfg.aws().profile.empty() ? "default" : cfg.aws().profile);
    std::cout << theme::kv("Refresh", cfg.refresh().auto_refresh
                                          ? fmt::format("every {}s", cfg.refresh().interval_secs)
                                          : std::string("manual"));
    std::cout << theme::kv("Log", ec2ctl_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    start_monitor();

    // Readline only ever runs on this thread. Monitor output arrives through
    // the wake pipe and is printed here, between keystrokes.
    active_ = this;
    install_prompt();
    while (!quitting_ && !input_closed_) {
        struct pollfd fds[2] = {
            {STDIN_FILENO, POLLIN, 0},
            {events_.read_fd(), POLLIN, 0},
        };
        int nfds = events_.valid() ? 2 : 1;
        int ret = poll(fds, nfds, events_.valid() ? -1 : 500);
        if (ret < 0) {
            if (errno == EINTR) continue;
            ec2ctl_log(std::string("repl: poll failed: ") + std::strerror(errno));
            break;
        }

        if (!events_.valid() || (fds[1].revents & POLLIN)) {
            flush_events();
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            rl_callback_read_char();
        }
    }
    rl_callback_handler_remove();
    active_ = nullptr;

    std::cout << theme::dim("    Saving cache...") << "\n";
    end_session();
}

void Ec2ctlCLI::install_prompt() {
    std::string prompt = get_prompt_string();
    rl_callback_handler_install(prompt.c_str(), &Ec2ctlCLI::on_readline_line);
}

void Ec2ctlCLI::on_readline_line(char* raw) {
    if (active_) active_->handle_line(raw);
}

void Ec2ctlCLI::handle_line(char* raw) {
    // Commands print freely; the prompt comes back once they finish
    rl_callback_handler_remove();

    if (!raw) {
        input_closed_ = true;   // EOF / Ctrl-D
        std::cout << "\n";
        return;
    }

    std::string line = raw;
    free(raw);

    if (!line.empty()) {
        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    if (!quitting_) install_prompt();
}

// Print queued monitor output above the prompt without clobbering the line
// being edited.
void Ec2ctlCLI::flush_events() {
    auto texts = events_.drain();
    if (texts.empty()) return;

    int saved_point = rl_point;
    char* saved_line = rl_copy_text(0, rl_end);
    rl_save_prompt();
    rl_replace_line("", 0);
    rl_redisplay();

    std::cout << "\r\033[K";
    for (const auto& text : texts) std::cout << text;
    std::cout << std::flush;

    rl_restore_prompt();
    rl_replace_line(saved_line, 0);
    rl_point = saved_point;
    rl_forced_update_display();
    free(saved_line);
}

int Ec2ctlCLI::run_list(const std::vector<std::string>& args) {
    if (!start_session(true)) return 1;

    auto report = fleet->refresh_now();
    if (report.aborted) {
        std::cout << theme::fail("Refresh failed: " + report.abort_error);
    }
    for (const auto& r : report.regions) {
        if (!r.ok) std::cout << theme::warn(fmt::format("{} unavailable: {}", r.region, r.error));
    }

    std::string joined;
    for (const auto& a : args) joined += a + " ";
    execute_command("list", joined);

    end_session();
    return report.aborted ? 1 : 0;
}

void Ec2ctlCLI::run_setup() {
    std::cout << theme::banner();
    std::cout << theme::section("Setup");

    bool existed = config_exists();
    auto result = create_default_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return;
    }
    if (existed) {
        std::cout << theme::info("Config already present at " + get_config_path().string());
    } else {
        std::cout << theme::ok("Wrote " + get_config_path().string());
    }

    auto cfg = Config::load();
    if (cfg.is_err()) {
        std::cout << theme::fail(cfg.error);
        return;
    }
    auto issues = check_aws_cli(cfg.value.aws());
    for (const auto& issue : issues) {
        std::cout << theme::fail(issue.message);
        std::cout << theme::step(issue.fix);
    }
    if (issues.empty()) {
        std::cout << theme::ok("aws CLI found");
    }

    std::cout << theme::divider();
    std::cout << theme::step("Credentials come from the aws CLI (env, ~/.aws, SSO).");
    std::cout << theme::step("Run 'ec2ctl' to start.");
    std::cout << "\n";
}

// ── Event monitor ────────────────────────────────────────────

void Ec2ctlCLI::start_monitor() {
    if (monitor_running_) return;
    monitor_running_ = true;
    monitor_thread_ = std::thread(&Ec2ctlCLI::monitor_loop, this);
}

void Ec2ctlCLI::stop_monitor() {
    monitor_running_ = false;
    if (monitor_thread_.joinable()) monitor_thread_.join();
}

void Ec2ctlCLI::monitor_loop() {
    auto cursor = fleet->feed().cursor(fleet->feed().last_seq() + 1);
    while (monitor_running_) {
        auto event = cursor.wait_next(std::chrono::milliseconds(500));
        if (!event) continue;
        std::string text = describe_event(*event);
        if (!text.empty()) events_.post(std::move(text));
    }
}

std::string Ec2ctlCLI::describe_event(const CacheEvent& e) {
    switch (e.kind) {
        case CacheEventKind::RegionFailed:
            return theme::warn(fmt::format("{} unavailable: {}", e.region, e.detail));
        case CacheEventKind::OverlayConfirmed:
            return theme::ok(fmt::format("{} ({}) is {}", e.instance_id, e.region, e.detail));
        case CacheEventKind::OverlayDiscarded:
            return theme::info(fmt::format("{} ({}): {}", e.instance_id, e.region, e.detail));
        case CacheEventKind::InstanceEvicted:
            return theme::info(fmt::format("{} ({}) is gone", e.instance_id, e.region));
        case CacheEventKind::InstanceAdded:
            // The first scan adds everything; only later arrivals are news
            if (!first_scan_done_) return "";
            return theme::info(fmt::format("new instance {} in {}", e.instance_id, e.region));
        case CacheEventKind::ScanCompleted: {
            first_scan_done_ = true;
            std::string halt = fleet->halt_reason();
            if (!halt.empty()) {
                return theme::fail("Refresh halted: " + halt) +
                       theme::step("Fix credentials, then 'auto on'.");
            }
            return "";
        }
        default:
            return "";
    }
}
