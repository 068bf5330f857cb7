#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <platform/wake_queue.hpp>

// Forward declarations for command registration
void register_fleet_commands(BaseCLI& cli);
void register_instance_commands(BaseCLI& cli);

class Ec2ctlCLI : public BaseCLI {
public:
    Ec2ctlCLI();
    ~Ec2ctlCLI() override;

    void run_repl();
    void run_setup();

    // One-shot: refresh once and print the table. Returns the exit code.
    int run_list(const std::vector<std::string>& args);

private:
    void register_all_commands();
    bool start_session(bool quiet);
    void end_session();

    // ── Line input (readline callback mode, main thread only) ──
    static void on_readline_line(char* raw);
    void handle_line(char* raw);
    void install_prompt();
    void flush_events();

    static Ec2ctlCLI* active_;
    bool input_closed_ = false;

    // ── Event monitor (background thread) ──────────────────────
    // Pulls change-feed events through a cursor and queues the ones worth
    // interrupting the prompt for (failures, confirmations, evictions).
    // The main thread prints them between keystrokes.
    void start_monitor();
    void stop_monitor();
    void monitor_loop();
    std::string describe_event(const CacheEvent& event);

    platform::WakeQueue events_;
    std::thread monitor_thread_;
    std::atomic<bool> monitor_running_{false};
    bool first_scan_done_ = false;      // monitor thread only
    bool quitting_ = false;
};
