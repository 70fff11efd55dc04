// ─────────────────────────────────────────────────────────────────────────────
// kvmpp-cli - KVM device command-line tool
// ─────────────────────────────────────────────────────────────────────────────
// Talks to a kvmd endpoint through the pooled, TOTP-aware session layer.
//
// Usage:
//   kvmpp-cli --host pikvm.local --user admin --password admin --info
//   kvmpp-cli --host pikvm.local --user admin --secret JBSWY3DPEHPK3PXP --atx-power on
//   kvmpp-cli --host 10.0.0.5 --http --user admin --gpio-switch relay1=1
//
//   # Credentials from the environment
//   export KVMPP_PASSWORD=admin KVMPP_TOTP_SECRET=JBSWY3DPEHPK3PXP
//   kvmpp-cli --host pikvm.local --user admin --msd-state --json
//
//   # Debug logging to a file
//   kvmpp-cli --host pikvm.local --info --log-level debug --log-file kvmpp.log

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "kvmpp/device/device_api.hpp"
#include "kvmpp/log/spdlog_logger.hpp"
#include "kvmpp/session/session_context.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kvmpp;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j, bool compact = false) {
    if (compact) {
        std::cout << j.dump() << "\n";
    } else {
        std::cout << j.dump(2) << "\n";
    }
}

// Shared tail of every command: report the error, or show the result.
int report(const DeviceResult<Json>& result, const std::string& title, bool json_output) {
    if (!result) {
        print_error(result.error().describe());
        return 1;
    }
    if (json_output) {
        print_json(*result, true);
        return 0;
    }
    print_header(title);
    print_json(*result);
    return 0;
}

int report_text(const DeviceResult<std::string>& result, bool json_output) {
    if (!result) {
        print_error(result.error().describe());
        return 1;
    }
    if (json_output) {
        print_json(Json(*result), true);
    } else {
        std::cout << *result;
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_totp(TotpCache& totp, const std::string& secret, bool json_output) {
    auto code = totp.get_code(secret);
    if (!code) {
        print_error(code.error().describe());
        return 1;
    }
    const auto remaining = totp.time_remaining(secret);
    if (json_output) {
        print_json(Json{{"code", *code}, {"remaining_seconds", remaining.count()}}, true);
    } else {
        std::cout << color::c(color::bold) << *code << color::c(color::reset)
                  << color::c(color::dim) << "  (" << remaining.count() << "s left)"
                  << color::c(color::reset) << "\n";
    }
    return 0;
}

int cmd_gpio_switch(DeviceApi& api, const std::string& assignment, bool wait, bool json_output) {
    const auto eq = assignment.find('=');
    const bool well_formed = (eq != std::string::npos) && (eq > 0) && (eq + 1 < assignment.size());
    if (well_formed == false) {
        print_error("--gpio-switch expects <channel>=<0|1>");
        return 1;
    }
    const std::string channel = assignment.substr(0, eq);
    const std::string state = assignment.substr(eq + 1);
    if (state != "0" && state != "1") {
        print_error("GPIO state must be 0 or 1");
        return 1;
    }
    auto result = api.switch_gpio_channel(channel, state == "1", wait);
    if (result && json_output == false) {
        print_success("Switched " + channel + " to " + state);
        return 0;
    }
    return report(result, "GPIO", json_output);
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// Logs go to stderr (and optionally a file); stdout carries command output.
// Without --verbose, --log-level, KVMPP_LOG_LEVEL or --log-file nothing is
// logged.

bool configure_logging(const cxxopts::ParseResult& result) {
    std::string level_name = result.count("log-level")
        ? result["log-level"].as<std::string>()
        : get_env("KVMPP_LOG_LEVEL");
    if (level_name.empty() && result.count("verbose")) {
        level_name = "debug";
    }

    const bool has_file = result.count("log-file") > 0;
    if (level_name.empty() && has_file == false) {
        return true;
    }

    auto level = LogLevel::Info;
    if (level_name.empty() == false) {
        const auto parsed = parse_log_level(level_name);
        if (parsed.has_value() == false) {
            print_error("Unknown log level: " + level_name);
            return false;
        }
        level = *parsed;
    }

    SpdlogLoggerConfig config;
    config.with_level(level);
    if (has_file) {
        config.with_file(result["log-file"].as<std::string>());
    }

    try {
        set_logger(make_spdlog_logger(config));
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("Cannot open log file: ") + e.what());
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("kvmpp-cli", "KVM-over-IP device tool");

    options.add_options()
        // Connection
        ("H,host", "Device hostname or address (optionally host:port)", cxxopts::value<std::string>())
        ("u,user", "Username", cxxopts::value<std::string>()->default_value("admin"))
        ("p,password", "Password (or use KVMPP_PASSWORD env var)", cxxopts::value<std::string>())
        ("s,secret", "Base32 TOTP secret (or use KVMPP_TOTP_SECRET env var)", cxxopts::value<std::string>())
        ("http", "Use plain HTTP instead of HTTPS")
        ("verify-tls", "Verify the device's TLS certificate")
        ("t,timeout", "Read timeout in seconds", cxxopts::value<int>()->default_value("30"))

        // Commands
        ("info", "Show system information")
        ("atx-state", "Show ATX power state")
        ("atx-power", "Set ATX power: on, off, off_hard, reset_hard", cxxopts::value<std::string>())
        ("atx-click", "Press ATX button: power, power_long, reset", cxxopts::value<std::string>())
        ("msd-state", "Show mass-storage state")
        ("msd-connect", "Connect the mass-storage drive")
        ("msd-disconnect", "Disconnect the mass-storage drive")
        ("gpio-state", "Show GPIO state")
        ("gpio-switch", "Switch a GPIO channel, <channel>=<0|1>", cxxopts::value<std::string>())
        ("gpio-pulse", "Pulse a GPIO channel", cxxopts::value<std::string>())
        ("gpio-delay", "Pulse length in milliseconds (0 = channel default)", cxxopts::value<int>()->default_value("0"))
        ("no-wait", "Do not wait for ATX/GPIO actions to finish")
        ("streamer-state", "Show streamer state")
        ("metrics", "Print Prometheus metrics")
        ("totp", "Print the current TOTP code (no device access)")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable verbose logging (same as --log-level debug)")
        ("log-level", "trace, debug, info, warn, error or off (or use KVMPP_LOG_LEVEL env var)", cxxopts::value<std::string>())
        ("log-file", "Also append log output to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;
        const bool wait = result.count("no-wait") == 0;

        if (configure_logging(result) == false) {
            return 1;
        }

        const std::string secret = result.count("secret")
            ? result["secret"].as<std::string>()
            : get_env("KVMPP_TOTP_SECRET");

        SessionContext context;

        if (result.count("totp")) {
            if (secret.empty()) {
                print_error("TOTP secret required. Use --secret or set KVMPP_TOTP_SECRET");
                return 1;
            }
            return cmd_totp(context.totp_cache(), secret, json_output);
        }

        if (result.count("host") == 0) {
            print_error("--host is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        DeviceClientConfig config;
        config.hostname = result["host"].as<std::string>();
        config.username = result["user"].as<std::string>();
        config.password = result.count("password")
            ? result["password"].as<std::string>()
            : get_env("KVMPP_PASSWORD");
        config.with_secret(secret)
              .with_scheme(result.count("http") ? Scheme::Http : Scheme::Https)
              .with_verify_tls(result.count("verify-tls") > 0)
              .with_read_timeout(std::chrono::seconds(result["timeout"].as<int>()))
              .with_header("User-Agent", "kvmpp-cli");

        if (config.password.empty()) {
            print_error("Password required. Use --password or set KVMPP_PASSWORD");
            return 1;
        }

        auto connection = context.registry().get_connection(config);
        if (!connection) {
            print_error("Failed to connect: " + connection.error().describe());
            return 1;
        }

        DeviceApi api(**connection);

        if (result.count("atx-state")) {
            return report(api.atx_state(), "ATX", json_output);
        }
        if (result.count("atx-power")) {
            auto action = parse_atx_power_action(result["atx-power"].as<std::string>());
            if (!action) {
                print_error(action.error().message);
                return 1;
            }
            return report(api.set_atx_power(*action, wait), "ATX power", json_output);
        }
        if (result.count("atx-click")) {
            auto button = parse_atx_button(result["atx-click"].as<std::string>());
            if (!button) {
                print_error(button.error().message);
                return 1;
            }
            return report(api.click_atx_button(*button, wait), "ATX click", json_output);
        }
        if (result.count("msd-state")) {
            return report(api.msd_state(), "Mass storage", json_output);
        }
        if (result.count("msd-connect")) {
            return report(api.connect_msd(true), "Mass storage", json_output);
        }
        if (result.count("msd-disconnect")) {
            return report(api.connect_msd(false), "Mass storage", json_output);
        }
        if (result.count("gpio-state")) {
            return report(api.gpio_state(), "GPIO", json_output);
        }
        if (result.count("gpio-switch")) {
            return cmd_gpio_switch(api, result["gpio-switch"].as<std::string>(), wait, json_output);
        }
        if (result.count("gpio-pulse")) {
            const auto delay = std::chrono::milliseconds(result["gpio-delay"].as<int>());
            return report(api.pulse_gpio_channel(result["gpio-pulse"].as<std::string>(), delay, wait),
                          "GPIO", json_output);
        }
        if (result.count("streamer-state")) {
            return report(api.streamer_state(), "Streamer", json_output);
        }
        if (result.count("metrics")) {
            return report_text(api.prometheus_metrics(), json_output);
        }

        // Default: system info
        return report(api.system_info(), "System", json_output);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
