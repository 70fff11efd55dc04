// Example 01: Pooled Device Sessions
//
// Shows connection reuse across several short operations, TOTP-aware retry,
// and caller-driven idle eviction.
//
//   kvmpp_example_pooled_sessions <host> <user> <password> [totp-secret]

#include <kvmpp/device/device_api.hpp>
#include <kvmpp/log/spdlog_logger.hpp>
#include <kvmpp/session/session_context.hpp>

#include <iostream>
#include <string>

using namespace kvmpp;

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <host> <user> <password> [totp-secret]\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    std::cout << "=== Pooled Device Sessions Example ===\n\n";

    // 1. One context per process
    SessionContext context;

    DeviceClientConfig config;
    config.hostname = argv[1];
    config.username = argv[2];
    config.password = argv[3];
    if (argc > 4) {
        config.with_secret(argv[4]);
    }

    // 2. Several operations, one login
    for (int i = 0; i < 3; ++i) {
        auto client = context.registry().get_connection(config);
        if (!client) {
            std::cerr << "ERROR: " << client.error().describe() << "\n";
            return 1;
        }

        DeviceApi api(**client);
        auto atx = api.atx_state();
        if (!atx) {
            std::cerr << "ERROR: " << atx.error().describe() << "\n";
            return 1;
        }
        std::cout << "Round " << (i + 1) << ": ATX " << atx->dump() << "\n";
    }

    std::cout << "\nPooled connections: " << context.registry().get_total_connections() << "\n";

    // 3. Nothing has been idle for five minutes yet
    const auto evicted = context.registry().clean_unused_connections();
    std::cout << "Evicted: " << evicted << "\n";

    // 4. Explicit shutdown (the context would also do this on destruction)
    const auto closed = context.registry().close_all_connections();
    std::cout << "Closed: " << closed << "\n";

    return 0;
}
