// ═══════════════════════════════════════════════════════════════════════════
// Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════
// Thread safety of the TOTP cache, the connection registry and the global
// logger under parallel callers.

#include <catch2/catch_test_macros.hpp>

#include "kvmpp/auth/totp_cache.hpp"
#include "kvmpp/log/logger.hpp"
#include "kvmpp/session/connection_registry.hpp"
#include "mocks/fake_kvmd.hpp"
#include "mocks/fake_totp_generator.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace kvmpp;
using namespace kvmpp::testing;
using namespace std::chrono_literals;

namespace {

constexpr int thread_count = 16;

DeviceClientConfig device_config(const std::string& host) {
    DeviceClientConfig config;
    config.hostname = host;
    config.username = "admin";
    config.password = "hunter2";
    return config;
}

ConnectionRegistryConfig kvmd_factory(FakeKvmd& kvmd) {
    return ConnectionRegistryConfig{}.with_factory(
        [&kvmd](const DeviceClientConfig& config, TotpCache& totp) {
            return std::make_shared<DeviceClient>(config, totp, kvmd.make_client());
        });
}

// Custom logger that counts log calls for testing
class CountingLogger : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {
        log_count_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return log_count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::size_t> log_count_{0};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Logger handles concurrent writers", "[concurrency][log]") {
    auto counting = std::make_unique<CountingLogger>();
    auto* ptr = counting.get();
    set_logger(std::move(counting));

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([] {
            for (int i = 0; i < 100; ++i) {
                KVMPP_LOG_INFO("concurrent message");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(ptr->count() == thread_count * 100);
    set_logger(nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// TotpCache
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TotpCache serves one code to parallel callers", "[concurrency][totp]") {
    auto generator = std::make_shared<FakeTotpGenerator>("424242");
    const auto fixed = std::chrono::system_clock::time_point{std::chrono::seconds{1'000'000'010}};
    TotpCache cache(generator, TotpCacheConfig{}.with_clock([fixed] { return fixed; }));

    std::vector<std::future<DeviceResult<std::string>>> futures;
    for (int t = 0; t < thread_count; ++t) {
        futures.push_back(std::async(std::launch::async, [&cache] {
            return cache.get_code("SECRET");
        }));
    }

    for (auto& future : futures) {
        auto code = future.get();
        REQUIRE(code.has_value());
        REQUIRE(*code == "424242");
    }
    REQUIRE(generator->generations() == 1);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("TotpCache tolerates refreshes racing reads", "[concurrency][totp]") {
    auto generator = std::make_shared<FakeTotpGenerator>("424242");
    TotpCache cache(generator);
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&cache, &failures, t] {
            for (int i = 0; i < 50; ++i) {
                auto code = cache.get_code("SECRET-" + std::to_string(i % 4), (t % 2) == 0);
                if (!code) {
                    failures.fetch_add(1);
                }
                static_cast<void>(cache.time_remaining("SECRET-0"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(cache.size() == 4);
}

// ═══════════════════════════════════════════════════════════════════════════
// ConnectionRegistry
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionRegistry keeps one entry per key under contention", "[concurrency][registry]") {
    FakeKvmd kvmd("admin", "hunter2");
    kvmd.set_header_auth(false);
    TotpCache totp(nullptr);
    ConnectionRegistry registry(totp, kvmd_factory(kvmd));

    struct Acquired {
        DeviceResult<ConnectionRegistry::ClientPtr> client;
        DeviceResult<bool> authenticated;
    };

    // Every handle must still authenticate after all callers returned: a
    // handle given to one caller is never logged out by another.
    std::vector<std::future<Acquired>> futures;
    for (int t = 0; t < thread_count; ++t) {
        futures.push_back(std::async(std::launch::async, [&registry] {
            auto client = registry.get_connection(device_config("kvm.local"));
            if (!client) {
                return Acquired{client, tl::unexpected(client.error())};
            }
            return Acquired{client, (*client)->check_auth()};
        }));
    }

    std::vector<Acquired> results;
    for (auto& future : futures) {
        results.push_back(future.get());
    }

    for (const auto& result : results) {
        REQUIRE(result.client.has_value());
        REQUIRE(*result.client != nullptr);
        REQUIRE(result.authenticated.has_value());
        REQUIRE(*result.authenticated == true);
        REQUIRE(*result.client == *results.front().client);
        REQUIRE((*result.client)->check_auth().value_or(false));
    }

    REQUIRE(registry.get_total_connections() == 1);
    REQUIRE(kvmd.clients_created() >= 1);
    REQUIRE(registry.close_all_connections() == 1);
}

TEST_CASE("ConnectionRegistry pools distinct hosts in parallel", "[concurrency][registry]") {
    FakeKvmd kvmd("admin", "hunter2");
    TotpCache totp(nullptr);
    ConnectionRegistry registry(totp, kvmd_factory(kvmd));

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&registry, &failures, t] {
            const auto host = "kvm" + std::to_string(t) + ".local";
            for (int i = 0; i < 5; ++i) {
                if (!registry.get_connection(device_config(host))) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(registry.get_total_connections() == static_cast<std::size_t>(thread_count));
    REQUIRE(kvmd.clients_created() == thread_count);
}

TEST_CASE("ConnectionRegistry survives closes racing acquisitions", "[concurrency][registry]") {
    FakeKvmd kvmd("admin", "hunter2");
    kvmd.set_header_auth(false);
    TotpCache totp(nullptr);
    ConnectionRegistry registry(totp, kvmd_factory(kvmd));

    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            const auto host = "kvm" + std::to_string(t % 2) + ".local";
            while (stop.load() == false) {
                if (!registry.get_connection(device_config(host))) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    std::thread closer([&] {
        for (int i = 0; i < 50; ++i) {
            static_cast<void>(registry.close_connection("kvm0.local", "admin"));
            static_cast<void>(registry.clean_unused_connections(0s));
            static_cast<void>(registry.has_connection("kvm1.local", "admin"));
            std::this_thread::sleep_for(1ms);
        }
        stop.store(true);
    });

    closer.join();
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(registry.get_total_connections() <= 2);
    registry.close_all_connections();
    REQUIRE(registry.get_total_connections() == 0);
}
