#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "resilience/breaker_report.hpp"
#include "resilience/circuit_breaker_manager.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace siemguard;

// =========================================================================
// Simulated SIEM connector
// =========================================================================

namespace {

/**
 * @brief Stand-in for a SIEM search API; fails for a stretch of calls,
 *        then recovers
 */
class FlakyConnector {
public:
    FlakyConnector(std::string service, int fail_from, int fail_until)
        : service_(std::move(service)), fail_from_(fail_from), fail_until_(fail_until) {}

    std::string search(const std::string& query) {
        const int n = calls_++;
        if (n >= fail_from_ && n < fail_until_) {
            if (n % 3 == 0) {
                throw HttpStatusError(503, std::format("{} returned 503 Service Unavailable", service_));
            }
            throw std::runtime_error(std::format("connection refused by {}", service_));
        }
        return std::format("{}: {} hits for '{}'", service_, (n * 7) % 50, query);
    }

private:
    std::string service_;
    int fail_from_;
    int fail_until_;
    int calls_ = 0;
};

void run_queries(CircuitBreaker& breaker, FlakyConnector& connector, int count) {
    for (int i = 0; i < count; ++i) {
        try {
            const auto result = breaker.call([&] { return connector.search("event.severity:high"); });
            utils::log::debug(result);
        } catch (const CircuitOpenError& e) {
            // Fallback: serve from the local alert cache
            utils::log::info(std::format("Fallback for {}: {}", breaker.name(), e.what()));
        } catch (const std::exception& e) {
            utils::log::debug(std::format("Query failed on {}: {}", breaker.name(), e.what()));
        }
    }
}

void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} [config.toml]\n", argv0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    GuardConfig config;
    if (argc == 2) {
        auto result = ConfigLoader::load_from_file(argv[1]);
        if (!result.success) {
            utils::log::error(result.error_message);
            return EXIT_FAILURE;
        }
        config = std::move(result.config);
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    CircuitBreakerManager manager(config.defaults);
    if (config.breakers.empty()) {
        create_elasticsearch_breaker(manager);
        create_wazuh_breaker(manager);
        create_splunk_breaker(manager);
    } else {
        const size_t created = manager.create_configured(config.breakers);
        utils::log::info(std::format("Created {} configured circuit breakers", created));
    }

    for (const auto& name : manager.names()) {
        manager.get_breaker(name)->set_on_failure([name](const FailureRecord& f) {
            utils::log::debug(std::format("[{}] {} failure", name, failure_type_str(f.failure_type)));
        });
    }

    // Every connector fails after a few calls; the first one keeps failing
    int offset = 0;
    for (const auto& name : manager.names()) {
        auto breaker = manager.get_breaker(name);
        FlakyConnector connector(name, 5 + offset, offset == 0 ? 1000 : 30 + offset);
        run_queries(*breaker, connector, 40);
        offset += 5;
    }

    std::cout << global_status_json(manager, 2) << '\n';
    for (const auto& name : manager.names()) {
        std::cout << breaker_report(*manager.get_breaker(name)).dump(2) << '\n';
    }

    manager.cleanup_all();
    return EXIT_SUCCESS;
}
