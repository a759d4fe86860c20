#include "resilience/circuit_breaker_manager.hpp"

#include <algorithm>
#include <format>

namespace siemguard {

namespace {

void adjust(BreakerCounts& counts, CircuitState state, int delta) {
    uint64_t* slot = nullptr;
    switch (state) {
        case CircuitState::OPEN:      slot = &counts.open_breakers; break;
        case CircuitState::HALF_OPEN: slot = &counts.half_open_breakers; break;
        case CircuitState::CLOSED:    slot = &counts.closed_breakers; break;
    }
    if (!slot) return;
    if (delta < 0) {
        if (*slot > 0) --*slot;
    } else {
        ++*slot;
    }
}

} // anonymous namespace

CircuitBreakerManager::CircuitBreakerManager(CircuitBreakerConfig default_config,
                                             TimeSource clock,
                                             std::shared_ptr<const FailureClassifier> classifier)
    : default_config_(std::move(default_config)),
      clock_(std::move(clock)),
      classifier_(classifier ? std::move(classifier)
                             : std::make_shared<const FailureClassifier>()) {
    utils::log::info("Circuit breaker manager initialized");
}

CircuitBreakerManager::~CircuitBreakerManager() {
    cleanup_all();
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::create_breaker(const std::string& name) {
    return create_breaker(name, default_config_);
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::create_breaker(
    const std::string& name, const CircuitBreakerConfig& config) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        const auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            utils::log::warn(std::format("Circuit breaker already exists: {}", name));
            return it->second;
        }
    }

    // Build and wire the breaker BEFORE taking the unique lock
    // (its dispatch lock is taken inside set_on_state_change)
    auto breaker = std::make_shared<CircuitBreaker>(name, config, clock_, classifier_);
    breaker->set_on_state_change(
        [this, raw = breaker.get()](const StateChangeEvent& event) {
            on_state_change(raw, event);
        });

    {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = breakers_.try_emplace(name, breaker);
        if (!inserted) {
            // Lost a creation race; the registered instance wins
            auto existing = it->second;
            lock.unlock();
            breaker->set_on_state_change(nullptr);
            utils::log::warn(std::format("Circuit breaker already exists: {}", name));
            return existing;
        }
        ++counts_.total_breakers;
        ++counts_.closed_breakers;
    }

    utils::log::info(std::format("Circuit breaker created: {}", name));
    return breaker;
}

size_t CircuitBreakerManager::create_configured(const std::vector<NamedBreakerConfig>& configs) {
    size_t created = 0;
    for (const auto& entry : configs) {
        if (get_breaker(entry.name)) {
            utils::log::warn(std::format("Circuit breaker already exists: {}", entry.name));
            continue;
        }
        create_breaker(entry.name, entry.config);
        ++created;
    }
    return created;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::get_breaker(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

void CircuitBreakerManager::on_state_change(const CircuitBreaker* breaker,
                                            const StateChangeEvent& event) {
    if (event.from == event.to) return;

    std::unique_lock lock(mutex_);
    const auto it = breakers_.find(event.breaker_name);
    if (it == breakers_.end() || it->second.get() != breaker) {
        return;  // Detached breaker
    }
    adjust(counts_, event.from, -1);
    adjust(counts_, event.to, +1);
}

GlobalStatus CircuitBreakerManager::get_global_status() const {
    GlobalStatus status;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, breaker] : breakers_) {
            status.breakers.emplace(name, breaker->get_state());
        }
    }

    // Counted from the snapshots themselves so the report is self-consistent
    // while transitions are still being delivered to counts_
    auto& stats = status.global_stats;
    stats.total_breakers = status.breakers.size();
    for (const auto& [name, snap] : status.breakers) {
        adjust(stats, snap.state, +1);
    }

    status.health_summary.healthy_percentage =
        static_cast<double>(stats.closed_breakers) /
        static_cast<double>(std::max<uint64_t>(1, stats.total_breakers)) * 100.0;
    status.health_summary.degraded_count = stats.half_open_breakers;
    status.health_summary.failed_count = stats.open_breakers;
    return status;
}

BreakerCounts CircuitBreakerManager::counts() const {
    std::shared_lock lock(mutex_);
    return counts_;
}

std::vector<std::string> CircuitBreakerManager::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t CircuitBreakerManager::size() const {
    std::shared_lock lock(mutex_);
    return breakers_.size();
}

std::vector<std::shared_ptr<CircuitBreaker>> CircuitBreakerManager::snapshot_breakers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<CircuitBreaker>> result;
    result.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        result.push_back(breaker);
    }
    return result;
}

void CircuitBreakerManager::reset_all() {
    utils::log::info("Resetting all circuit breakers");

    // Outside the registry lock: reset() delivers events back into on_state_change
    for (const auto& breaker : snapshot_breakers()) {
        breaker->reset();
    }
}

void CircuitBreakerManager::cleanup_all() {
    utils::log::info("Cleaning up all circuit breakers");

    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> detached;
    {
        std::unique_lock lock(mutex_);
        detached.swap(breakers_);
        counts_ = BreakerCounts{};
    }

    for (const auto& [name, breaker] : detached) {
        breaker->set_on_state_change(nullptr);
        breaker->cleanup();
    }
}

// ============================================================================
// SIEM connector helpers
// ============================================================================

std::shared_ptr<CircuitBreaker> create_elasticsearch_breaker(CircuitBreakerManager& manager) {
    return manager.create_breaker("elasticsearch", presets::elasticsearch());
}

std::shared_ptr<CircuitBreaker> create_wazuh_breaker(CircuitBreakerManager& manager) {
    return manager.create_breaker("wazuh", presets::wazuh());
}

std::shared_ptr<CircuitBreaker> create_splunk_breaker(CircuitBreakerManager& manager) {
    return manager.create_breaker("splunk", presets::splunk());
}

} // namespace siemguard
