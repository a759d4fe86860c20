#pragma once

#include "core/types.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace siemguard {

/**
 * @brief What the classifier knows about a raised error
 *
 * message is the error text as raised; message_lower and type_name are
 * lowercased for matching. type_name is the (implementation defined)
 * std::type_info name of the dynamic exception type.
 */
struct FailureContext {
    std::string message;
    std::string message_lower;
    std::string type_name;
    std::optional<int> http_status;
};

/**
 * @brief Maps a raised error into a FailureType
 *
 * Ordered list of (predicate, FailureType) rules; the first matching rule
 * wins, UNKNOWN when none match. The default rule set is a best-effort
 * heuristic over message text, type name and HTTP status:
 *
 *   "timeout"                          -> TIMEOUT
 *   "connection"                       -> CONNECTION_ERROR
 *   "auth" / "unauthorized"            -> AUTHENTICATION_ERROR
 *   "rate limit" / "too many requests" -> RATE_LIMIT
 *   "service unavailable" / "503"      -> SERVICE_UNAVAILABLE
 *   HTTP status in [400, 600)          -> HTTP_ERROR
 *
 * Rules are registered before the breaker starts taking traffic; the
 * classifier is read-only afterwards and safe to share across threads.
 */
class FailureClassifier {
public:
    using Predicate = std::function<bool(const FailureContext&)>;

    struct Rule {
        std::string name;
        Predicate matches;
        FailureType type;
    };

    /// Classifier populated with the default rules
    FailureClassifier();

    /// Classifier with exactly the given rules
    explicit FailureClassifier(std::vector<Rule> rules);

    [[nodiscard]] static std::vector<Rule> default_rules();

    /// Insert a rule ahead of every existing rule
    void prepend_rule(Rule rule);

    /// Append a rule after every existing rule
    void append_rule(Rule rule);

    [[nodiscard]] FailureType classify(const FailureContext& ctx) const;

    /**
     * @brief Build the context for an exception and classify it
     *
     * Non-std::exception payloads yield message "unknown exception".
     * HttpStatusError contributes its status code.
     */
    [[nodiscard]] static FailureContext describe(const std::exception_ptr& error);

    [[nodiscard]] FailureType classify(const std::exception_ptr& error) const {
        return classify(describe(error));
    }

    [[nodiscard]] size_t rule_count() const { return rules_.size(); }

private:
    std::vector<Rule> rules_;
};

} // namespace siemguard
