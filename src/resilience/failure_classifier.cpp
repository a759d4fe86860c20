#include "resilience/failure_classifier.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <typeinfo>

namespace siemguard {

namespace {

bool text_contains(const FailureContext& ctx, std::string_view needle) {
    return ctx.message_lower.find(needle) != std::string::npos;
}

bool type_contains(const FailureContext& ctx, std::string_view needle) {
    return ctx.type_name.find(needle) != std::string::npos;
}

} // anonymous namespace

FailureClassifier::FailureClassifier()
    : rules_(default_rules()) {}

FailureClassifier::FailureClassifier(std::vector<Rule> rules)
    : rules_(std::move(rules)) {}

std::vector<FailureClassifier::Rule> FailureClassifier::default_rules() {
    return {
        {"timeout",
         [](const FailureContext& c) {
             return text_contains(c, "timeout") || type_contains(c, "timeout");
         },
         FailureType::TIMEOUT},
        {"connection",
         [](const FailureContext& c) {
             return text_contains(c, "connection") || type_contains(c, "connection");
         },
         FailureType::CONNECTION_ERROR},
        {"authentication",
         [](const FailureContext& c) {
             return text_contains(c, "auth") || text_contains(c, "unauthorized");
         },
         FailureType::AUTHENTICATION_ERROR},
        {"rate_limit",
         [](const FailureContext& c) {
             return text_contains(c, "rate limit") || text_contains(c, "too many requests");
         },
         FailureType::RATE_LIMIT},
        {"service_unavailable",
         [](const FailureContext& c) {
             return text_contains(c, "service unavailable") || text_contains(c, "503");
         },
         FailureType::SERVICE_UNAVAILABLE},
        {"http_status",
         [](const FailureContext& c) {
             return c.http_status.has_value() && *c.http_status >= 400 && *c.http_status < 600;
         },
         FailureType::HTTP_ERROR},
    };
}

void FailureClassifier::prepend_rule(Rule rule) {
    rules_.insert(rules_.begin(), std::move(rule));
}

void FailureClassifier::append_rule(Rule rule) {
    rules_.push_back(std::move(rule));
}

FailureType FailureClassifier::classify(const FailureContext& ctx) const {
    for (const auto& rule : rules_) {
        if (rule.matches && rule.matches(ctx)) {
            return rule.type;
        }
    }
    return FailureType::UNKNOWN;
}

FailureContext FailureClassifier::describe(const std::exception_ptr& error) {
    FailureContext ctx;
    if (!error) {
        ctx.message = "unknown exception";
    } else {
        try {
            std::rethrow_exception(error);
        } catch (const HttpStatusError& e) {
            ctx.message = e.what();
            ctx.type_name = typeid(e).name();
            ctx.http_status = e.status_code();
        } catch (const std::exception& e) {
            ctx.message = e.what();
            ctx.type_name = typeid(e).name();
        } catch (...) {
            ctx.message = "unknown exception";
        }
    }
    ctx.message_lower = utils::to_lower(ctx.message);
    ctx.type_name = utils::to_lower(ctx.type_name);
    return ctx;
}

} // namespace siemguard
