#include "hindsight/core/trace/classifier.hpp"

#include <mutex>
#include <set>
#include <stdexcept>
#include <variant>

namespace hindsight::core::trace {
namespace {

// A predicate that reads the wrong alternative is a non-match.
bool matches(const ClassificationRule& rule, const std::string& key, const model::AttributeValue& value) {
    try {
        return rule.predicate(key, value);
    } catch (const std::bad_variant_access&) {
        return false;
    }
}

}  // namespace

ClassificationRule key_prefix_rule(std::string framework_kind, std::string prefix) {
    return {std::move(framework_kind),
            [prefix = std::move(prefix)](const std::string& key, const model::AttributeValue&) {
                return key.compare(0, prefix.size(), prefix) == 0;
            }};
}

ClassificationRule bool_marker_rule(std::string framework_kind, std::string key) {
    return {std::move(framework_kind),
            [marker = std::move(key)](const std::string& key, const model::AttributeValue& value) {
                if (key != marker) {
                    return false;
                }
                const auto* flag = std::get_if<bool>(&value);
                return flag != nullptr && *flag;
            }};
}

ClassificationRule string_marker_rule(std::string framework_kind, std::string key, std::string expected) {
    return {std::move(framework_kind),
            [marker = std::move(key), expected = std::move(expected)](const std::string& key,
                                                                      const model::AttributeValue& value) {
                if (key != marker) {
                    return false;
                }
                const auto* text = std::get_if<std::string>(&value);
                return text != nullptr && *text == expected;
            }};
}

TraceClassifier::TraceClassifier(std::vector<ClassificationRule> rules) {
    for (auto& rule : rules) {
        add_rule(std::move(rule));
    }
}

std::shared_ptr<TraceClassifier> TraceClassifier::with_prefix_rules(const std::vector<std::string>& frameworks) {
    auto classifier = std::make_shared<TraceClassifier>();
    for (const auto& framework : frameworks) {
        if (!framework.empty()) {
            classifier->add_rule(key_prefix_rule(framework, framework + "."));
        }
    }
    return classifier;
}

void TraceClassifier::add_rule(ClassificationRule rule) {
    if (rule.framework_kind.empty() || !rule.predicate) {
        throw std::invalid_argument("classification rule needs a framework kind and a predicate");
    }
    std::unique_lock lock(mutex_);
    rules_.push_back(std::move(rule));
}

std::size_t TraceClassifier::rule_count() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

model::TraceType TraceClassifier::classify(const model::Trace& trace) const {
    return classify(trace.spans);
}

model::TraceType TraceClassifier::classify(const std::vector<model::Span>& spans) const {
    std::set<std::string> matched;

    std::shared_lock lock(mutex_);
    for (const auto& rule : rules_) {
        if (matched.count(rule.framework_kind) != 0) {
            continue;
        }
        bool hit = false;
        for (const auto& span : spans) {
            for (const auto& [key, value] : span.attributes) {
                if (matches(rule, key, value)) {
                    hit = true;
                    break;
                }
            }
            if (hit) {
                break;
            }
        }
        if (hit) {
            matched.insert(rule.framework_kind);
        }
    }

    if (matched.empty()) {
        return model::TraceType::generic();
    }
    if (matched.size() == 1) {
        return model::TraceType::framework(*matched.begin());
    }
    return model::TraceType::mixed();
}

}  // namespace hindsight::core::trace
