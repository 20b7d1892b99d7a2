/*
 * Primus C++ - Inference Boundary Implementation
 */
#include <primus/core/inference.hpp>
#include <primus/core/logger.hpp>

namespace primus {

std::string ContextBundle::render() const {
    std::string out;
    for (size_t i = 0; i < snippets.size(); ++i) {
        if (!out.empty()) out += "\n\n";
        out += "[" + snippets[i].partition.to_string() + "]\n" + snippets[i].text;
    }
    return out;
}

Redactor::Redactor() {}

void Redactor::add_default_rules() {
    add_rule("\\b(?:\\d[ -]?){12,15}\\d\\b", "[REDACTED_CARD]");
    add_rule("\\b\\d{3}-\\d{2}-\\d{4}\\b", "[REDACTED_SSN]");
    add_rule("(password|passwd|secret|api[_-]?key)\\s*[:=]\\s*\\S+", "$1: [REDACTED]");
}

bool Redactor::add_rule(const std::string& pattern, const std::string& replacement) {
    try {
        rules_.push_back(std::make_pair(std::regex(pattern, std::regex::ECMAScript | std::regex::icase),
                                        replacement));
        return true;
    } catch (const std::regex_error& e) {
        LOG_WARN("[Redactor] Invalid pattern '%s': %s", pattern.c_str(), e.what());
        return false;
    }
}

size_t Redactor::load(const Json& rules) {
    size_t added = 0;
    if (!rules.is_array()) return added;

    for (size_t i = 0; i < rules.size(); ++i) {
        const Json& rule = rules[i];
        if (!rule.is_array() || rule.size() != 2 || !rule[0].is_string() || !rule[1].is_string()) {
            LOG_WARN("[Redactor] Skipping malformed rule at index %zu", i);
            continue;
        }
        if (add_rule(rule[0].get<std::string>(), rule[1].get<std::string>())) {
            ++added;
        }
    }
    return added;
}

std::string Redactor::apply(const std::string& text) const {
    std::string out = text;
    for (size_t i = 0; i < rules_.size(); ++i) {
        out = std::regex_replace(out, rules_[i].first, rules_[i].second);
    }
    return out;
}

void Redactor::apply(ContextBundle& bundle) const {
    for (size_t i = 0; i < bundle.snippets.size(); ++i) {
        bundle.snippets[i].text = apply(bundle.snippets[i].text);
    }
}

} // namespace primus
