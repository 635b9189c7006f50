#include "rules/rule_registry.hpp"

#include "log/log.hpp"

namespace tsbuild::rules {

std::optional<std::string> RuleRegistry::add(BuildRule rule) {
    if (auto error = validate_rule(rule))
        return error;
    if (find(rule.name))
        return "rule '" + rule.name + "' is already registered";

    TSBUILD_LOG_DEBUG("rules", "Registered '" << rule.name << "' with " << rule.inputs.size()
                                               << " input(s)"
                                               << (rule.flags.target_predeps ? ", predeps" : "")
                                               << (rule.flags.no_link ? ", no_link" : ""));
    rules_.push_back(std::move(rule));
    return std::nullopt;
}

const BuildRule* RuleRegistry::find(std::string_view name) const {
    for (const auto& rule : rules_) {
        if (rule.name == name)
            return &rule;
    }
    return nullptr;
}

std::vector<const BuildRule*> RuleRegistry::ordered() const {
    std::vector<const BuildRule*> result;
    result.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (rule.flags.target_predeps) {
            result.push_back(&rule);
        }
    }
    for (const auto& rule : rules_) {
        if (!rule.flags.target_predeps) {
            result.push_back(&rule);
        }
    }
    return result;
}

std::vector<std::vector<const BuildRule*>> RuleRegistry::phases() const {
    std::vector<const BuildRule*> predeps;
    std::vector<const BuildRule*> rest;
    for (const auto& rule : rules_) {
        (rule.flags.target_predeps ? predeps : rest).push_back(&rule);
    }

    std::vector<std::vector<const BuildRule*>> result;
    if (!predeps.empty()) {
        result.push_back(std::move(predeps));
    }
    if (!rest.empty()) {
        result.push_back(std::move(rest));
    }
    return result;
}

std::vector<fs::path> RuleRegistry::link_inputs() const {
    std::vector<fs::path> outputs;
    for (const auto& rule : rules_) {
        if (rule.flags.no_link)
            continue;
        for (const auto& input : rule.inputs) {
            outputs.push_back(output_for(rule, input));
        }
    }
    return outputs;
}

std::vector<fs::path> RuleRegistry::clean_outputs() const {
    std::vector<fs::path> outputs;
    for (const auto& rule : rules_) {
        if (rule.flags.no_clean)
            continue;
        for (const auto& input : rule.inputs) {
            outputs.push_back(output_for(rule, input));
        }
    }
    return outputs;
}

} // namespace tsbuild::rules
