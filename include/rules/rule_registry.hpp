//! # Rule Registry
//!
//! The list of extra compilers known to a build. The engine asks it for
//! execution phases: rules flagged `target_predeps` first, everything else
//! after, each phase in registration order.

#ifndef TSBUILD_RULES_RULE_REGISTRY_HPP
#define TSBUILD_RULES_RULE_REGISTRY_HPP

#include "rules/build_rule.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsbuild::rules {

class RuleRegistry {
public:
    /// Validate and register a rule. Names must be unique.
    /// @return Error message, or std::nullopt on success
    std::optional<std::string> add(BuildRule rule);

    const BuildRule* find(std::string_view name) const;

    /// Predeps first, then the rest; registration order within each group.
    std::vector<const BuildRule*> ordered() const;

    /// Non-empty groups of rules that may run together.
    std::vector<std::vector<const BuildRule*>> phases() const;

    /// Outputs that feed the link step (rules not flagged no_link).
    std::vector<fs::path> link_inputs() const;

    /// Outputs removed by `clean` (rules not flagged no_clean).
    std::vector<fs::path> clean_outputs() const;

    size_t size() const {
        return rules_.size();
    }
    bool empty() const {
        return rules_.empty();
    }

private:
    std::vector<BuildRule> rules_;
};

} // namespace tsbuild::rules

#endif // TSBUILD_RULES_RULE_REGISTRY_HPP
