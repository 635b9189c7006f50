//! # Build Rules
//!
//! A build rule is a declarative "extra compiler": a set of inputs, a
//! pattern naming the output of each input, a command template, and flags
//! telling the engine how the outputs relate to the rest of the build.
//!
//! ## Template Placeholders
//!
//! | Placeholder  | Value                                   | Quoted in commands |
//! |--------------|-----------------------------------------|--------------------|
//! | `{tool}`     | Resolved executable                     | yes                |
//! | `{in}`       | Input path                              | yes                |
//! | `{out}`      | Output path                             | yes                |
//! | `{out_dir}`  | Output directory                        | yes                |
//! | `{base}`     | Input file name without last extension  | no                 |
//! | `{ext}`      | Output extension (".qm")                | no                 |
//! | `{encoding}` | Source encoding                         | no                 |
//!
//! Unknown placeholders are kept literally.

#ifndef TSBUILD_RULES_BUILD_RULE_HPP
#define TSBUILD_RULES_BUILD_RULE_HPP

#include "common.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace tsbuild::manifest {
struct Manifest;
}

namespace tsbuild::rules {

constexpr const char* DEFAULT_OUTPUT_PATTERN = "{out_dir}/{base}{ext}";
constexpr const char* TRANSLATION_RULE_NAME = "updateqm";

/**
 * How a rule's outputs take part in the build
 */
struct RuleFlags {
    bool no_link = false;        // Outputs are artifacts, never link inputs
    bool target_predeps = false; // Must finish before rules without this flag start
    bool no_clean = false;       // `clean` leaves the outputs alone
};

/**
 * Declarative compilation rule
 */
struct BuildRule {
    std::string name;
    std::vector<fs::path> inputs;
    std::string tool;
    std::string output_pattern = DEFAULT_OUTPUT_PATTERN;
    std::string command_template;
    fs::path output_dir;
    std::string extension = ".qm";
    std::string encoding = "UTF-8";
    RuleFlags flags;
};

/**
 * One rule applied to one input
 */
struct BuildStep {
    std::string rule;
    fs::path input;
    fs::path output;
    std::string command;
};

using TemplateVars = std::map<std::string, std::string, std::less<>>;

/// Substitute `{name}` placeholders from `vars`.
std::string expand_template(std::string_view tmpl, const TemplateVars& vars);

/// Quote `arg` for the host shell when it contains whitespace or shell
/// metacharacters; returns it unchanged otherwise.
std::string shell_quote(std::string_view arg, Platform platform = host_platform());

/// Command template used for translations.
/// `{tool} -silent {in} -qm {out} -codecfortr {encoding}`, without
/// `-silent` when `silent` is false.
std::string default_command_template(bool silent);

/// Output path of `input` under `rule`.
fs::path output_for(const BuildRule& rule, const fs::path& input);

/// One step per input, in input order. Pure: depends only on its arguments.
std::vector<BuildStep> expand_rule(const BuildRule& rule);

/// Check a rule before registration.
/// @return Error message, or std::nullopt when valid
std::optional<std::string> validate_rule(const BuildRule& rule);

/// The `.ts` -> `.qm` rule described by a manifest, invoking `tool`.
/// Flagged no_link and target_predeps.
BuildRule make_translation_rule(const manifest::Manifest& manifest, const std::string& tool);

} // namespace tsbuild::rules

#endif // TSBUILD_RULES_BUILD_RULE_HPP
