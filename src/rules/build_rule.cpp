#include "rules/build_rule.hpp"

#include "manifest/manifest.hpp"

#include <set>

namespace tsbuild::rules {

std::string expand_template(std::string_view tmpl, const TemplateVars& vars) {
    std::string result;
    result.reserve(tmpl.size() + 64);

    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i + 1);
            if (close != std::string_view::npos) {
                auto token = tmpl.substr(i + 1, close - i - 1);
                auto it = vars.find(token);
                if (it != vars.end()) {
                    result += it->second;
                } else {
                    result += tmpl.substr(i, close - i + 1);
                }
                i = close + 1;
                continue;
            }
        }
        result += tmpl[i++];
    }

    return result;
}

std::string shell_quote(std::string_view arg, Platform platform) {
    if (platform == Platform::Windows) {
        if (!arg.empty() && arg.find_first_of(" \t\"&|<>^") == std::string_view::npos)
            return std::string(arg);

        std::string quoted = "\"";
        for (char c : arg) {
            if (c == '"') {
                quoted += '\\';
            }
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    bool safe = !arg.empty();
    for (char c : arg) {
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                     std::string_view("_@%+=:,./-").find(c) != std::string_view::npos;
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe)
        return std::string(arg);

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string default_command_template(bool silent) {
    return silent ? "{tool} -silent {in} -qm {out} -codecfortr {encoding}"
                  : "{tool} {in} -qm {out} -codecfortr {encoding}";
}

fs::path output_for(const BuildRule& rule, const fs::path& input) {
    std::string out_dir = rule.output_dir.empty() ? "." : rule.output_dir.generic_string();

    TemplateVars vars = {
        {"out_dir", out_dir},
        {"base", input.stem().string()},
        {"ext", rule.extension},
    };
    return fs::path(expand_template(rule.output_pattern, vars)).lexically_normal();
}

std::vector<BuildStep> expand_rule(const BuildRule& rule) {
    std::vector<BuildStep> steps;
    steps.reserve(rule.inputs.size());

    std::string out_dir = rule.output_dir.empty() ? "." : rule.output_dir.string();

    for (const auto& input : rule.inputs) {
        BuildStep step;
        step.rule = rule.name;
        step.input = input;
        step.output = output_for(rule, input);

        TemplateVars vars = {
            {"tool", shell_quote(rule.tool)},
            {"in", shell_quote(input.string())},
            {"out", shell_quote(step.output.string())},
            {"out_dir", shell_quote(out_dir)},
            {"base", input.stem().string()},
            {"ext", rule.extension},
            {"encoding", rule.encoding},
        };
        step.command = expand_template(rule.command_template, vars);

        steps.push_back(std::move(step));
    }

    return steps;
}

std::optional<std::string> validate_rule(const BuildRule& rule) {
    if (rule.name.empty())
        return "rule has no name";
    if (rule.command_template.empty())
        return "rule '" + rule.name + "' has no command";
    if (rule.output_pattern.empty())
        return "rule '" + rule.name + "' has no output pattern";
    if (rule.tool.empty() && rule.command_template.find("{tool}") != std::string::npos)
        return "rule '" + rule.name + "' uses {tool} but no tool was resolved";

    std::set<fs::path> outputs;
    for (const auto& input : rule.inputs) {
        fs::path output = output_for(rule, input);
        if (!outputs.insert(output).second)
            return "rule '" + rule.name + "' maps several inputs to '" + output.string() + "'";
    }

    return std::nullopt;
}

BuildRule make_translation_rule(const manifest::Manifest& manifest, const std::string& tool) {
    BuildRule rule;
    rule.name = TRANSLATION_RULE_NAME;
    rule.inputs = manifest.source_paths();
    rule.tool = tool;
    rule.output_dir = manifest.output_path();
    rule.extension = manifest.translations.extension;
    rule.encoding = manifest.translations.source_encoding;
    rule.command_template = manifest.build.command.empty()
                                ? default_command_template(manifest.build.silent)
                                : manifest.build.command;
    rule.flags.no_link = true;
    rule.flags.target_predeps = true;
    return rule;
}

} // namespace tsbuild::rules
