//! # Manifest Loading
//!
//! Maps the sections produced by SimpleTomlParser onto Manifest and checks
//! the constraints the rest of the build relies on:
//!
//! - at least one translation source, none listed twice
//! - no two sources sharing a base name (they would write the same catalog)
//! - a non-empty output directory and an extension starting with '.'

#include "manifest/manifest.hpp"

#include "log/log.hpp"

#include <fstream>
#include <initializer_list>
#include <map>
#include <sstream>

namespace tsbuild::manifest {

namespace {

/// Typed accessors over one section, remembering the first error.
class SectionReader {
public:
    SectionReader(const TomlTable& table, std::string section)
        : table_(table), section_(std::move(section)) {}

    bool read(const char* key, std::string* out) {
        const TomlValue* value = find(key);
        if (!value)
            return true;
        if (!value->is_string())
            return type_error(*value, key, "a string");
        *out = std::get<std::string>(value->data);
        return true;
    }

    bool read(const char* key, int* out) {
        const TomlValue* value = find(key);
        if (!value)
            return true;
        if (!value->is_integer())
            return type_error(*value, key, "an integer");
        int64_t v = std::get<int64_t>(value->data);
        if (v < 0 || v > 1024) {
            error_ = "line " + std::to_string(value->line) + ": [" + section_ + "] " + key +
                     " is out of range";
            return false;
        }
        *out = static_cast<int>(v);
        return true;
    }

    bool read(const char* key, bool* out) {
        const TomlValue* value = find(key);
        if (!value)
            return true;
        if (!value->is_bool())
            return type_error(*value, key, "a boolean");
        *out = std::get<bool>(value->data);
        return true;
    }

    bool read(const char* key, std::vector<std::string>* out) {
        const TomlValue* value = find(key);
        if (!value)
            return true;
        if (!value->is_array())
            return type_error(*value, key, "an array of strings");
        *out = std::get<std::vector<std::string>>(value->data);
        return true;
    }

    void warn_unknown(std::initializer_list<const char*> known) const {
        for (const auto& [key, value] : table_) {
            bool found = false;
            for (const char* k : known) {
                if (key == k) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                TSBUILD_LOG_WARN("manifest", "line " << value.line << ": ignoring unknown key '"
                                                     << key << "' in [" << section_ << "]");
            }
        }
    }

    const std::string& error() const {
        return error_;
    }

private:
    const TomlTable& table_;
    std::string section_;
    std::string error_;

    const TomlValue* find(const char* key) const {
        auto it = table_.find(key);
        return it != table_.end() ? &it->second : nullptr;
    }

    bool type_error(const TomlValue& value, const char* key, const char* expected) {
        error_ = "line " + std::to_string(value.line) + ": [" + section_ + "] " + key +
                 " must be " + expected + ", found " + value.type_name();
        return false;
    }
};

} // namespace

Result<Manifest> Manifest::parse(const std::string& content, const fs::path& base_dir) {
    SimpleTomlParser parser(content);
    auto doc_result = parser.parse();
    if (is_err(doc_result))
        return unwrap_err(doc_result);
    const TomlDocument& doc = unwrap(doc_result);

    Manifest manifest;
    manifest.base_dir = base_dir;

    for (const auto& [name, table] : doc.sections) {
        if (name.empty()) {
            if (!table.empty()) {
                int line = table.begin()->second.line;
                return "line " + std::to_string(line) + ": keys must be inside a section";
            }
            continue;
        }

        SectionReader reader(table, name);
        bool ok = true;

        if (name == "project") {
            ok = reader.read("name", &manifest.project.name);
            reader.warn_unknown({"name"});
        } else if (name == "translations") {
            auto& t = manifest.translations;
            ok = reader.read("sources", &t.sources) && reader.read("output_dir", &t.output_dir) &&
                 reader.read("extension", &t.extension) &&
                 reader.read("source_encoding", &t.source_encoding);
            reader.warn_unknown({"sources", "output_dir", "extension", "source_encoding"});
        } else if (name == "tool") {
            ok = reader.read("lrelease", &manifest.tool.lrelease) &&
                 reader.read("fallbacks", &manifest.tool.fallbacks);
            reader.warn_unknown({"lrelease", "fallbacks"});
        } else if (name == "build") {
            auto& b = manifest.build;
            ok = reader.read("jobs", &b.jobs) && reader.read("silent", &b.silent) &&
                 reader.read("command", &b.command);
            reader.warn_unknown({"jobs", "silent", "command"});
        } else {
            return "line " + std::to_string(doc.section_lines.at(name)) + ": unknown section [" +
                   name + "]";
        }

        if (!ok)
            return reader.error();
    }

    if (!doc.section_lines.count("translations"))
        return std::string("missing [translations] section");

    if (auto error = manifest.validate())
        return *error;

    TSBUILD_LOG_DEBUG("manifest", "Loaded " << manifest.translations.sources.size()
                                            << " translation source(s)");
    return manifest;
}

Result<Manifest> Manifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file)
        return "cannot open manifest '" + path.string() + "'";

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str(), path.parent_path());
    if (is_err(result))
        return path.string() + ": " + unwrap_err(result);
    return result;
}

Result<Manifest> Manifest::load_from_current_dir() {
    return load(fs::current_path() / MANIFEST_FILENAME);
}

std::optional<std::string> Manifest::validate() const {
    const auto& t = translations;

    if (t.sources.empty())
        return "[translations] sources must list at least one file";
    if (t.output_dir.empty())
        return "[translations] output_dir must not be empty";
    if (t.extension.size() < 2 || t.extension[0] != '.')
        return "[translations] extension must start with '.'";
    if (t.source_encoding.empty())
        return "[translations] source_encoding must not be empty";

    std::map<std::string, std::string> seen_paths;
    std::map<std::string, std::string> seen_outputs;
    for (const auto& source : t.sources) {
        if (source.empty())
            return "[translations] sources must not contain empty paths";

        std::string normal = fs::path(source).lexically_normal().generic_string();
        if (!seen_paths.emplace(normal, source).second)
            return "[translations] source '" + source + "' is listed twice";

        std::string output = fs::path(source).stem().string() + t.extension;
        auto [it, inserted] = seen_outputs.emplace(output, source);
        if (!inserted)
            return "[translations] sources '" + it->second + "' and '" + source +
                   "' both produce '" + output + "'";
    }

    for (const auto& fallback : tool.fallbacks) {
        if (fallback.empty())
            return "[tool] fallbacks must not contain empty names";
    }

    return std::nullopt;
}

std::vector<fs::path> Manifest::source_paths() const {
    std::vector<fs::path> paths;
    paths.reserve(translations.sources.size());
    for (const auto& source : translations.sources) {
        fs::path p(source);
        paths.push_back(p.is_absolute() || base_dir.empty() ? p : base_dir / p);
    }
    return paths;
}

fs::path Manifest::output_path() const {
    fs::path p(translations.output_dir);
    return p.is_absolute() || base_dir.empty() ? p : base_dir / p;
}

} // namespace tsbuild::manifest
