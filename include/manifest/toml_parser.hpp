//! # TOML Subset Parser
//!
//! Tokenizes `translations.toml` into sections of typed key/value pairs.
//! Mapping those values onto the Manifest lives in manifest.cpp.
//!
//! ## Supported Syntax
//!
//! | Construct      | Example                              |
//! |----------------|--------------------------------------|
//! | Section        | `[translations]`                     |
//! | String         | `output_dir = "bin/translations"`    |
//! | Literal string | `command = 'lrelease {in}'`          |
//! | Integer        | `jobs = 4`                           |
//! | Boolean        | `silent = true`                      |
//! | String array   | `sources = ["a.ts", "b.ts"]`         |
//! | Comment        | `# anything until end of line`       |
//!
//! Arrays may span several lines and may end with a trailing comma.

#ifndef TSBUILD_MANIFEST_TOML_PARSER_HPP
#define TSBUILD_MANIFEST_TOML_PARSER_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tsbuild::manifest {

/// A parsed value together with the line it was defined on.
struct TomlValue {
    std::variant<std::string, int64_t, bool, std::vector<std::string>> data;
    int line = 0;

    bool is_string() const {
        return std::holds_alternative<std::string>(data);
    }
    bool is_integer() const {
        return std::holds_alternative<int64_t>(data);
    }
    bool is_bool() const {
        return std::holds_alternative<bool>(data);
    }
    bool is_array() const {
        return std::holds_alternative<std::vector<std::string>>(data);
    }

    /// Human-readable type name used in error messages.
    const char* type_name() const;
};

using TomlTable = std::map<std::string, TomlValue>;

/// Parsed document. Keys outside any section land in the "" table.
struct TomlDocument {
    std::map<std::string, TomlTable> sections;
    std::map<std::string, int> section_lines;
};

/**
 * Hand-written parser for the subset of TOML used by manifests.
 *
 * Errors are reported as "line N: message".
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(std::string content);

    [[nodiscard]] Result<TomlDocument> parse();

private:
    std::string content_;
    size_t pos_ = 0;
    int line_ = 1;
    std::string error_;

    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    void skip_inline_whitespace();
    void skip_comment();
    /// Skips whitespace, newlines and comments.
    void skip_trivia();
    bool at_line_end();

    bool fail(const std::string& message);

    bool parse_section_header(std::string* out_name);
    bool parse_key(std::string* out_key);
    bool parse_value(TomlValue* out_value);
    bool parse_string(std::string* out_str);
    bool parse_integer(int64_t* out_int);
    bool parse_array(std::vector<std::string>* out_array);
};

} // namespace tsbuild::manifest

#endif // TSBUILD_MANIFEST_TOML_PARSER_HPP
