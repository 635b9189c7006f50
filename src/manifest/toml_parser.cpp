#include "manifest/toml_parser.hpp"

#include <cctype>
#include <charconv>

namespace tsbuild::manifest {

const char* TomlValue::type_name() const {
    if (is_string())
        return "string";
    if (is_integer())
        return "integer";
    if (is_bool())
        return "boolean";
    return "array";
}

static bool is_bare_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

SimpleTomlParser::SimpleTomlParser(std::string content) : content_(std::move(content)) {}

char SimpleTomlParser::advance() {
    char c = content_[pos_++];
    if (c == '\n') {
        line_++;
    }
    return c;
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() != '#')
        return;
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

void SimpleTomlParser::skip_trivia() {
    while (!is_eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '#') {
            skip_comment();
        } else {
            break;
        }
    }
}

bool SimpleTomlParser::at_line_end() {
    skip_inline_whitespace();
    skip_comment();
    return is_eof() || peek() == '\n';
}

bool SimpleTomlParser::fail(const std::string& message) {
    error_ = "line " + std::to_string(line_) + ": " + message;
    return false;
}

Result<TomlDocument> SimpleTomlParser::parse() {
    TomlDocument doc;
    std::string current;

    for (;;) {
        skip_trivia();
        if (is_eof())
            break;

        if (peek() == '[') {
            int header_line = line_;
            std::string name;
            if (!parse_section_header(&name))
                return error_;
            if (doc.section_lines.count(name)) {
                fail("duplicate section [" + name + "]");
                return error_;
            }
            doc.sections[name];
            doc.section_lines[name] = header_line;
            current = std::move(name);
        } else {
            TomlValue value;
            value.line = line_;

            std::string key;
            if (!parse_key(&key))
                return error_;
            skip_inline_whitespace();
            if (peek() != '=') {
                fail("expected '=' after key '" + key + "'");
                return error_;
            }
            advance();
            skip_inline_whitespace();
            if (!parse_value(&value))
                return error_;

            TomlTable& table = doc.sections[current];
            if (table.count(key)) {
                fail("duplicate key '" + key + "'");
                return error_;
            }
            table.emplace(std::move(key), std::move(value));
        }

        if (!at_line_end()) {
            fail(std::string("unexpected character '") + peek() + "'");
            return error_;
        }
    }

    return doc;
}

bool SimpleTomlParser::parse_section_header(std::string* out_name) {
    advance(); // '['
    skip_inline_whitespace();
    if (peek() == '[')
        return fail("arrays of tables are not supported");

    std::string name;
    while (!is_eof() && (is_bare_key_char(peek()) || peek() == '.')) {
        name += advance();
    }
    if (name.empty())
        return fail("expected section name");

    skip_inline_whitespace();
    if (peek() != ']')
        return fail("expected ']' after section name");
    advance();

    *out_name = std::move(name);
    return true;
}

bool SimpleTomlParser::parse_key(std::string* out_key) {
    if (peek() == '"' || peek() == '\'') {
        if (!parse_string(out_key))
            return false;
    } else {
        std::string key;
        while (!is_eof() && is_bare_key_char(peek())) {
            key += advance();
        }
        *out_key = std::move(key);
    }

    if (out_key->empty())
        return fail("expected key");
    return true;
}

bool SimpleTomlParser::parse_value(TomlValue* out_value) {
    char c = peek();

    if (c == '"' || c == '\'') {
        std::string str;
        if (!parse_string(&str))
            return false;
        out_value->data = std::move(str);
        return true;
    }
    if (c == '[') {
        std::vector<std::string> array;
        if (!parse_array(&array))
            return false;
        out_value->data = std::move(array);
        return true;
    }
    if (content_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        out_value->data = true;
        return true;
    }
    if (content_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        out_value->data = false;
        return true;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+') {
        int64_t value = 0;
        if (!parse_integer(&value))
            return false;
        out_value->data = value;
        return true;
    }

    return fail("expected a value");
}

bool SimpleTomlParser::parse_string(std::string* out_str) {
    char quote = advance();
    std::string str;

    for (;;) {
        if (is_eof() || peek() == '\n')
            return fail("unterminated string");

        char c = advance();
        if (c == quote)
            break;

        // Literal strings ('...') have no escapes
        if (c == '\\' && quote == '"') {
            if (is_eof())
                return fail("unterminated string");
            char esc = advance();
            switch (esc) {
            case '"':
                str += '"';
                break;
            case '\\':
                str += '\\';
                break;
            case 'n':
                str += '\n';
                break;
            case 't':
                str += '\t';
                break;
            case 'r':
                str += '\r';
                break;
            default:
                return fail(std::string("invalid escape sequence '\\") + esc + "'");
            }
            continue;
        }

        str += c;
    }

    *out_str = std::move(str);
    return true;
}

bool SimpleTomlParser::parse_integer(int64_t* out_int) {
    std::string digits;
    if (peek() == '+' || peek() == '-') {
        if (peek() == '-') {
            digits += '-';
        }
        advance();
    }
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_') {
            digits += c;
        }
    }

    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), *out_int);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
        return fail("invalid integer '" + digits + "'");
    return true;
}

bool SimpleTomlParser::parse_array(std::vector<std::string>* out_array) {
    advance(); // '['

    for (;;) {
        skip_trivia();
        if (is_eof())
            return fail("unterminated array");
        if (peek() == ']') {
            advance();
            return true;
        }
        if (peek() != '"' && peek() != '\'')
            return fail("only arrays of strings are supported");

        std::string item;
        if (!parse_string(&item))
            return false;
        out_array->push_back(std::move(item));

        skip_trivia();
        if (peek() == ',') {
            advance();
        } else if (peek() == ']') {
            advance();
            return true;
        } else if (is_eof()) {
            return fail("unterminated array");
        } else {
            return fail("expected ',' or ']' in array");
        }
    }
}

} // namespace tsbuild::manifest
