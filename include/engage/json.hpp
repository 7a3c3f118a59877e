#pragma once

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <locale>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace engage {

class Json {
public:
    using object_t = std::map<std::string, Json>;
    using array_t = std::vector<Json>;
    using value_t = std::variant<std::nullptr_t, bool, double, std::string, object_t, array_t>;

    Json() : value_(nullptr) {}
    Json(std::nullptr_t) : value_(nullptr) {}
    Json(bool v) : value_(v) {}
    Json(int v) : value_(static_cast<double>(v)) {}
    Json(double v) : value_(v) {}
    Json(const char *v) : value_(std::string(v)) {}
    Json(std::string v) : value_(std::move(v)) {}
    Json(object_t v) : value_(std::move(v)) {}
    Json(array_t v) : value_(std::move(v)) {}

    static Json object() { return Json(object_t{}); }
    static Json array() { return Json(array_t{}); }

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
    bool is_boolean() const { return std::holds_alternative<bool>(value_); }
    bool is_number() const { return std::holds_alternative<double>(value_); }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_object() const { return std::holds_alternative<object_t>(value_); }
    bool is_array() const { return std::holds_alternative<array_t>(value_); }

    const object_t &as_object() const { return std::get<object_t>(value_); }
    object_t &as_object() { return std::get<object_t>(value_); }
    const array_t &as_array() const { return std::get<array_t>(value_); }
    array_t &as_array() { return std::get<array_t>(value_); }
    const std::string &as_string() const { return std::get<std::string>(value_); }
    double as_number() const { return std::get<double>(value_); }
    int as_int() const { return static_cast<int>(std::lround(as_number())); }
    bool as_bool() const { return std::get<bool>(value_); }

    const Json &operator[](const std::string &key) const {
        const auto &obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) {
            throw std::out_of_range("key not found: " + key);
        }
        return it->second;
    }

    Json &operator[](const std::string &key) {
        if (is_null()) {
            value_ = object_t{};
        }
        return as_object()[key];
    }

    const Json &operator[](std::size_t index) const {
        const auto &arr = as_array();
        if (index >= arr.size()) {
            throw std::out_of_range("array index out of range");
        }
        return arr[index];
    }

    void push_back(Json value) {
        if (is_null()) {
            value_ = array_t{};
        }
        as_array().push_back(std::move(value));
    }

    bool contains(const std::string &key) const {
        if (!is_object()) {
            return false;
        }
        const auto &obj = as_object();
        return obj.find(key) != obj.end();
    }

    // Typed lookups on objects; a missing or null key yields the fallback,
    // a key of the wrong type is a configuration error.
    std::string get_string(const std::string &key, const std::string &fallback = {}) const {
        if (!contains(key) || (*this)[key].is_null()) {
            return fallback;
        }
        const Json &v = (*this)[key];
        if (!v.is_string()) {
            throw std::runtime_error("expected string for key: " + key);
        }
        return v.as_string();
    }

    double get_number(const std::string &key, double fallback = 0.0) const {
        if (!contains(key) || (*this)[key].is_null()) {
            return fallback;
        }
        const Json &v = (*this)[key];
        if (!v.is_number()) {
            throw std::runtime_error("expected number for key: " + key);
        }
        return v.as_number();
    }

    int get_int(const std::string &key, int fallback = 0) const {
        return static_cast<int>(std::lround(get_number(key, static_cast<double>(fallback))));
    }

    bool get_bool(const std::string &key, bool fallback = false) const {
        if (!contains(key) || (*this)[key].is_null()) {
            return fallback;
        }
        const Json &v = (*this)[key];
        if (!v.is_boolean()) {
            throw std::runtime_error("expected boolean for key: " + key);
        }
        return v.as_bool();
    }

    std::string dump(int indent = -1) const {
        std::string out;
        dump_impl(out, indent, 0);
        return out;
    }

    static Json parse(const std::string &text);
    static Json parse_file(const std::string &path);

private:
    value_t value_;

    void dump_impl(std::string &out, int indent, int depth) const;
    static void dump_string(std::string &out, const std::string &s);
    static void dump_number(std::string &out, double v);
};

class JsonParser {
public:
    explicit JsonParser(const std::string &text) : s_(text) {}

    Json parse();

private:
    const std::string &s_;
    std::size_t pos_{0};

    void skip_ws();
    char peek() const;
    bool consume(char expected);
    [[noreturn]] void fail(const std::string &what) const;
    Json parse_value();
    Json parse_object();
    Json parse_array();
    std::string parse_string();
    unsigned parse_hex4();
    Json parse_literal();
    Json parse_number();
};

inline Json Json::parse(const std::string &text) {
    JsonParser parser(text);
    return parser.parse();
}

inline Json Json::parse_file(const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    try {
        return parse(content);
    } catch (const std::exception &ex) {
        throw std::runtime_error(path + ": " + ex.what());
    }
}

inline void Json::dump_string(std::string &out, const std::string &s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
}

inline void Json::dump_number(std::string &out, double v) {
    if (!std::isfinite(v)) {
        out += "null";
        return;
    }
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        out += std::to_string(static_cast<long long>(v));
        return;
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << v;
    out += oss.str();
}

inline void Json::dump_impl(std::string &out, int indent, int depth) const {
    if (is_null()) {
        out += "null";
        return;
    }
    if (is_boolean()) {
        out += as_bool() ? "true" : "false";
        return;
    }
    if (is_number()) {
        dump_number(out, as_number());
        return;
    }
    if (is_string()) {
        dump_string(out, as_string());
        return;
    }
    if (is_array()) {
        out.push_back('[');
        const auto &arr = as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            if (indent >= 0) {
                out.push_back('\n');
                out.append((depth + 1) * indent, ' ');
            }
            arr[i].dump_impl(out, indent, depth + 1);
        }
        if (!arr.empty() && indent >= 0) {
            out.push_back('\n');
            out.append(depth * indent, ' ');
        }
        out.push_back(']');
        return;
    }
    out.push_back('{');
    const auto &obj = as_object();
    std::size_t count = 0;
    for (const auto &kv : obj) {
        if (count++ > 0) {
            out.push_back(',');
        }
        if (indent >= 0) {
            out.push_back('\n');
            out.append((depth + 1) * indent, ' ');
        }
        dump_string(out, kv.first);
        out.push_back(':');
        if (indent >= 0) {
            out.push_back(' ');
        }
        kv.second.dump_impl(out, indent, depth + 1);
    }
    if (!obj.empty() && indent >= 0) {
        out.push_back('\n');
        out.append(depth * indent, ' ');
    }
    out.push_back('}');
}

inline void JsonParser::skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
        ++pos_;
    }
}

inline char JsonParser::peek() const {
    if (pos_ >= s_.size()) {
        return '\0';
    }
    return s_[pos_];
}

inline bool JsonParser::consume(char expected) {
    skip_ws();
    if (peek() != expected) {
        return false;
    }
    ++pos_;
    return true;
}

inline void JsonParser::fail(const std::string &what) const {
    throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) + ": " + what);
}

inline Json JsonParser::parse() {
    Json value = parse_value();
    skip_ws();
    if (pos_ != s_.size()) {
        fail("unexpected trailing characters");
    }
    return value;
}

inline Json JsonParser::parse_value() {
    skip_ws();
    char c = peek();
    if (c == '"') {
        return Json(parse_string());
    }
    if (c == '{') {
        return parse_object();
    }
    if (c == '[') {
        return parse_array();
    }
    if (c == 't' || c == 'f' || c == 'n') {
        return parse_literal();
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parse_number();
    }
    fail("invalid value");
}

inline Json JsonParser::parse_object() {
    if (!consume('{')) {
        fail("expected '{'");
    }
    Json::object_t obj;
    if (consume('}')) {
        return obj;
    }
    while (true) {
        skip_ws();
        if (peek() != '"') {
            fail("expected string key");
        }
        std::string key = parse_string();
        if (!consume(':')) {
            fail("expected ':' after key");
        }
        obj[std::move(key)] = parse_value();
        if (consume('}')) {
            break;
        }
        if (!consume(',')) {
            fail("expected ',' in object");
        }
    }
    return obj;
}

inline Json JsonParser::parse_array() {
    if (!consume('[')) {
        fail("expected '['");
    }
    Json::array_t arr;
    if (consume(']')) {
        return arr;
    }
    while (true) {
        arr.emplace_back(parse_value());
        if (consume(']')) {
            break;
        }
        if (!consume(',')) {
            fail("expected ',' in array");
        }
    }
    return arr;
}

inline unsigned JsonParser::parse_hex4() {
    if (pos_ + 4 > s_.size()) {
        fail("truncated \\u escape");
    }
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
        char h = s_[pos_++];
        code <<= 4;
        if (h >= '0' && h <= '9') {
            code |= static_cast<unsigned>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            code |= static_cast<unsigned>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            code |= static_cast<unsigned>(h - 'A' + 10);
        } else {
            fail("invalid hex digit in \\u escape");
        }
    }
    return code;
}

inline std::string JsonParser::parse_string() {
    if (!consume('"')) {
        fail("expected string opening quote");
    }
    std::string out;
    while (true) {
        if (pos_ >= s_.size()) {
            fail("unterminated string");
        }
        char c = s_[pos_++];
        if (c == '"') {
            break;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos_ >= s_.size()) {
            fail("invalid escape sequence");
        }
        char esc = s_[pos_++];
        switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
            unsigned cp = parse_hex4();
            if (cp >= 0xD800 && cp <= 0xDBFF && s_.compare(pos_, 2, "\\u") == 0) {
                pos_ += 2;
                unsigned low = parse_hex4();
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            break;
        }
        default:
            fail("unsupported escape sequence");
        }
    }
    return out;
}

inline Json JsonParser::parse_literal() {
    if (s_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return Json(true);
    }
    if (s_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return Json(false);
    }
    if (s_.compare(pos_, 4, "null") == 0) {
        pos_ += 4;
        return Json(nullptr);
    }
    fail("invalid literal");
}

inline Json JsonParser::parse_number() {
    std::size_t start = pos_;
    auto digits = [this]() {
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    };
    if (s_[pos_] == '-') {
        ++pos_;
    }
    digits();
    if (pos_ < s_.size() && s_[pos_] == '.') {
        ++pos_;
        digits();
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
        ++pos_;
        if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) {
            ++pos_;
        }
        digits();
    }
    std::istringstream iss(s_.substr(start, pos_ - start));
    iss.imbue(std::locale::classic());
    double value = 0.0;
    if (!(iss >> value)) {
        fail("invalid number");
    }
    return Json(value);
}

} // namespace engage
