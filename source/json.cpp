// json.cpp - JSON serialization / deserialization for Value

#include <keydiff/json.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace keydiff {

namespace {

// JSON escape special characters in strings
std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::setprecision(17) << arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
                return;
            }
            std::vector<const ValueMap::value_type*> entries;
            entries.reserve(arg.size());
            for (const auto& kv : arg) {
                entries.push_back(&kv);
            }
            std::sort(entries.begin(), entries.end(),
                      [](const auto* a, const auto* b) { return a->first < b->first; });

            oss << "{" << newline;
            bool first = true;
            for (const auto* kv : entries) {
                if (!first) oss << "," << newline;
                first = false;
                oss << child_indent << "\"" << json_escape_string(kv->first) << "\":" << space_after_colon;
                to_json_impl(*kv->second, oss, compact, indent_level + 1);
            }
            oss << newline << indent << "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
                return;
            }
            oss << "[" << newline;
            bool first = true;
            for (const auto& v : arg) {
                if (!first) oss << "," << newline;
                first = false;
                oss << child_indent;
                to_json_impl(*v, oss, compact, indent_level + 1);
            }
            oss << newline << indent << "]";
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    JsonParser(const std::string& json) : json_(json), pos_(0), depth_(0) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                if (error_out) *error_out = "Empty JSON input";
                return Value{};
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing characters at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    const std::string& json_;
    std::size_t pos_;
    std::size_t depth_;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    bool at_digit() const {
        return pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]));
    }

    void skip_whitespace() {
        // JSON whitespace only: space, tab, LF, CR
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        if (pos_ >= json_.size()) {
            throw std::runtime_error("Unexpected end of input at position " + std::to_string(pos_));
        }
        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    void enter_container() {
        if (++depth_ > KEYDIFF_JSON_MAX_DEPTH) {
            throw std::runtime_error("Nesting too deep at position " + std::to_string(pos_));
        }
    }

    Value parse_object() {
        expect('{');
        enter_container();
        skip_whitespace();

        if (peek() == '}') {
            consume();
            --depth_;
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            transient.set(std::move(key), ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return Value{transient.persistent()};
    }

    Value parse_array() {
        expect('[');
        enter_container();
        skip_whitespace();

        if (peek() == ']') {
            consume();
            --depth_;
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return Value{transient.persistent()};
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = json_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else throw std::runtime_error("Invalid hex digit in unicode escape at position " + std::to_string(pos_ - 1));
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                throw std::runtime_error("Unescaped control character in string at position " + std::to_string(pos_ - 1));
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        unsigned codepoint = parse_hex4();
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                            // High surrogate: a \uDC00-\uDFFF low surrogate must follow
                            if (json_.compare(pos_, 2, "\\u") != 0) {
                                throw std::runtime_error("Unpaired surrogate at position " + std::to_string(pos_));
                            }
                            pos_ += 2;
                            const unsigned low = parse_hex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                throw std::runtime_error("Invalid low surrogate at position " + std::to_string(pos_));
                            }
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                            throw std::runtime_error("Unpaired surrogate at position " + std::to_string(pos_));
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
                }
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    // Underflow yields the nearest representable value (subnormal or zero)
    static double to_double(const std::string& num_str, std::size_t start) {
        errno = 0;
        const double val = std::strtod(num_str.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(val)) {
            throw std::runtime_error("Number out of range at position " + std::to_string(start));
        }
        return val;
    }

    Value parse_number() {
        const std::size_t start = pos_;
        bool is_integer = true;

        if (peek() == '-') consume();

        if (!at_digit()) {
            throw std::runtime_error("Expected digit at position " + std::to_string(pos_));
        }
        if (peek() == '0') {
            consume();
            if (at_digit()) {
                throw std::runtime_error("Leading zero in number at position " + std::to_string(start));
            }
        } else {
            while (at_digit()) consume();
        }

        if (peek() == '.') {
            is_integer = false;
            consume();
            if (!at_digit()) {
                throw std::runtime_error("Expected digit after '.' at position " + std::to_string(pos_));
            }
            while (at_digit()) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            is_integer = false;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!at_digit()) {
                throw std::runtime_error("Expected digit in exponent at position " + std::to_string(pos_));
            }
            while (at_digit()) consume();
        }

        const std::string num_str = json_.substr(start, pos_ - start);

        if (!is_integer) {
            return Value{to_double(num_str, start)};
        }
        try {
            const long long val = std::stoll(num_str);
            if (val >= INT32_MIN && val <= INT32_MAX) {
                return Value{static_cast<int32_t>(val)};
            }
            return Value{static_cast<int64_t>(val)};
        } catch (const std::out_of_range&) {
            // Beyond int64_t: keep the magnitude as a double
            return Value{to_double(num_str, start)};
        }
    }

    Value parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(const std::string& json_str, std::string* error_out) {
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

} // namespace keydiff
