#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <functional>
#include <sstream>
#include <iomanip>

namespace {

struct Scanner {
    const std::string& js;
    size_t i = 0;

    explicit Scanner(const std::string& s) : js(s) {}

    bool at_end() { ws(); return i >= js.size(); }

    void ws() {
        while (i < js.size() && std::isspace(static_cast<unsigned char>(js[i]))) ++i;
    }

    char peek() {
        ws();
        if (i >= js.size()) throw std::runtime_error("unexpected end of json");
        return js[i];
    }

    void expect(char c) {
        if (peek() != c) throw std::runtime_error(std::string("expected '") + c + "' in json");
        ++i;
    }

    static void append_utf8(std::string& out, uint32_t code) {
        if (code <= 0x7f) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7ff) {
            out.push_back(static_cast<char>(0xc0 | ((code >> 6) & 0x1f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        } else if (code <= 0xffff) {
            out.push_back(static_cast<char>(0xe0 | ((code >> 12) & 0x0f)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        } else {
            out.push_back(static_cast<char>(0xf0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        }
    }

    uint32_t hex4() {
        if (i + 4 > js.size()) throw std::runtime_error("invalid unicode escape in json string");
        uint32_t code = 0;
        for (size_t k = 0; k < 4; ++k) {
            char ch = js[i + k];
            code <<= 4;
            if (ch >= '0' && ch <= '9') code += ch - '0';
            else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
            else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
            else throw std::runtime_error("invalid hex in unicode escape");
        }
        i += 4;
        return code;
    }

    std::string string() {
        expect('"');
        std::string out;
        for (;;) {
            if (i >= js.size()) throw std::runtime_error("unterminated json string");
            char c = js[i++];
            if (c == '"') return out;
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= js.size()) throw std::runtime_error("unterminated escape in json string");
            char e = js[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t code = hex4();
                    if (code >= 0xd800 && code <= 0xdbff) {
                        if (i + 6 > js.size() || js[i] != '\\' || js[i + 1] != 'u') throw std::runtime_error("lone surrogate in json string");
                        i += 2;
                        uint32_t low = hex4();
                        if (low < 0xdc00 || low > 0xdfff) throw std::runtime_error("bad surrogate pair in json string");
                        code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
        }
    }

    std::string literal() {
        ws();
        size_t start = i;
        while (i < js.size()) {
            char c = js[i];
            if (c == ',' || c == '}' || c == ']' || c == ':' || std::isspace(static_cast<unsigned char>(c))) break;
            ++i;
        }
        if (i == start) throw std::runtime_error("missing json value");
        return js.substr(start, i - start);
    }

    void skip_value() {
        char c = peek();
        if (c == '"') { string(); return; }
        if (c == '{' || c == '[') {
            char close = c == '{' ? '}' : ']';
            ++i;
            if (peek() == close) { ++i; return; }
            for (;;) {
                if (close == '}') {
                    string();
                    expect(':');
                }
                skip_value();
                char n = peek();
                ++i;
                if (n == close) return;
                if (n != ',') throw std::runtime_error("expected ',' in json");
            }
        }
        literal();
    }
};

// Calls fn(key, value_begin, value_end) for each member of the outermost object until fn returns true.
void for_each_member(const std::string& js, const std::function<bool(const std::string&, size_t, size_t)>& fn) {
    Scanner sc(js);
    sc.expect('{');
    if (sc.peek() == '}') return;
    for (;;) {
        std::string key = sc.string();
        sc.expect(':');
        sc.ws();
        size_t begin = sc.i;
        sc.skip_value();
        if (fn(key, begin, sc.i)) return;
        char n = sc.peek();
        ++sc.i;
        if (n == '}') return;
        if (n != ',') throw std::runtime_error("expected ',' between json members");
    }
}

std::optional<std::string> raw_member(const std::string& js, const std::string& key) {
    std::optional<std::string> out;
    for_each_member(js, [&](const std::string& k, size_t b, size_t e) {
        if (k != key) return false;
        out = js.substr(b, e - b);
        return true;
    });
    return out;
}

}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    auto raw = raw_member(js, key);
    if (!raw) return {false, std::nullopt};
    if (*raw == "null") return {true, std::nullopt};
    if (raw->empty() || raw->front() != '"') throw std::runtime_error("invalid type for json string field");
    Scanner sc(*raw);
    return {true, sc.string()};
}

std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key) {
    auto p = json_extract_string_opt_present(js, key);
    if (!p.first) return {false, std::string()};
    return {true, p.second.value_or(std::string())};
}

std::string json_extract_string(const std::string& js, const std::string& key) {
    return json_extract_string_present(js, key).second;
}

std::pair<bool,int64_t> json_extract_int_present(const std::string& js, const std::string& key) {
    auto raw = raw_member(js, key);
    if (!raw) return {false, 0};
    auto v = parse_int64_strict_sv(*raw);
    if (!v) throw std::runtime_error("invalid type for json integer field");
    return {true, *v};
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    auto raw = raw_member(js, key);
    if (!raw || *raw == "null") return std::nullopt;
    auto v = parse_int64_strict_sv(*raw);
    if (!v) throw std::runtime_error("invalid type for json integer field");
    return v;
}

std::pair<bool,bool> json_extract_bool_present(const std::string& js, const std::string& key) {
    auto raw = raw_member(js, key);
    if (!raw) return {false, false};
    if (*raw == "true") return {true, true};
    if (*raw == "false") return {true, false};
    throw std::runtime_error("invalid type for json boolean field");
}

std::vector<std::string> json_split_array(const std::string& js) {
    std::vector<std::string> out;
    Scanner sc(js);
    if (sc.at_end()) return out;
    char first = sc.peek();
    if (first == '{') {
        size_t b = sc.i;
        sc.skip_value();
        out.push_back(js.substr(b, sc.i - b));
    } else if (first == 'n') {
        if (sc.literal() != "null") throw std::runtime_error("unexpected json literal");
    } else {
        sc.expect('[');
        if (sc.peek() == ']') {
            ++sc.i;
        } else {
            for (;;) {
                sc.ws();
                size_t b = sc.i;
                sc.skip_value();
                out.push_back(js.substr(b, sc.i - b));
                char n = sc.peek();
                ++sc.i;
                if (n == ']') break;
                if (n != ',') throw std::runtime_error("expected ',' between json array elements");
            }
        }
    }
    if (!sc.at_end()) throw std::runtime_error("trailing data after json value");
    return out;
}

std::map<std::string, std::string> json_parse_flat_object(const std::string& js) {
    std::map<std::string, std::string> out;
    for_each_member(js, [&](const std::string& k, size_t b, size_t e) {
        std::string raw = js.substr(b, e - b);
        if (!raw.empty() && raw.front() == '"') {
            Scanner sc(raw);
            out[k] = sc.string();
        } else if (raw != "null") {
            out[k] = raw;
        }
        return false;
    });
    return out;
}

std::string json_escape_resp(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream u;
                    u << "\\u" << std::hex << std::setw(4) << std::setfill('0') << int(static_cast<unsigned char>(c));
                    out += u.str();
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string json_emit_string_map(const std::map<std::string, std::string>& m) {
    std::string out = "{";
    bool first = true;
    for (const auto& p : m) {
        if (!first) out += ",";
        first = false;
        out += "\"" + json_escape_resp(p.first) + "\":\"" + json_escape_resp(p.second) + "\"";
    }
    out += "}";
    return out;
}

std::string json_emit_string_or_null(const std::optional<std::string>& o) {
    if (!o.has_value()) return "null";
    return "\"" + json_escape_resp(*o) + "\"";
}
