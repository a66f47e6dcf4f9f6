/*---------------------------------------------------------*/
/*                                                         */
/*   json_value.cpp - Small JSON document model            */
/*                                                         */
/*---------------------------------------------------------*/

#include "json_value.h"

#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace {

const int kMaxDepth = 256;

const JsonValue& nullValue() {
    static const JsonValue value;
    return value;
}

const std::string& emptyString() {
    static const std::string value;
    return value;
}

void skipWs(const std::string& s, size_t& pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r'))
        ++pos;
}

bool consume(const std::string& s, size_t& pos, char ch) {
    skipWs(s, pos);
    if (pos < s.size() && s[pos] == ch) {
        ++pos;
        return true;
    }
    return false;
}

bool consumeWord(const std::string& s, size_t& pos, const char* word) {
    size_t i = 0;
    while (word[i]) {
        if (pos + i >= s.size() || s[pos + i] != word[i])
            return false;
        ++i;
    }
    pos += i;
    return true;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

bool parseHex4(const std::string& s, size_t& pos, unsigned& out) {
    if (pos + 4 > s.size())
        return false;
    out = 0;
    for (int i = 0; i < 4; ++i) {
        int d = hexDigit(s[pos + i]);
        if (d < 0)
            return false;
        out = (out << 4) | unsigned(d);
    }
    pos += 4;
    return true;
}

void appendUtf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += char(cp);
    } else if (cp < 0x800) {
        out += char(0xC0 | (cp >> 6));
        out += char(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += char(0xE0 | (cp >> 12));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    } else {
        out += char(0xF0 | (cp >> 18));
        out += char(0x80 | ((cp >> 12) & 0x3F));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }
}

bool parseString(const std::string& s, size_t& pos, std::string& out) {
    skipWs(s, pos);
    if (pos >= s.size() || s[pos] != '"')
        return false;
    ++pos;
    out.clear();
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"')
            return true;
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= s.size())
            return false;
        char e = s[pos++];
        switch (e) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                unsigned cp = 0;
                if (!parseHex4(s, pos, cp))
                    return false;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && pos + 1 < s.size() &&
                    s[pos] == '\\' && s[pos + 1] == 'u') {
                    size_t save = pos;
                    pos += 2;
                    unsigned lo = 0;
                    if (parseHex4(s, pos, lo) && lo >= 0xDC00 && lo <= 0xDFFF)
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    else
                        pos = save;
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                return false;
        }
    }
    return false;
}

bool parseNumber(const std::string& s, size_t& pos, double& out) {
    skipWs(s, pos);
    const char* begin = s.c_str() + pos;
    char* end = nullptr;
    out = std::strtod(begin, &end);
    if (end == begin)
        return false;
    pos += size_t(end - begin);
    return std::isfinite(out);
}

bool parseValue(const std::string& s, size_t& pos, JsonValue& out, int depth, std::string& error) {
    if (depth > kMaxDepth) {
        error = "nesting too deep";
        return false;
    }
    skipWs(s, pos);
    if (pos >= s.size()) {
        error = "unexpected end of input";
        return false;
    }
    char c = s[pos];
    if (c == '{') {
        ++pos;
        out = JsonValue::object();
        if (consume(s, pos, '}'))
            return true;
        while (true) {
            std::string key;
            if (!parseString(s, pos, key)) {
                error = "expected object key at offset " + std::to_string(pos);
                return false;
            }
            if (!consume(s, pos, ':')) {
                error = "expected ':' at offset " + std::to_string(pos);
                return false;
            }
            JsonValue member;
            if (!parseValue(s, pos, member, depth + 1, error))
                return false;
            out.set(key, std::move(member));
            if (consume(s, pos, ','))
                continue;
            if (consume(s, pos, '}'))
                return true;
            error = "expected ',' or '}' at offset " + std::to_string(pos);
            return false;
        }
    }
    if (c == '[') {
        ++pos;
        out = JsonValue::array();
        if (consume(s, pos, ']'))
            return true;
        while (true) {
            JsonValue item;
            if (!parseValue(s, pos, item, depth + 1, error))
                return false;
            out.push(std::move(item));
            if (consume(s, pos, ','))
                continue;
            if (consume(s, pos, ']'))
                return true;
            error = "expected ',' or ']' at offset " + std::to_string(pos);
            return false;
        }
    }
    if (c == '"') {
        std::string str;
        if (!parseString(s, pos, str)) {
            error = "bad string at offset " + std::to_string(pos);
            return false;
        }
        out = JsonValue::string(str);
        return true;
    }
    if (consumeWord(s, pos, "true")) { out = JsonValue::boolean(true); return true; }
    if (consumeWord(s, pos, "false")) { out = JsonValue::boolean(false); return true; }
    if (consumeWord(s, pos, "null")) { out = JsonValue(); return true; }

    double num = 0.0;
    if (parseNumber(s, pos, num)) {
        out = JsonValue::number(num);
        return true;
    }
    error = "unexpected character at offset " + std::to_string(pos);
    return false;
}

void newline(std::string& out, int indent, int depth) {
    if (indent < 0)
        return;
    out += '\n';
    out.append(size_t(indent * depth), ' ');
}

} // namespace

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else out += char(c);
        }
    }
    return out;
}

JsonValue JsonValue::boolean(bool value) {
    JsonValue v;
    v.type_ = Type::Bool;
    v.bool_ = value;
    return v;
}

JsonValue JsonValue::number(double value) {
    JsonValue v;
    v.type_ = Type::Number;
    v.number_ = value;
    return v;
}

JsonValue JsonValue::string(const std::string& value) {
    JsonValue v;
    v.type_ = Type::String;
    v.string_ = value;
    return v;
}

JsonValue JsonValue::array() {
    JsonValue v;
    v.type_ = Type::Array;
    return v;
}

JsonValue JsonValue::object() {
    JsonValue v;
    v.type_ = Type::Object;
    return v;
}

bool JsonValue::asBool(bool defaultValue) const {
    return type_ == Type::Bool ? bool_ : defaultValue;
}

double JsonValue::asNumber(double defaultValue) const {
    return type_ == Type::Number ? number_ : defaultValue;
}

bool JsonValue::isInt() const {
    return type_ == Type::Number && std::floor(number_) == number_ &&
           number_ >= double(INT_MIN) && number_ <= double(INT_MAX);
}

int JsonValue::asInt(int defaultValue) const {
    return isInt() ? int(number_) : defaultValue;
}

const std::string& JsonValue::asString() const {
    return type_ == Type::String ? string_ : emptyString();
}

const JsonValue& JsonValue::at(size_t index) const {
    return index < items_.size() ? items_[index] : nullValue();
}

void JsonValue::push(JsonValue value) {
    if (type_ != Type::Array) {
        *this = array();
    }
    items_.push_back(std::move(value));
}

bool JsonValue::has(const std::string& key) const {
    for (const auto& m : members_)
        if (m.first == key) return true;
    return false;
}

const JsonValue& JsonValue::get(const std::string& key) const {
    for (const auto& m : members_)
        if (m.first == key) return m.second;
    return nullValue();
}

void JsonValue::set(const std::string& key, JsonValue value) {
    if (type_ != Type::Object)
        *this = object();
    for (auto& m : members_) {
        if (m.first == key) {
            m.second = std::move(value);
            return;
        }
    }
    members_.emplace_back(key, std::move(value));
}

std::string JsonValue::dump(int indent) const {
    std::string out;
    dumpTo(out, indent, 0);
    return out;
}

void JsonValue::dumpTo(std::string& out, int indent, int depth) const {
    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += bool_ ? "true" : "false";
            break;
        case Type::Number: {
            char buf[32];
            if (number_ == std::floor(number_) && std::fabs(number_) < 1e15)
                std::snprintf(buf, sizeof(buf), "%lld", (long long) number_);
            else
                std::snprintf(buf, sizeof(buf), "%.17g", number_);
            out += buf;
            break;
        }
        case Type::String:
            out += '"';
            out += jsonEscape(string_);
            out += '"';
            break;
        case Type::Array:
            if (items_.empty()) {
                out += "[]";
                break;
            }
            out += '[';
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) out += ',';
                newline(out, indent, depth + 1);
                items_[i].dumpTo(out, indent, depth + 1);
            }
            newline(out, indent, depth);
            out += ']';
            break;
        case Type::Object:
            if (members_.empty()) {
                out += "{}";
                break;
            }
            out += '{';
            for (size_t i = 0; i < members_.size(); ++i) {
                if (i > 0) out += ',';
                newline(out, indent, depth + 1);
                out += '"';
                out += jsonEscape(members_[i].first);
                out += indent < 0 ? "\":" : "\": ";
                members_[i].second.dumpTo(out, indent, depth + 1);
            }
            newline(out, indent, depth);
            out += '}';
            break;
    }
}

bool JsonValue::parse(const std::string& text, JsonValue& out, std::string* error) {
    std::string err;
    size_t pos = 0;
    JsonValue value;
    if (!parseValue(text, pos, value, 0, err)) {
        if (error) *error = err;
        return false;
    }
    skipWs(text, pos);
    if (pos != text.size()) {
        if (error) *error = "trailing characters at offset " + std::to_string(pos);
        return false;
    }
    out = std::move(value);
    return true;
}
