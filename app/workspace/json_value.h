/*---------------------------------------------------------*/
/*                                                         */
/*   json_value.h - Small JSON document model              */
/*   Used by layouts, project records, config and IPC      */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include <string>
#include <utility>
#include <vector>

class JsonValue {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    JsonValue() = default;

    static JsonValue boolean(bool value);
    static JsonValue number(double value);
    static JsonValue string(const std::string& value);
    static JsonValue array();
    static JsonValue object();

    Type type() const { return type_; }
    bool isNull() const { return type_ == Type::Null; }
    bool isBool() const { return type_ == Type::Bool; }
    bool isNumber() const { return type_ == Type::Number; }
    // A whole number that fits in an int.
    bool isInt() const;
    bool isString() const { return type_ == Type::String; }
    bool isArray() const { return type_ == Type::Array; }
    bool isObject() const { return type_ == Type::Object; }

    bool asBool(bool defaultValue = false) const;
    double asNumber(double defaultValue = 0.0) const;
    // `defaultValue` unless isInt().
    int asInt(int defaultValue = 0) const;
    // Empty string for non-string values.
    const std::string& asString() const;

    // Arrays
    size_t size() const { return items_.size(); }
    const JsonValue& at(size_t index) const;
    void push(JsonValue value);

    // Objects. Member order is preserved so dumps are stable.
    bool has(const std::string& key) const;
    const JsonValue& get(const std::string& key) const;  // null value when missing
    void set(const std::string& key, JsonValue value);
    const std::vector<std::pair<std::string, JsonValue>>& members() const { return members_; }

    // indent < 0 writes a single line.
    std::string dump(int indent = -1) const;

    static bool parse(const std::string& text, JsonValue& out, std::string* error = nullptr);

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    std::vector<JsonValue> items_;
    std::vector<std::pair<std::string, JsonValue>> members_;

    void dumpTo(std::string& out, int indent, int depth) const;
};

std::string jsonEscape(const std::string& s);
