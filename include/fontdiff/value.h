#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace fontdiff {

class Value;

using Array = std::vector<Value>;

/**
 * Object - string-keyed mapping that preserves insertion order.
 *
 * Keys are unique: inserting an existing key replaces its value in place
 * and keeps the original position.
 */
class Object {
public:
    using Entry = std::pair<std::string, Value>;

    Object();
    Object(std::initializer_list<Entry> entries);
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;
    ~Object();

    void insert(std::string key, Value value);

    // nullptr when the key is absent
    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const { return _index.count(key) > 0; }

    size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    std::vector<Entry>::const_iterator begin() const { return _entries.begin(); }
    std::vector<Entry>::const_iterator end() const { return _entries.end(); }

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    std::vector<Entry> _entries;
    std::unordered_map<std::string, size_t> _index;
};

/**
 * Value - the generic tree used for decoded font tables and for diff output.
 *
 *   Null | Bool | Number | String | Array | Object
 *
 * Trees are built once and then only read. A diff node is itself a Value,
 * so diff output can be serialized or diffed again.
 */
class Value {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : _data(b) {}
    template<typename N, typename = std::enable_if_t<std::is_arithmetic_v<N> &&
                                                     !std::is_same_v<N, bool>>>
    Value(N number) : _data(static_cast<double>(number)) {}
    Value(const char* s) : _data(std::string(s)) {}
    Value(std::string s) : _data(std::move(s)) {}
    Value(Array a) : _data(std::move(a)) {}
    Value(Object o) : _data(std::move(o)) {}

    static Value array(std::initializer_list<Value> items) { return Value(Array(items)); }
    static Value object(std::initializer_list<Object::Entry> entries) {
        return Value(Object(entries));
    }

    Type type() const { return static_cast<Type>(_data.index()); }
    bool isNull() const { return type() == Type::Null; }
    bool isBool() const { return type() == Type::Bool; }
    bool isNumber() const { return type() == Type::Number; }
    bool isString() const { return type() == Type::String; }
    bool isArray() const { return type() == Type::Array; }
    bool isObject() const { return type() == Type::Object; }

    // Accessors require the matching type.
    bool asBool() const { return std::get<bool>(_data); }
    double asNumber() const { return std::get<double>(_data); }
    const std::string& asString() const { return std::get<std::string>(_data); }
    const Array& asArray() const { return std::get<Array>(_data); }
    const Object& asObject() const { return std::get<Object>(_data); }

    // Object member lookup; nullptr when this is not an object or the key is absent.
    const Value* find(const std::string& key) const;

    /// True unless the value is null, an empty string, an empty array or an
    /// empty object. Numbers and booleans always count.
    bool isSomething() const;

    bool operator==(const Value& other) const { return _data == other._data; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Serialize as JSON. indent < 0 gives compact output, otherwise one
    /// member per line indented by `indent` spaces per level.
    std::string toJson(int indent = -1) const;

    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), _data);
    }

private:
    std::variant<std::monostate, bool, double, std::string, Array, Object> _data;
};

} // namespace fontdiff
