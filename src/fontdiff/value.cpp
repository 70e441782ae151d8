#include <fontdiff/value.h>

#include <charconv>
#include <cmath>
#include <cstdio>

namespace fontdiff {

//=============================================================================
// Object
//=============================================================================

Object::Object() = default;
Object::Object(const Object&) = default;
Object::Object(Object&&) noexcept = default;
Object& Object::operator=(const Object&) = default;
Object& Object::operator=(Object&&) noexcept = default;
Object::~Object() = default;

Object::Object(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        insert(key, value);
    }
}

void Object::insert(std::string key, Value value) {
    auto it = _index.find(key);
    if (it != _index.end()) {
        _entries[it->second].second = std::move(value);
        return;
    }
    _index.emplace(key, _entries.size());
    _entries.emplace_back(std::move(key), std::move(value));
}

const Value* Object::find(const std::string& key) const {
    auto it = _index.find(key);
    if (it == _index.end()) return nullptr;
    return &_entries[it->second].second;
}

// Membership equality, insertion order is ignored
bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, value] : _entries) {
        const Value* rhs = other.find(key);
        if (!rhs || !(*rhs == value)) return false;
    }
    return true;
}

//=============================================================================
// Value
//=============================================================================

const Value* Value::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    return asObject().find(key);
}

bool Value::isSomething() const {
    switch (type()) {
        case Type::Null:   return false;
        case Type::Bool:   return true;
        case Type::Number: return true;
        case Type::String: return !asString().empty();
        case Type::Array:  return !asArray().empty();
        case Type::Object: return !asObject().empty();
    }
    return false;
}

namespace {

void appendEscaped(std::string& out, const std::string& s) {
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

void appendNumber(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc()) {
        out += "null";
        return;
    }
    out.append(buf, end);
}

void appendNewline(std::string& out, int indent, int depth) {
    if (indent < 0) return;
    out += '\n';
    out.append(static_cast<size_t>(indent * depth), ' ');
}

void appendJson(std::string& out, const Value& value, int indent, int depth) {
    value.visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            appendNumber(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, Array>) {
            if (v.empty()) {
                out += "[]";
                return;
            }
            out += '[';
            bool first = true;
            for (const auto& item : v) {
                if (!first) out += ',';
                first = false;
                appendNewline(out, indent, depth + 1);
                appendJson(out, item, indent, depth + 1);
            }
            appendNewline(out, indent, depth);
            out += ']';
        } else if constexpr (std::is_same_v<T, Object>) {
            if (v.empty()) {
                out += "{}";
                return;
            }
            out += '{';
            bool first = true;
            for (const auto& [key, item] : v) {
                if (!first) out += ',';
                first = false;
                appendNewline(out, indent, depth + 1);
                appendEscaped(out, key);
                out += indent < 0 ? ":" : ": ";
                appendJson(out, item, indent, depth + 1);
            }
            appendNewline(out, indent, depth);
            out += '}';
        }
    });
}

} // namespace

std::string Value::toJson(int indent) const {
    std::string out;
    appendJson(out, *this, indent, 0);
    return out;
}

} // namespace fontdiff
