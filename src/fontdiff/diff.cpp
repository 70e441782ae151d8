#include <fontdiff/diff.h>

namespace fontdiff {

Value leafPair(const Value& left, const Value& right) {
    return Value(Array{left, right});
}

bool isLeafPair(const Value& node) {
    return node.isArray() && node.asArray().size() == 2;
}

Value errorLeaf(const std::string& message) {
    return Value::object({{"error", message}});
}

bool isErrorLeaf(const Value& node) {
    if (!node.isObject() || node.asObject().size() != 1) return false;
    const Value* msg = node.find("error");
    return msg && msg->isString();
}

static Value diffObjects(const Object& left, const Object& right) {
    Object changes;

    for (const auto& [key, lhs] : left) {
        const Value* rhs = right.find(key);
        if (!rhs) {
            changes.insert(key, leafPair(lhs, Value()));
            continue;
        }
        Value child = diff(lhs, *rhs);
        if (child.isSomething()) {
            changes.insert(key, std::move(child));
        }
    }

    for (const auto& [key, rhs] : right) {
        if (left.contains(key)) continue;
        changes.insert(key, leafPair(Value(), rhs));
    }

    return Value(std::move(changes));
}

Value diff(const Value& left, const Value& right) {
    if (left.isObject() && right.isObject()) {
        return diffObjects(left.asObject(), right.asObject());
    }
    if (left == right) {
        return Value(Object());
    }
    return leafPair(left, right);
}

} // namespace fontdiff
