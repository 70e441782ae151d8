#pragma once

#include <fontdiff/value.h>

#include <string>

namespace fontdiff {

/**
 * Structural diff of two value trees.
 *
 * Result shapes:
 *   - empty Object             no difference
 *   - Array [left, right]      leaf pair
 *   - Object key -> diff node  only keys whose children differ
 *
 * Objects are recursed over the union of their keys, left keys first in
 * their order, then keys only found on the right. A key present on one side
 * only always produces a leaf pair with Null standing in for the missing
 * side, even when the present side is itself Null. Arrays and scalars are
 * atomic: any difference surfaces the whole value on both sides. An empty
 * object is recursed like any other, so each key of the other side shows up
 * as its own leaf pair.
 */
Value diff(const Value& left, const Value& right);

Value leafPair(const Value& left, const Value& right);
bool isLeafPair(const Value& node);

// {"error": message}, used when one side of a table fails to decode
Value errorLeaf(const std::string& message);
bool isErrorLeaf(const Value& node);

} // namespace fontdiff
