//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Value.hpp
// Purpose: Declares the tagged runtime value and its equality, hashing,
//          truthiness and display rules.
// Key invariants: A Value is exactly one of Nil, Bool, Number, String, Table
//                 or Function. Table and Function payloads are non-owning
//                 pointers into the Heap.
// Ownership/Lifetime: Strings are held by value. Heap objects stay alive only
//                     while reachable from a GC root.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace fountain::interp
{

class GcObject;
class Table;
class Function;

/// @brief Discriminator matching the alternatives of Value's variant.
enum class ValueKind
{
    Nil,
    Bool,
    Number,
    String,
    Table,
    Function,
};

/// @brief Lowercase kind name as exposed by `type()` and error messages.
std::string_view valueKindName(ValueKind kind);

/// @brief Dynamically typed Fountain value.
class Value
{
  public:
    /// @brief Construct nil.
    Value() = default;

    static Value nil()
    {
        return Value();
    }

    static Value boolean(bool b)
    {
        return Value(Storage(std::in_place_index<1>, b));
    }

    static Value number(double d)
    {
        return Value(Storage(std::in_place_index<2>, d));
    }

    static Value string(std::string s)
    {
        return Value(Storage(std::in_place_index<3>, std::move(s)));
    }

    static Value table(Table *t)
    {
        return Value(Storage(std::in_place_index<4>, t));
    }

    static Value function(Function *f)
    {
        return Value(Storage(std::in_place_index<5>, f));
    }

    [[nodiscard]] ValueKind kind() const
    {
        return static_cast<ValueKind>(data_.index());
    }

    [[nodiscard]] bool isNil() const
    {
        return kind() == ValueKind::Nil;
    }

    [[nodiscard]] bool isBool() const
    {
        return kind() == ValueKind::Bool;
    }

    [[nodiscard]] bool isNumber() const
    {
        return kind() == ValueKind::Number;
    }

    [[nodiscard]] bool isString() const
    {
        return kind() == ValueKind::String;
    }

    [[nodiscard]] bool isTable() const
    {
        return kind() == ValueKind::Table;
    }

    [[nodiscard]] bool isFunction() const
    {
        return kind() == ValueKind::Function;
    }

    /// @pre isBool()
    [[nodiscard]] bool asBool() const
    {
        return std::get<1>(data_);
    }

    /// @pre isNumber()
    [[nodiscard]] double asNumber() const
    {
        return std::get<2>(data_);
    }

    /// @pre isString()
    [[nodiscard]] const std::string &asString() const
    {
        return std::get<3>(data_);
    }

    /// @pre isTable()
    [[nodiscard]] Table *asTable() const
    {
        return std::get<4>(data_);
    }

    /// @pre isFunction()
    [[nodiscard]] Function *asFunction() const
    {
        return std::get<5>(data_);
    }

    /// @brief Heap object referenced by this value, or nullptr for scalars.
    [[nodiscard]] GcObject *asObject() const;

    /// @brief Only nil and false are falsy.
    [[nodiscard]] bool truthy() const
    {
        if (isNil())
            return false;
        if (isBool())
            return asBool();
        return true;
    }

  private:
    using Storage = std::variant<std::monostate, bool, double, std::string, Table *, Function *>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/// @brief Language equality: total, never coerces across kinds.
/// @details Numbers compare by IEEE rules (NaN is unequal to itself),
///          strings by content, tables and functions by identity.
bool operator==(const Value &a, const Value &b);

inline bool operator!=(const Value &a, const Value &b)
{
    return !(a == b);
}

/// @brief Hash consistent with operator== for every valid table key.
/// @details -0.0 and 0.0 hash alike because they compare equal.
struct ValueHash
{
    size_t operator()(const Value &v) const;
};

/// @brief Format a number the way `print` shows it.
/// @details Integral values print without a fraction ("3"), others use the
///          shortest representation that round-trips ("0.1", "1e+100").
///          Non-finite values print as "nan", "inf" and "-inf".
std::string formatNumber(double d);

/// @brief Text written by `print` for @p v; strings appear unquoted.
std::string toDisplayString(const Value &v);

/// @brief Source-like rendering; strings are quoted.
/// @details Tables render as re-parseable constructors, e.g.
///          `{10, 20, x = 1, ["a b"] = 2}`. A table reached again while it is
///          already being rendered prints as `{...}`.
std::string toReprString(const Value &v);

} // namespace fountain::interp
