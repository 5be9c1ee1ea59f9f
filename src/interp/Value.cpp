//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Equality, hashing and textual rendering of runtime values.
/// @details Rendering of tables produces Fountain source: re-parsing the text
///          of a table built from scalars yields a table with the same keys
///          in the same order.

#include "interp/Value.hpp"

#include "frontends/common/CharUtils.hpp"
#include "frontends/fountain/Lexer.hpp"
#include "interp/Function.hpp"
#include "interp/Table.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <functional>
#include <unordered_set>

namespace fountain::interp
{

std::string_view valueKindName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Nil:
            return "nil";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Number:
            return "number";
        case ValueKind::String:
            return "string";
        case ValueKind::Table:
            return "table";
        case ValueKind::Function:
            return "function";
    }
    return "unknown";
}

GcObject *Value::asObject() const
{
    switch (kind())
    {
        case ValueKind::Table:
            return asTable();
        case ValueKind::Function:
            return asFunction();
        default:
            return nullptr;
    }
}

bool operator==(const Value &a, const Value &b)
{
    if (a.kind() != b.kind())
        return false;
    switch (a.kind())
    {
        case ValueKind::Nil:
            return true;
        case ValueKind::Bool:
            return a.asBool() == b.asBool();
        case ValueKind::Number:
            return a.asNumber() == b.asNumber();
        case ValueKind::String:
            return a.asString() == b.asString();
        case ValueKind::Table:
            return a.asTable() == b.asTable();
        case ValueKind::Function:
            return a.asFunction() == b.asFunction();
    }
    return false;
}

size_t ValueHash::operator()(const Value &v) const
{
    const size_t tag = static_cast<size_t>(v.kind()) * 0x9e3779b97f4a7c15ULL;
    switch (v.kind())
    {
        case ValueKind::Nil:
            return tag;
        case ValueKind::Bool:
            return tag ^ std::hash<bool>{}(v.asBool());
        case ValueKind::Number:
        {
            double d = v.asNumber();
            if (d == 0.0)
                d = 0.0; // -0.0 == 0.0, so they must hash alike
            return tag ^ std::hash<double>{}(d);
        }
        case ValueKind::String:
            return tag ^ std::hash<std::string>{}(v.asString());
        case ValueKind::Table:
            return tag ^ std::hash<const void *>{}(v.asTable());
        case ValueKind::Function:
            return tag ^ std::hash<const void *>{}(v.asFunction());
    }
    return tag;
}

namespace
{

/// Longest shortest-round-trip fixed rendering of a double is under 400 chars.
constexpr size_t kNumberBufSize = 512;

std::string formatShortest(double d)
{
    char buf[kNumberBufSize];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    if (res.ec != std::errc())
        return std::to_string(d);
    return std::string(buf, res.ptr);
}

std::string formatFixed(double d)
{
    char buf[kNumberBufSize];
    auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
    if (res.ec != std::errc())
        return formatShortest(d);
    return std::string(buf, res.ptr);
}

std::string formatNonFinite(double d)
{
    if (std::isnan(d))
        return "nan";
    return d < 0 ? "-inf" : "inf";
}

/// @brief Source expression evaluating to the non-finite value @p d.
std::string nonFiniteExpr(double d)
{
    if (std::isnan(d))
        return "(0/0)";
    return d < 0 ? "(-1/0)" : "(1/0)";
}

std::string quoteString(const std::string &s)
{
    const char quote = s.find('"') != std::string::npos && s.find('\'') == std::string::npos
                           ? '\''
                           : '"';
    std::string out;
    out.reserve(s.size() + 2);
    out += quote;
    out += s;
    out += quote;
    return out;
}

bool isBareFieldName(const std::string &s)
{
    return frontends::common::char_utils::isIdentifierSpelling(s) &&
           !frontends::fountain::Lexer::lookupKeyword(s).has_value();
}

class Renderer
{
  public:
    std::string render(const Value &v, bool topLevel)
    {
        switch (v.kind())
        {
            case ValueKind::Nil:
                return "nil";
            case ValueKind::Bool:
                return v.asBool() ? "true" : "false";
            case ValueKind::Number:
                // Nested numbers must read back, which rules out exponents and
                // the bare words inf and nan.
                if (topLevel)
                    return formatNumber(v.asNumber());
                if (!std::isfinite(v.asNumber()))
                    return nonFiniteExpr(v.asNumber());
                return formatFixed(v.asNumber());
            case ValueKind::String:
                return topLevel ? v.asString() : quoteString(v.asString());
            case ValueKind::Table:
                return renderTable(*v.asTable());
            case ValueKind::Function:
            {
                const Function *fn = v.asFunction();
                if (fn->kind() == Function::Kind::Builtin)
                    return "<builtin " + fn->name() + ">";
                return "<fn " + fn->name() + ">";
            }
        }
        return "?";
    }

  private:
    std::string renderTable(const Table &table)
    {
        if (!active_.insert(&table).second)
            return "{...}";

        std::string out = "{";
        double nextPositional = 0;
        bool first = true;
        for (const auto &[key, value] : table.entries())
        {
            if (!first)
                out += ", ";
            first = false;

            if (key.isNumber() && key.asNumber() == nextPositional)
            {
                nextPositional += 1;
            }
            else if (key.isString() && isBareFieldName(key.asString()))
            {
                out += key.asString();
                out += " = ";
            }
            else
            {
                out += '[';
                out += render(key, false);
                out += "] = ";
            }
            out += render(value, false);
        }
        out += '}';

        active_.erase(&table);
        return out;
    }

    std::unordered_set<const Table *> active_;
};

} // namespace

std::string formatNumber(double d)
{
    if (!std::isfinite(d))
        return formatNonFinite(d);
    return formatShortest(d);
}

std::string toDisplayString(const Value &v)
{
    Renderer renderer;
    return renderer.render(v, true);
}

std::string toReprString(const Value &v)
{
    Renderer renderer;
    return renderer.render(v, false);
}

} // namespace fountain::interp
