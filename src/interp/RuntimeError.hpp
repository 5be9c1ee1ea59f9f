//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/RuntimeError.hpp
// Purpose: Declares the exception used to unwind a failing evaluation and the
//          error record handed back to embedders.
// Key invariants: Every RuntimeError names an ErrorKind and a message; the
//                 location is filled in by the innermost node that knows it.
// Ownership/Lifetime: Value-type; the payload may reference heap objects that
//                     are only valid until the next collection.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/ErrorKind.hpp"
#include "interp/Value.hpp"
#include "support/source_location.hpp"

#include <stdexcept>
#include <string>

namespace fountain::interp
{

using SourceLoc = fountain::support::SourceLoc;

/// @brief Error surfaced by Runner::run when execution fails.
struct FountainError
{
    ErrorKind kind = ErrorKind::TypeError;
    std::string message;
    SourceLoc loc{};
    /// @brief Assertion payload; nil for every other kind.
    /// @details Heap payloads stay alive until the interpreter executes its
    ///          next program.
    Value payload;
};

/// @brief Exception thrown inside the interpreter for runtime failures.
class RuntimeError : public std::runtime_error
{
  public:
    RuntimeError(ErrorKind kind, const std::string &message, SourceLoc loc = {}, Value payload = {})
        : std::runtime_error(message), kind_(kind), loc_(loc), payload_(std::move(payload))
    {
    }

    [[nodiscard]] ErrorKind kind() const noexcept
    {
        return kind_;
    }

    [[nodiscard]] SourceLoc loc() const noexcept
    {
        return loc_;
    }

    /// @brief Attach a location when none was recorded at the throw site.
    void setLocIfMissing(SourceLoc loc) noexcept
    {
        if (!loc_.isValid())
            loc_ = loc;
    }

    [[nodiscard]] const Value &payload() const noexcept
    {
        return payload_;
    }

    [[nodiscard]] FountainError toError() const
    {
        return FountainError{kind_, what(), loc_, payload_};
    }

  private:
    ErrorKind kind_;
    SourceLoc loc_;
    Value payload_;
};

} // namespace fountain::interp
