/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <string>

#include "remux/system/CurrentPlatform.hpp"
#include "remux/system/HandleTraits.hpp"

namespace remux::system
{

using PlatformSpecificHandleTraits = HandleTraits<CurrentPlatform>;

/// Represents the abstract notion of a resource handle. The underlying
/// OS-level resource is released at the end of the life of the \p Handle.
class Handle
{
public:
  using Raw = PlatformSpecificHandleTraits::RawTy;

protected:
  Raw Value;

  Handle(Raw Value) noexcept; // NOLINT(google-explicit-constructor)

public:
  /// Creates an empty handle that does not wrap anything.
  Handle() noexcept : Value(PlatformSpecificHandleTraits::Invalid) {}

  /// Wrap the raw platform resource handle into the RAII object.
  [[nodiscard]] static Handle wrap(Raw Value) noexcept;

  Handle(Handle&& RHS) noexcept : Value(RHS.release()) {}
  Handle& operator=(Handle&& RHS) noexcept
  {
    if (this == &RHS)
      return *this;
    reset();
    Value = RHS.release();
    return *this;
  }
  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  ~Handle() noexcept { reset(); }

  /// Closes the owned resource, if any.
  void reset() noexcept
  {
    if (!has())
      return;
    PlatformSpecificHandleTraits::close(release());
  }

  /// \returns true if the handle is owning a resource.
  [[nodiscard]] bool has() const noexcept { return isValid(get()); }

  [[nodiscard]] static bool isValid(Raw Value) noexcept
  {
    return Value != PlatformSpecificHandleTraits::Invalid;
  }

  /// Convert to the system primitive type.
  operator Raw() const noexcept { return Value; }

  /// Convert to the system primitive type.
  [[nodiscard]] Raw get() const noexcept { return Value; }

  /// Takes the resource from the current object and changes it to not
  /// manage anything.
  [[nodiscard]] Raw release() noexcept
  {
    Raw H = Value;
    Value = PlatformSpecificHandleTraits::Invalid;
    return H;
  }

  [[nodiscard]] std::string
  to_string() const // NOLINT(readability-identifier-naming)
  {
    return PlatformSpecificHandleTraits::to_string(Value);
  }
};

} // namespace remux::system
