/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <type_traits>
#include <utility>

namespace remux
{

/// Wraps a scalar which resets to \p Default when moved-from. This allows
/// classes owning a resource identified by a plain value (a flag, a PID) to
/// keep the compiler-generated move operations.
template <typename T, T Default> struct UniqueScalar
{
  static_assert(std::is_scalar_v<T>, "Only supporting scalars!");

  UniqueScalar() noexcept : Value(Default) {}
  // NOLINTNEXTLINE(google-explicit-constructor)
  UniqueScalar(T Value) noexcept : Value(Value) {}

  UniqueScalar(UniqueScalar&& RHS) noexcept : Value(RHS.Value)
  {
    RHS.Value = Default;
  }
  UniqueScalar& operator=(UniqueScalar&& RHS) noexcept
  {
    if (this == &RHS)
      return *this;

    Value = RHS.Value;
    RHS.Value = Default;
    return *this;
  }
  UniqueScalar(const UniqueScalar&) = delete;
  UniqueScalar& operator=(const UniqueScalar&) = delete;
  ~UniqueScalar() noexcept = default;

  UniqueScalar& operator=(T NewValue) noexcept
  {
    Value = NewValue;
    return *this;
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator T() const noexcept { return Value; }
  [[nodiscard]] T get() const noexcept { return Value; }

private:
  T Value;
};

} // namespace remux
