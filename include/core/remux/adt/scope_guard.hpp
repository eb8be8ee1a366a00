/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <type_traits>

namespace remux
{

/// Fires an optional \p Enter callback when constructed, and the \p Exit
/// callback when the scope is left.
///
///   \code{.cpp}
///   scope_guard Signals{[] { install(); }, [] { uninstall(); }};
///   \endcode
template <typename EnterFunction, typename ExitFunction> struct scope_guard
{
  // NOLINTNEXTLINE(google-explicit-constructor)
  scope_guard(ExitFunction&& Exit) noexcept : Alive(true), Exit(Exit) {}
  scope_guard(EnterFunction&& Enter,
              ExitFunction&& Exit) noexcept(noexcept(Enter()))
    : Alive(false), Exit(Exit)
  {
    Enter();
    Alive = true; // NOLINT(cppcoreguidelines-prefer-member-initializer)
  }

  ~scope_guard() noexcept(noexcept(Exit()))
  {
    if (Alive)
      Exit();
    Alive = false;
  }

  scope_guard() = delete;
  scope_guard(const scope_guard&) = delete;
  scope_guard(scope_guard&&) = delete;
  scope_guard& operator=(const scope_guard&) = delete;
  scope_guard& operator=(scope_guard&&) = delete;

private:
  bool Alive;
  ExitFunction Exit;
};

template <typename ExitFunction>
scope_guard(ExitFunction&&) -> scope_guard<void (*)(), ExitFunction>;

/// Restores the value of a variable to what it was at construction when the
/// scope is left.
///
///   \code{.cpp}
///   bool Busy = false;
///   {
///     restore_guard Reset{Busy};
///     Busy = true;
///   }
///   // Busy == false
///   \endcode
template <typename Ty> struct restore_guard
{
  // NOLINTNEXTLINE(google-explicit-constructor)
  restore_guard(Ty& Var) noexcept(std::is_nothrow_copy_constructible_v<Ty>)
    : Address(std::addressof(Var)), Value(Var)
  {}

  ~restore_guard() noexcept(std::is_nothrow_move_assignable_v<Ty>)
  {
    *Address = std::move(Value);
  }

  restore_guard() = delete;
  restore_guard(const restore_guard&) = delete;
  restore_guard(restore_guard&&) = delete;
  restore_guard& operator=(const restore_guard&) = delete;
  restore_guard& operator=(restore_guard&&) = delete;

private:
  Ty* Address;
  Ty Value;
};

} // namespace remux
