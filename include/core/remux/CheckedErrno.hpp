/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace remux
{

/// \p errno is allowed to be a macro, so \p decltype(errno) is not portable.
using errno_t = int;

namespace detail
{

/// The outcome of a system call executed through \p CheckedErrno().
template <typename R> class Result
{
  R Value;
  bool Errored;
  std::error_code ErrorCode;

public:
  Result(R&& Value, bool Errored, std::error_code Error)
    : Value(std::move(Value)), Errored(Errored), ErrorCode(Error)
  {}

  explicit operator bool() const noexcept { return !Errored; }
  std::error_code getError() const noexcept { return ErrorCode; }
  R& get() noexcept { return Value; }
  const R& get() const noexcept { return Value; }
};

inline std::error_code currentErrno() noexcept
{
  return std::make_error_code(static_cast<std::errc>(errno));
}

} // namespace detail

/// Executes the system call wrapped in \p F and records whether the returned
/// value is one of the \p ErrorValues. In that case, the \p errno at the time
/// of the failure is available through \p getError().
///
///   \code{.cpp}
///   auto Kill = CheckedErrno([PID] { return ::kill(PID, SIGTERM); }, -1);
///   if (!Kill)
///     LOG(warn) << Kill.getError().message();
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrno(Fn&& F, ErrTys&&... ErrorValues) noexcept
{
  static_assert(!std::is_same_v<decltype(F()), void>,
                "System call wrapper must return the call's result!");

  auto ReturnValue = F();
  bool Errored = (false || ... || (ReturnValue == ErrorValues));
  std::error_code EC = Errored ? detail::currentErrno() : std::error_code{};
  return detail::Result<decltype(ReturnValue)>{
    std::move(ReturnValue), Errored, EC};
}

/// Executes the system call wrapped in \p F like \p CheckedErrno(), but
/// turns a failure into a \p std::system_error carrying \p ErrMsg.
///
/// \returns a copy of the result of the call.
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoThrow(Fn&& F, std::string ErrMsg, ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw std::system_error{Result.getError(), ErrMsg};

  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

} // namespace remux
