/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdlib>
#include <cstring>
#include <type_traits>

namespace remux
{

namespace detail
{

/// \p memset that the optimiser is not allowed to elide.
inline void
// NOLINTNEXTLINE(readability-identifier-naming)
memset_manual(void* B,
              // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
              int Ch,
              std::size_t N) noexcept
{
  if (!B || !N)
    return;

  volatile auto* P = reinterpret_cast<unsigned char*>(B);
  while (N--)
    *P++ = static_cast<unsigned char>(Ch);
}

} // namespace detail

/// Wraps a C-style struct (e.g. \p sigaction or \p sockaddr_un) such that it
/// is always created zero-filled, as the C APIs expect.
template <typename T> struct POD
{
  static_assert(std::is_standard_layout_v<T> && std::is_trivial_v<T>,
                "Only supporting C structures!");

  T& operator*() { return Data; }
  const T& operator*() const { return Data; }
  T* operator&() { return &Data; }
  const T* operator&() const { return &Data; }
  T* operator->() { return &Data; }
  const T* operator->() const { return &Data; }
  operator T&() { return Data; }
  operator const T&() const { return Data; }

  POD() noexcept
  {
    static_assert(sizeof(*this) == sizeof(T), "Extra padding is forbidden!");
    reset();
  }
  ~POD() noexcept { reset(); }

  POD(const POD& RHS) noexcept { std::memcpy(&Data, &RHS.Data, sizeof(T)); }
  POD& operator=(const POD& RHS) noexcept
  {
    if (this != &RHS)
      std::memcpy(&Data, &RHS.Data, sizeof(T));
    return *this;
  }

  /// Zero-fill the memory area of the contained object.
  void reset() noexcept { detail::memset_manual(&Data, 0, sizeof(T)); }

private:
  T Data;
};

} // namespace remux
