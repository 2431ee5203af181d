#pragma once
// tcw/core/types.h
//
// Shared aliases and small helpers.
// Track coordinates are floating degrees; probability-grid coordinates are
// fixed-point arc units (geometry/arc.h).

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tcw {

using i32 = std::int32_t;
using i64 = std::int64_t;
using u8 = std::uint8_t;
using u64 = std::uint64_t;
using usize = std::size_t;

using Scalar = double;

// Nanoseconds since 1970-01-01T00:00:00Z. Text form: core/time.h.
using Timestamp = i64;

// ISO 3166-1 numeric code; 0 is "no country" (ocean).
using CountryCode = i32;
inline constexpr CountryCode kNoCountry = 0;

namespace detail {
inline constexpr char LowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (usize i = 0; i < a.size(); ++i) {
    if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
  }
  return true;
}
}  // namespace detail

inline void SetErr(std::string* err, const std::string& msg) {
  if (err) *err = msg;
}

// Read-only view over contiguous values (std::span arrives with C++20).
// Country lookups and the median helpers take coordinates/timestamps this way
// so callers can pass vectors without copying.
template <class T>
class Span {
 public:
  using value_type = std::remove_cv_t<T>;
  using pointer = T*;
  using iterator = pointer;

  constexpr Span() noexcept = default;
  constexpr Span(pointer ptr, usize n) noexcept : data_(ptr), size_(n) {}

  template <class Alloc>
  /*implicit*/ Span(const std::vector<value_type, Alloc>& v) noexcept : data_(v.data()), size_(v.size()) {}

  constexpr pointer data() const noexcept { return data_; }
  constexpr usize size() const noexcept { return size_; }
  constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr T& operator[](usize i) const noexcept { return data_[i]; }
  constexpr iterator begin() const noexcept { return data_; }
  constexpr iterator end() const noexcept { return data_ + size_; }

 private:
  pointer data_ = nullptr;
  usize size_ = 0;
};

}  // namespace tcw
