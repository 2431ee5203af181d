#pragma once
// tcw/core/assert.h
//
// Internal invariant checks. They abort with file/line; inputs are never
// validated with them (fallible operations return false and fill `err`).
//
//   TCW_ASSERT(cond)      always on
//   TCW_DASSERT(cond)     debug builds only
//   TCW_CHECK_LE(a, b)    always on, reports both operands (also _EQ, _LT)

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace tcw {
namespace detail {

[[noreturn]] inline void InvariantFailure(const char* file, int line, const std::string& what) {
  std::cerr << "[tcw] invariant violated at " << file << ":" << line << ": " << what << std::endl;
  std::abort();
}

template <class A, class B>
std::string DescribeComparison(const char* a_expr, const char* op, const char* b_expr, const A& a, const B& b) {
  std::ostringstream oss;
  oss << a_expr << " " << op << " " << b_expr << " (" << a << " vs " << b << ")";
  return oss.str();
}

}  // namespace detail
}  // namespace tcw

#define TCW_ASSERT(cond)                                                  \
  do {                                                                    \
    if (!(cond)) ::tcw::detail::InvariantFailure(__FILE__, __LINE__, #cond); \
  } while (0)

#ifndef NDEBUG
#define TCW_DASSERT(cond) TCW_ASSERT(cond)
#else
#define TCW_DASSERT(cond) \
  do {                    \
    (void)sizeof(cond);   \
  } while (0)
#endif

#define TCW_CHECK_OP(a, b, op)                                                                     \
  do {                                                                                             \
    const auto& tcw_lhs_ = (a);                                                                    \
    const auto& tcw_rhs_ = (b);                                                                    \
    if (!(tcw_lhs_ op tcw_rhs_)) {                                                                 \
      ::tcw::detail::InvariantFailure(__FILE__, __LINE__,                                          \
                                      ::tcw::detail::DescribeComparison(#a, #op, #b, tcw_lhs_, tcw_rhs_)); \
    }                                                                                              \
  } while (0)

#define TCW_CHECK_EQ(a, b) TCW_CHECK_OP(a, b, ==)
#define TCW_CHECK_LT(a, b) TCW_CHECK_OP(a, b, <)
#define TCW_CHECK_LE(a, b) TCW_CHECK_OP(a, b, <=)
