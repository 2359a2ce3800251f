#ifndef SYMALG_ARITH_HPP
#define SYMALG_ARITH_HPP

#include <system_error>

#include <boost/safe_numerics/safe_integer.hpp>
#include <fmt/format.h>

#include <symalg/ast.hpp>
#include <symalg/error.hpp>

namespace symalg {

// --- Checked integer arithmetic over Int ---
//
// boost::safe_numerics reports overflow as std::system_error; it is
// rethrown as symalg::overflow_error so callers see one error type.

namespace detail {

using safe_int = boost::safe_numerics::safe<Int>;

template <typename F>
Int checked(const char* op, Int lhs, Int rhs, F f) {
    try {
        return f(safe_int(lhs), safe_int(rhs));
    } catch (const std::system_error&) {
        throw overflow_error(
            fmt::format("integer overflow in {} of {} and {}", op, lhs, rhs));
    }
}

} // namespace detail

inline Int checked_add(Int lhs, Int rhs) {
    return detail::checked("addition", lhs, rhs,
                           [](detail::safe_int a, detail::safe_int b) -> Int {
                               return a + b;
                           });
}

inline Int checked_sub(Int lhs, Int rhs) {
    return detail::checked("subtraction", lhs, rhs,
                           [](detail::safe_int a, detail::safe_int b) -> Int {
                               return a - b;
                           });
}

inline Int checked_mul(Int lhs, Int rhs) {
    return detail::checked("multiplication", lhs, rhs,
                           [](detail::safe_int a, detail::safe_int b) -> Int {
                               return a * b;
                           });
}

inline Int checked_neg(Int v) { return checked_sub(0, v); }

// v^n for n >= 0. |v| >= 2 overflows within 63 steps, so the loop is short.
inline Int checked_pow(Int v, Int n) {
    if (n < 0)
        throw error(fmt::format("negative exponent {} in integer power", n));
    if (v == 0)
        return n == 0 ? 1 : 0;
    if (v == 1)
        return 1;
    if (v == -1)
        return n % 2 == 0 ? 1 : -1;
    Int result = 1;
    for (Int i = 0; i < n; ++i)
        result = checked_mul(result, v);
    return result;
}

} // namespace symalg

#endif // SYMALG_ARITH_HPP
