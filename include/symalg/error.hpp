#ifndef SYMALG_ERROR_HPP
#define SYMALG_ERROR_HPP

#include <stdexcept>

namespace symalg {

// Base of every exception thrown by the library.
class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Integer overflow while folding coefficients, negating a constant or doing
// exponent arithmetic.
class overflow_error : public error {
  public:
    using error::error;
};

// Expression deeper than Options::max_depth.
class depth_error : public error {
  public:
    using error::error;
};

// Simplification kept changing the tree for Options::max_passes passes.
class convergence_error : public error {
  public:
    using error::error;
};

} // namespace symalg

#endif // SYMALG_ERROR_HPP
