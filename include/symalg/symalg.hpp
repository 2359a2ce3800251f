#ifndef SYMALG_SYMALG_HPP
#define SYMALG_SYMALG_HPP

#include <symalg/arith.hpp>
#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/differentiate.hpp>
#include <symalg/error.hpp>
#include <symalg/expr.hpp>
#include <symalg/latex.hpp>
#include <symalg/math.hpp>
#include <symalg/order.hpp>
#include <symalg/pretty_print.hpp>
#include <symalg/simplify.hpp>
#include <symalg/transforms.hpp>

#endif // SYMALG_SYMALG_HPP
