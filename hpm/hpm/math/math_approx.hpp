//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <hpm/math/constants.hpp>
#include <hpm/math/exp.hpp>
#include <hpm/math/factorial.hpp>
#include <hpm/math/gamma.hpp>
#include <hpm/math/hyperbolic.hpp>
#include <hpm/math/log.hpp>
#include <hpm/math/pow.hpp>
#include <hpm/math/trig.hpp>

#include <type_traits>

namespace hpm {

    namespace detail {

        template <typename T, std::enable_if_t<std::is_integral<T>::value, bool> = true>
        inline big_float native_value(T v)
        {
            return big_float(v);
        }

        template <typename T, std::enable_if_t<std::is_floating_point<T>::value, bool> = true>
        inline big_float native_value(T v)
        {
            return big_float(static_cast<double>(v));
        }

    }//! namespace detail;

    //! Native arguments are wrapped at the default precision.
#define HPM_NATIVE_UNARY_FUNCTION(fn)                                                  \
    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true> \
    inline big_float fn(T v)                                                           \
    {                                                                                  \
        return hpm::fn(detail::native_value(v));                                       \
    }                                                                                  \
/***/

    HPM_NATIVE_UNARY_FUNCTION(exp)
    HPM_NATIVE_UNARY_FUNCTION(exp2)
    HPM_NATIVE_UNARY_FUNCTION(log)
    HPM_NATIVE_UNARY_FUNCTION(sin)
    HPM_NATIVE_UNARY_FUNCTION(cos)
    HPM_NATIVE_UNARY_FUNCTION(tan)
    HPM_NATIVE_UNARY_FUNCTION(atan)
    HPM_NATIVE_UNARY_FUNCTION(asin)
    HPM_NATIVE_UNARY_FUNCTION(acos)
    HPM_NATIVE_UNARY_FUNCTION(sinh)
    HPM_NATIVE_UNARY_FUNCTION(cosh)
    HPM_NATIVE_UNARY_FUNCTION(tanh)
    HPM_NATIVE_UNARY_FUNCTION(asinh)
    HPM_NATIVE_UNARY_FUNCTION(acosh)
    HPM_NATIVE_UNARY_FUNCTION(atanh)

#undef HPM_NATIVE_UNARY_FUNCTION

    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true>
    inline big_float gamma(T v)
    {
        return gamma_float64(static_cast<double>(v));
    }

    template <typename T, typename U, std::enable_if_t<std::is_arithmetic<T>::value && std::is_arithmetic<U>::value, bool> = true>
    inline big_float pow(T a, U b)
    {
        return pow_float64(static_cast<double>(a), static_cast<double>(b));
    }

}//! namespace hpm;
