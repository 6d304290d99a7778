//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <hpm/hpm_export.hpp>
#include <hpm/math/precision_policy.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <vector>

namespace hpm {

    //! Power series kernels. Each sums at the given precision and expects an argument already reduced to the
    //! region where the series converges quickly.

    //! e^x, best for |x| < 1.
    HPM_API iteration_result exp_series(const big_float& x, unsigned precision);

    //! sin(x) and cos(x), best for |x| <= pi/4.
    HPM_API iteration_result sin_series(const big_float& x, unsigned precision);
    HPM_API iteration_result cos_series(const big_float& x, unsigned precision);

    //! tan(x) = sum T_n x^(2n - 1) / (2n - 1)! for |x| <= pi/4, with T_n the tangent numbers.
    HPM_API iteration_result tan_series(const big_float& x, unsigned precision);

    //! atan(x) for |x| <= 1 (slow near 1).
    HPM_API iteration_result atan_series(const big_float& x, unsigned precision);

    //! asin(x) for |x| <= 1/2.
    HPM_API iteration_result asin_series(const big_float& x, unsigned precision);

    //! atanh(x) for |x| < 1 (slow near 1).
    HPM_API iteration_result atanh_series(const big_float& x, unsigned precision);

    //! Tangent numbers T_1..T_n (1, 2, 16, 272, ...) by the Brent and Harvey recurrence; index 0 is unused.
    HPM_API std::vector<boost::multiprecision::cpp_int> tangent_numbers(std::size_t n);

}//! namespace hpm;
