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
#include <hpm/numeric/big_float.hpp>

namespace hpm {

    //! Gamma function at the precision of x.
    //!
    //! Poles (zero and negative integers) and -inf give the +inf sentinel. Negative non-integers use the reflection
    //! formula, positive integers below 171 the exact factorial. Otherwise the Stirling series above 15 and the
    //! Lanczos approximation below, switching to the Stirling series for precisions above 113 bits.
    HPM_API big_float gamma(const big_float& x);

    //! gamma on a double at the default precision. NaN gives the +inf sentinel.
    HPM_API big_float gamma_float64(double x);

    //! Lanczos approximation after the common special cases: g = 7, n = 9 up to 64 bits, the 24 term
    //! g = 20.32098... set above (about 113 bits of accuracy).
    HPM_API big_float gamma_lanczos(const big_float& x);

    //! Stirling series ln Gamma(x) = (x - 1/2) ln x - x + ln(2 pi)/2 + sum B_2k / (2k (2k - 1) x^(2k - 1)) after the
    //! common special cases. Small arguments are shifted up with Gamma(x) = Gamma(x + n) / (x (x + 1) ... (x + n - 1)).
    HPM_API big_float gamma_stirling(const big_float& x);

    //! Spouge's approximation with a chosen from the working precision, after the common special cases.
    HPM_API big_float gamma_spouge(const big_float& x);

    //! Leading Stirling term sqrt(2 pi n) (n/e)^n.
    HPM_API big_float stirling_approximation(const big_float& n);

}//! namespace hpm;
