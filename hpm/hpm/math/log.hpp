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

namespace hpm {

    enum class log_method
    {
        automatic
      , newton
      , halley
      , taylor
    };

    //! Natural logarithm at the precision of x. log(1) is exactly 0 and log(+inf) is +inf.
    //! Throws domain_error for x <= 0 and numerical_error if the refinement breaks down.
    //! automatic: Newton up to 1e5, Halley above, with inputs outside the double range split as log(m) + k*ln(2).
    HPM_API big_float log(const big_float& x, log_method method = log_method::automatic);

    //! Stabilized Newton refinement of e^y = x: y += 2(x - e^y)/(x + e^y).
    HPM_API iteration_result log_newton(const big_float& x);

    //! Halley refinement of e^y = x: y -= 2 f e^y / (e^y (e^y + x)) with f = e^y - x.
    HPM_API iteration_result log_halley(const big_float& x);

    //! x = m 2^k with m in [sqrt(1/2), sqrt(2)); log(m) = 2 atanh((m - 1)/(m + 1)) summed with a partial sum check
    //! every fifth term, plus k ln(2) at the working precision.
    HPM_API iteration_result log_taylor(const big_float& x);

}//! namespace hpm;
