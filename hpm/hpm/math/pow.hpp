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

#include <cstdint>

namespace hpm {

    //! The ordered case analysis of pow(x, y). The first matching case wins.
    enum class pow_case
    {
        zero_exponent          //! y == 0 -> 1
      , unit_base              //! x == 1 -> 1
      , unit_exponent          //! y == 1 -> x
      , zero_base              //! x == +-0, sign and parity rules
      , minus_one_infinite     //! x == -1, y == +-inf -> 1
      , infinite_exponent      //! |x| compared to 1 decides +inf or +0
      , infinite_base          //! -inf folds to (-0, -y); +inf -> +inf or +0
      , undefined              //! finite x < 0 with non-integral finite y -> +inf sentinel
      , integer_exponent       //! |y| < 1e6 integral -> square and multiply
      , general                //! exp(y log x)
    };

    HPM_API pow_case classify_pow(const big_float& x, const big_float& y);

    //! x^y at max(x.precision(), y.precision()). Undefined results are the +inf sentinel.
    HPM_API big_float pow(const big_float& x, const big_float& y);

    //! x^n by square and multiply at the precision of x; negative n takes the reciprocal of x^|n|.
    HPM_API big_float pow_int(const big_float& x, std::int64_t n);

    //! pow on doubles at the default precision. NaN inputs give the +inf sentinel.
    HPM_API big_float pow_float64(double x, double y);

}//! namespace hpm;
