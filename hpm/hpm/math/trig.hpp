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

    enum class trig_method
    {
        automatic   //! cordic from 1000 bits, minimax up to 53 bits, taylor in between
      , taylor
      , minimax
      , cordic
    };

    enum class tan_method
    {
        automatic
      , quotient
      , continued_fraction
      , taylor
      , cordic
    };

    //! Sine and cosine at the precision of x. An infinite argument yields the +inf sentinel.
    HPM_API big_float sin(const big_float& x, trig_method method = trig_method::automatic);
    HPM_API big_float cos(const big_float& x, trig_method method = trig_method::automatic);

    //! Tangent at the precision of x. An infinite argument yields the +inf sentinel.
    HPM_API big_float tan(const big_float& x, tan_method method = tan_method::automatic);

    //! Arctangent in [-pi/2, pi/2].
    HPM_API big_float atan(const big_float& x);

    //! Arcsine in [-pi/2, pi/2] and arccosine in [0, pi]. Throw domain_error for |x| > 1.
    HPM_API big_float asin(const big_float& x);
    HPM_API big_float acos(const big_float& x);

    HPM_API big_float sin_taylor(const big_float& x);
    HPM_API big_float sin_minimax(const big_float& x);
    HPM_API big_float cos_taylor(const big_float& x);
    HPM_API big_float cos_minimax(const big_float& x);

    //! sin/cos of the angle reduced to [0, pi/4].
    HPM_API big_float tan_quotient(const big_float& x);

    //! x / (1 - x^2 / (3 - x^2 / (5 - ...))) on the angle reduced to [0, pi/4].
    HPM_API big_float tan_continued_fraction(const big_float& x);

    //! Tangent series with exact tangent number coefficients on the angle reduced to [0, pi/4].
    HPM_API big_float tan_taylor(const big_float& x);

}//! namespace hpm;
