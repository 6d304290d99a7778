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

    //! What to apply to f(reduced) to recover f(x).
    struct trig_transform
    {
        bool negate = false;
        bool cofunction = false;  //! evaluate the complementary function (sin <-> cos) at the reduced angle
        bool reciprocal = false;  //! tangent only: take 1/tan(reduced)
    };

    struct reduced_angle
    {
        big_float      angle;
        trig_transform transform;
        int            quadrant;
    };

    enum class reduction_range
    {
        half_pi     //! [0, pi/2]
      , quarter_pi  //! [0, pi/4]
    };

    //! x modulo 2*pi in [0, 2*pi), by subtracting binary multiples of 2*pi (no quotient is formed). 2*pi is carried
    //! with extra bits for the magnitude of x.
    HPM_API big_float reduce_two_pi(const big_float& x, unsigned precision);

    //! Quadrant of r in [0, 2*pi): 0 for [0, pi/2), 1 for [pi/2, pi), 2 for [pi, 3pi/2), 3 for [3pi/2, 2pi).
    HPM_API int quadrant(const big_float& r, unsigned precision);

    //! sin(x) = (negate ? -1 : 1) * (cofunction ? cos : sin)(angle).
    HPM_API reduced_angle reduce_sine(const big_float& x, reduction_range range, unsigned precision);

    //! cos(x) = (negate ? -1 : 1) * (cofunction ? sin : cos)(angle).
    HPM_API reduced_angle reduce_cosine(const big_float& x, reduction_range range, unsigned precision);

    //! tan(x) = (negate ? -1 : 1) * (reciprocal ? 1/tan : tan)(angle) with angle in [0, pi/4].
    HPM_API reduced_angle reduce_tangent(const big_float& x, unsigned precision);

}//! namespace hpm;
