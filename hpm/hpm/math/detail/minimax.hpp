/* origin: FreeBSD /usr/src/lib/msun/src/k_sin.c and k_cos.c */
/*
 * ====================================================
 * Copyright (C) 1993 by Sun Microsystems, Inc. All rights reserved.
 *
 * Developed at SunSoft, a Sun Microsystems, Inc. business.
 * Permission to use, copy, modify, and distribute this
 * software is freely granted, provided that this notice
 * is preserved.
 * ====================================================
 */
#pragma once

#include <hpm/numeric/big_float.hpp>

namespace hpm { namespace detail {

    //! |sin(x)/x - (1 + S1 x^2 + ... + S6 x^12)| <= 2^-58 on [-pi/4, pi/4].
    static const double S1 = -1.66666666666666324348e-01; /* 0xBFC55555, 0x55555549 */
    static const double S2 = 8.33333333332248946124e-03; /* 0x3F811111, 0x1110F8A6 */
    static const double S3 = -1.98412698298579493134e-04; /* 0xBF2A01A0, 0x19C161D5 */
    static const double S4 = 2.75573137070700676789e-06; /* 0x3EC71DE3, 0x57B1FE7D */
    static const double S5 = -2.50507602534068634195e-08; /* 0xBE5AE5E6, 0x8A2B9CEB */
    static const double S6 = 1.58969099521155010221e-10; /* 0x3DE5D93A, 0x5ACFD57C */

    //! |cos(x) - (1 - x^2/2 + C1 x^4 + ... + C6 x^14)| <= 2^-58 on [-pi/4, pi/4].
    static const double C1 = 4.16666666666666019037e-02; /* 0x3FA55555, 0x5555554C */
    static const double C2 = -1.38888888888741095749e-03; /* 0xBF56C16C, 0x16C15177 */
    static const double C3 = 2.48015872894767294178e-05; /* 0x3EFA01A0, 0x19CB1590 */
    static const double C4 = -2.75573143513906633035e-07; /* 0xBE927E4F, 0x809C52AD */
    static const double C5 = 2.08757232129817482790e-09; /* 0x3E21EE9E, 0xBDB4B1C4 */
    static const double C6 = -1.13596475577881948265e-11; /* 0xBDA8FAE9, 0xBE8838D4 */

    //! Polynomial kernels evaluated in big_float arithmetic at the precision of x. Accurate to about 58 bits.
    inline big_float minimax_sin(const big_float& x)
    {
        auto z = x * x;
        auto r = S2 + z * (S3 + z * (S4 + z * (S5 + z * S6)));
        return x + x * z * (S1 + z * r);
    }

    inline big_float minimax_cos(const big_float& x)
    {
        auto z = x * x;
        auto w = z * z;
        auto r = z * (C1 + z * (C2 + z * C3)) + w * w * (C4 + z * (C5 + z * C6));
        return 1 - z / 2 + z * r;
    }

}}//! namespace hpm::detail;
