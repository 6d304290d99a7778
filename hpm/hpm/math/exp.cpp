//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/exp.hpp>
#include <hpm/math/constants.hpp>
#include <hpm/math/kernels.hpp>
#include <hpm/logging.hpp>

#include <algorithm>

namespace hpm {

    big_float exp(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_zero())
            return big_float(1, p);
        if (x.is_inf())
            return x.signbit() ? big_float::zero(false, p) : big_float::infinity(false, p);
        if (x > HPM_EXP_LIMIT)
            return big_float::infinity(false, p);
        if (x < -HPM_EXP_LIMIT)
            return big_float::zero(false, p);

        //! e^x = (e^(x/2^k))^(2^k) with |x/2^k| < 1/16.
        auto k = (std::max)(std::int64_t(0), x.exponent() + 5);
        auto wp = working_precision(p) + static_cast<unsigned>(k);
        auto r = ldexp(x.with_precision(wp), -k);
        auto s = exp_series(r, wp).value;
        for (std::int64_t i = 0; i < k; ++i)
            s *= s;
        return s.with_precision(p);
    }

    big_float exp2(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_zero())
            return big_float(1, p);
        if (x.is_inf())
            return x.signbit() ? big_float::zero(false, p) : big_float::infinity(false, p);
        if (x.is_int() && abs(x) <= HPM_EXP_LIMIT)
            return ldexp(big_float(1, p), x.to_int64());

        auto wp = working_precision(p) + static_cast<unsigned>((std::max)(std::int64_t(0), x.exponent() + 1));
        return exp(x.with_precision(wp) * ln2(wp)).with_precision(p);
    }

}//! namespace hpm;
