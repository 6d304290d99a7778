//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/constants.hpp>
#include <hpm/math/kernels.hpp>
#include <hpm/logging.hpp>

#include <vector>

namespace hpm {

    namespace {

        constexpr unsigned constant_guard_bits = 64;

        inline big_float unit_fraction(std::size_t i, unsigned precision)
        {
            return ldexp(big_float(1, precision), -static_cast<std::int64_t>(i));
        }

        //! gain * prod 1/sqrt(1 + 2^-2i) for i in [first, last).
        big_float scale_gain(big_float gain, std::size_t first, std::size_t last, unsigned precision)
        {
            for (auto i = first; i < last; ++i)
            {
                auto x = unit_fraction(i, precision);
                gain /= sqrt(1 + x * x);
            }
            return gain;
        }

        struct constant_table
        {
            constant_table()
            {
                auto cp = static_cast<unsigned>(HPM_CONSTANT_PRECISION);
                auto wp = cp + constant_guard_bits;
                pi = compute_pi(wp);
                e = compute_e(cp);
                ln2 = compute_ln2(cp);

                atans.reserve(HPM_CORDIC_TABLE_SIZE);
                for (std::size_t i = 0; i < HPM_CORDIC_TABLE_SIZE; ++i)
                {
                    if (i == 0)
                        atans.push_back(ldexp(pi, -2).with_precision(cp));
                    else
                        atans.push_back(atan_series(unit_fraction(i, wp), wp).value.with_precision(cp));
                }
                gain = scale_gain(big_float(1, wp), 0, HPM_CORDIC_TABLE_SIZE, wp).with_precision(cp);
                pi = pi.with_precision(cp);
                logger()->debug("constant table built at {} bits with {} arctangent entries", cp, atans.size());
            }

            big_float pi;
            big_float e;
            big_float ln2;
            std::vector<big_float> atans;
            big_float gain;
        };

        const constant_table& table()
        {
            static const constant_table instance;
            return instance;
        }

        inline bool stored(unsigned precision)
        {
            return precision <= static_cast<unsigned>(HPM_CONSTANT_PRECISION);
        }

    }//! namespace;

    void init()
    {
        table();
    }

    big_float compute_pi(unsigned precision)
    {
        auto wp = precision + 16;
        auto a = atan_series(big_float::from_ratio(1, 5, wp), wp).value;
        auto b = atan_series(big_float::from_ratio(1, 239, wp), wp).value;
        return (16 * a - 4 * b).with_precision(precision);
    }

    big_float compute_e(unsigned precision)
    {
        auto wp = precision + 16;
        return exp_series(big_float(1, wp), wp).value.with_precision(precision);
    }

    big_float compute_ln2(unsigned precision)
    {
        auto wp = precision + 16;
        return (2 * atanh_series(big_float::from_ratio(1, 3, wp), wp).value).with_precision(precision);
    }

    big_float pi(unsigned precision)
    {
        if (stored(precision))
            return table().pi.with_precision(precision);
        logger()->debug("pi requested at {} bits, above the stored precision", precision);
        return compute_pi(precision);
    }

    big_float e(unsigned precision)
    {
        if (stored(precision))
            return table().e.with_precision(precision);
        logger()->debug("e requested at {} bits, above the stored precision", precision);
        return compute_e(precision);
    }

    big_float ln2(unsigned precision)
    {
        if (stored(precision))
            return table().ln2.with_precision(precision);
        logger()->debug("ln2 requested at {} bits, above the stored precision", precision);
        return compute_ln2(precision);
    }

    std::size_t atan_table_size()
    {
        return table().atans.size();
    }

    big_float atan_table_entry(std::size_t i, unsigned precision)
    {
        const auto& atans = table().atans;
        if (i < atans.size() && stored(precision))
            return atans[i].with_precision(precision);

        //! atan(2^-i) = 2^-i - 2^-3i/3 + ..., so 2^-i is exact to the precision once 3i > precision + 1.
        if (i >= atans.size() && 3 * i > static_cast<std::size_t>(precision) + 1)
            return unit_fraction(i, precision);
        if (i == 0)
            return ldexp(pi(precision), -2);
        auto wp = precision + 16;
        return atan_series(unit_fraction(i, wp), wp).value.with_precision(precision);
    }

    big_float cordic_gain(unsigned precision)
    {
        //! Factors with 2^-2i below 2^-precision round to one.
        auto terms = static_cast<std::size_t>(precision) / 2 + 2;
        const auto& t = table();
        if (stored(precision) && terms <= t.atans.size())
            return t.gain.with_precision(precision);

        auto wp = precision + 16;
        if (stored(precision))
            return scale_gain(t.gain.with_precision(wp), t.atans.size(), terms, wp).with_precision(precision);
        return scale_gain(big_float(1, wp), 0, terms, wp).with_precision(precision);
    }

}//! namespace hpm;
