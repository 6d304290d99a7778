//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/factorial.hpp>
#include <hpm/math/gamma.hpp>

#include <string>

namespace hpm {

    namespace {
        constexpr std::int64_t exact_factorial_limit = 1000;
    }//! namespace;

    boost::multiprecision::cpp_int factorial(std::int64_t n)
    {
        if (n < 0)
            throw domain_error("factorial: negative argument " + std::to_string(n));

        boost::multiprecision::cpp_int result = 1;
        for (std::int64_t i = 2; i <= n; ++i)
            result *= i;
        return result;
    }

    big_float factorial(const big_float& x)
    {
        auto p = x.precision();
        if (x.signbit() && !x.is_zero())
            return big_float::infinity(false, p);
        if (x.is_inf())
            return x;
        if (x.is_int() && x <= exact_factorial_limit)
            return big_float::from_integer(factorial(x.to_int64()), p);
        return gamma(x + 1);
    }

}//! namespace hpm;
