//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <hpm/math/math_approx.hpp>

#include <utility>

namespace hpm {

    //! Function policy for generic code written against a math kernel type.
    struct math_kernel
    {
        template<typename T>
        static auto exp(T&& q) -> auto
        {
            return hpm::exp(std::forward<T>(q));
        }

        template<typename T>
        static auto log(T&& q) -> auto
        {
            return hpm::log(std::forward<T>(q));
        }

        template <typename T>
        static auto sqrt(T&& q) -> auto
        {
            return hpm::sqrt(std::forward<T>(q));
        }

        template<typename T>
        static auto cos(T&& q) -> auto
        {
            return hpm::cos(std::forward<T>(q));
        }

        template<typename T>
        static auto sin(T&& q) -> auto
        {
            return hpm::sin(std::forward<T>(q));
        }

        template<typename T>
        static auto tan(T&& q) -> auto
        {
            return hpm::tan(std::forward<T>(q));
        }

        template<typename T>
        static auto acos(T&& q) -> auto
        {
            return hpm::acos(std::forward<T>(q));
        }

        template<typename T>
        static auto asin(T&& q) -> auto
        {
            return hpm::asin(std::forward<T>(q));
        }

        template<typename T>
        static auto atan(T&& q) -> auto
        {
            return hpm::atan(std::forward<T>(q));
        }

        template<typename T1, typename T2>
        static auto pow(T1&& q1, T2&& q2) -> auto
        {
            return hpm::pow(std::forward<T1>(q1), std::forward<T2>(q2));
        }

        template<typename T>
        static auto gamma(T&& q) -> auto
        {
            return hpm::gamma(std::forward<T>(q));
        }
    };

}//! namespace hpm;
