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
#include <hpm/config.hpp>
#include <hpm/error.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>

namespace hpm {

    //! Binary floating point value with a per-value bit precision.
    //!
    //! The value is (-1)^sign * mantissa * 2^exponent where the mantissa is a non-negative integer of at most
    //! precision() bits with no trailing zero bits. Every arithmetic result is rounded half to even to its
    //! precision. Zero and infinity are signed. There is no NaN; operations without a defined value throw nan_error.
    class HPM_API big_float
    {
    public:

        using mantissa_type = boost::multiprecision::cpp_int;
        using exponent_type = std::int64_t;

        enum class form : std::uint8_t
        {
            zero
          , finite
          , infinite
        };

        static constexpr unsigned default_precision = HPM_DEFAULT_PRECISION;

        //! +0 at the default precision.
        big_float();

        //! Exact for any precision >= 53. Throws nan_error for NaN.
        explicit big_float(double v, unsigned precision = default_precision);

        template <typename T, std::enable_if_t<std::is_integral<T>::value, bool> = true>
        explicit big_float(T v, unsigned precision = default_precision)
            : big_float(from_integer(mantissa_type(v), precision))
        {}

        static big_float from_integer(const mantissa_type& v, unsigned precision);

        //! num/den correctly rounded. Throws std::invalid_argument for a zero denominator.
        static big_float from_ratio(const mantissa_type& num, const mantissa_type& den, unsigned precision);

        //! Decimal text such as "-12.5e-3", or "inf"/"-inf". Throws std::invalid_argument for malformed text.
        static big_float from_string(const std::string& text, unsigned precision = default_precision);

        //! (-1)^negative * m * 2^e rounded to precision. sticky marks nonzero bits already dropped below m.
        static big_float from_parts(bool negative, mantissa_type m, exponent_type e, unsigned precision, bool sticky = false);

        static big_float zero(bool negative = false, unsigned precision = default_precision);
        static big_float infinity(bool negative = false, unsigned precision = default_precision);

        //! Explicit-precision arithmetic.
        static big_float add(const big_float& a, const big_float& b, unsigned precision);
        static big_float sub(const big_float& a, const big_float& b, unsigned precision);
        static big_float mul(const big_float& a, const big_float& b, unsigned precision);
        static big_float div(const big_float& a, const big_float& b, unsigned precision);

        unsigned precision() const { return m_precision; }

        //! Copy rounded to a new precision.
        big_float with_precision(unsigned precision) const;

        form          kind() const { return m_form; }
        bool          is_zero() const { return m_form == form::zero; }
        bool          is_inf() const { return m_form == form::infinite; }
        bool          is_finite() const { return m_form != form::infinite; }
        bool          signbit() const { return m_negative; }
        int           sign() const { return is_zero() ? 0 : (m_negative ? -1 : 1); }

        //! True for zero and finite values without a fractional part.
        bool          is_int() const;
        bool          is_odd_integer() const;

        //! floor(log2(|x|)) for finite nonzero values.
        exponent_type exponent() const;

        const mantissa_type& mantissa() const { return m_mantissa; }
        exponent_type        binary_exponent() const { return m_exponent; }

        //! Nearest double (round half even at 53 bits, saturating to +-inf and +-0).
        double        to_double() const;

        //! Truncated toward zero. Throws std::overflow_error for infinity or out of range values.
        mantissa_type to_integer() const;
        std::int64_t  to_int64() const;

        //! Scientific notation with the given number of significant decimal digits (0 selects from the precision).
        std::string str(std::size_t digits = 0) const;

        //! Bitwise identity including sign of zero and precision.
        bool identical(const big_float& o) const;

        big_float operator-() const;

        big_float& operator+=(const big_float& rhs);
        big_float& operator-=(const big_float& rhs);
        big_float& operator*=(const big_float& rhs);
        big_float& operator/=(const big_float& rhs);

        template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true>
        big_float& operator+=(T rhs);
        template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true>
        big_float& operator-=(T rhs);
        template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true>
        big_float& operator*=(T rhs);
        template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true>
        big_float& operator/=(T rhs);

    private:

        mantissa_type m_mantissa;
        exponent_type m_exponent;
        unsigned      m_precision;
        form          m_form;
        bool          m_negative;

    };

    namespace detail {

        //! Exact big_float image of a native scalar, used for mixed arithmetic.
        template <typename T, std::enable_if_t<std::is_integral<T>::value, bool> = true>
        inline big_float exact_value(T v)
        {
            return big_float(v, 64);
        }

        template <typename T, std::enable_if_t<std::is_floating_point<T>::value, bool> = true>
        inline big_float exact_value(T v)
        {
            return big_float(static_cast<double>(v), 64);
        }

    }//! namespace detail;

    //! -1, 0 or 1. +0 and -0 compare equal.
    HPM_API int compare(const big_float& a, const big_float& b);

    HPM_API big_float abs(const big_float& x);
    HPM_API big_float sqrt(const big_float& x);

    //! x * 2^n without rounding.
    HPM_API big_float ldexp(const big_float& x, std::int64_t n);
    HPM_API big_float trunc(const big_float& x);
    HPM_API big_float floor(const big_float& x);

    HPM_API std::ostream& operator<<(std::ostream& os, const big_float& x);

    inline big_float operator+(const big_float& a, const big_float& b)
    {
        return big_float::add(a, b, (std::max)(a.precision(), b.precision()));
    }

    inline big_float operator-(const big_float& a, const big_float& b)
    {
        return big_float::sub(a, b, (std::max)(a.precision(), b.precision()));
    }

    inline big_float operator*(const big_float& a, const big_float& b)
    {
        return big_float::mul(a, b, (std::max)(a.precision(), b.precision()));
    }

    inline big_float operator/(const big_float& a, const big_float& b)
    {
        return big_float::div(a, b, (std::max)(a.precision(), b.precision()));
    }

#define HPM_BIG_FLOAT_MIXED_OPERATOR(op, fn)                                          \
    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true> \
    inline big_float operator op(const big_float& a, T b)                               \
    {                                                                                   \
        return big_float::fn(a, detail::exact_value(b), a.precision());                 \
    }                                                                                   \
    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true> \
    inline big_float operator op(T a, const big_float& b)                               \
    {                                                                                   \
        return big_float::fn(detail::exact_value(a), b, b.precision());                 \
    }                                                                                   \
/***/

    HPM_BIG_FLOAT_MIXED_OPERATOR(+, add)
    HPM_BIG_FLOAT_MIXED_OPERATOR(-, sub)
    HPM_BIG_FLOAT_MIXED_OPERATOR(*, mul)
    HPM_BIG_FLOAT_MIXED_OPERATOR(/, div)

#undef HPM_BIG_FLOAT_MIXED_OPERATOR

#define HPM_BIG_FLOAT_COMPARE_OPERATOR(op)                                            \
    inline bool operator op(const big_float& a, const big_float& b)                     \
    {                                                                                   \
        return compare(a, b) op 0;                                                      \
    }                                                                                   \
    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true> \
    inline bool operator op(const big_float& a, T b)                                    \
    {                                                                                   \
        return compare(a, detail::exact_value(b)) op 0;                                 \
    }                                                                                   \
    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool> = true> \
    inline bool operator op(T a, const big_float& b)                                    \
    {                                                                                   \
        return compare(detail::exact_value(a), b) op 0;                                 \
    }                                                                                   \
/***/

    HPM_BIG_FLOAT_COMPARE_OPERATOR(==)
    HPM_BIG_FLOAT_COMPARE_OPERATOR(!=)
    HPM_BIG_FLOAT_COMPARE_OPERATOR(<)
    HPM_BIG_FLOAT_COMPARE_OPERATOR(<=)
    HPM_BIG_FLOAT_COMPARE_OPERATOR(>)
    HPM_BIG_FLOAT_COMPARE_OPERATOR(>=)

#undef HPM_BIG_FLOAT_COMPARE_OPERATOR

    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool>>
    inline big_float& big_float::operator+=(T rhs)
    {
        return *this += detail::exact_value(rhs);
    }

    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool>>
    inline big_float& big_float::operator-=(T rhs)
    {
        return *this -= detail::exact_value(rhs);
    }

    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool>>
    inline big_float& big_float::operator*=(T rhs)
    {
        return *this *= detail::exact_value(rhs);
    }

    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value, bool>>
    inline big_float& big_float::operator/=(T rhs)
    {
        return *this /= detail::exact_value(rhs);
    }

}//! namespace hpm;
