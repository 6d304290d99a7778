//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/numeric/big_float.hpp>

#include <cctype>
#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace hpm {

    namespace {

        using mantissa_type = big_float::mantissa_type;
        using exponent_type = big_float::exponent_type;

        //! Range of the normalized exponent (value in [2^(top-1), 2^top)).
        constexpr exponent_type max_top = (std::numeric_limits<std::int32_t>::max)();
        constexpr exponent_type min_top = (std::numeric_limits<std::int32_t>::min)();

        inline exponent_type bit_length(const mantissa_type& m)
        {
            return m.is_zero() ? 0 : static_cast<exponent_type>(boost::multiprecision::msb(m)) + 1;
        }

        inline void check_precision(unsigned precision)
        {
            if (precision == 0)
                throw std::invalid_argument("big_float: precision must be at least one bit");
        }

        //! Round m to at most precision bits, half to even. e is adjusted so m * 2^e is kept up to rounding.
        void round_half_even(mantissa_type& m, exponent_type& e, unsigned precision, bool sticky)
        {
            auto n = bit_length(m);
            if (n <= static_cast<exponent_type>(precision))
                return;

            auto shift = static_cast<unsigned>(n - precision);
            bool roundBit = boost::multiprecision::bit_test(m, shift - 1);
            bool lowerBits = sticky || (shift > 1 && boost::multiprecision::lsb(m) < shift - 1);
            m >>= shift;
            e += shift;
            if (roundBit && (lowerBits || boost::multiprecision::bit_test(m, 0)))
            {
                ++m;
                if (bit_length(m) > static_cast<exponent_type>(precision))
                {
                    m >>= 1;
                    ++e;
                }
            }
        }

        inline mantissa_type pow10(exponent_type n)
        {
            return boost::multiprecision::pow(mantissa_type(10), static_cast<unsigned>(n));
        }

        big_float divide_parts(bool negative, const mantissa_type& a, exponent_type ea, const mantissa_type& b, exponent_type eb, unsigned precision)
        {
            auto s = (std::max)(exponent_type(0), static_cast<exponent_type>(precision) + 2 + bit_length(b) - bit_length(a));
            mantissa_type q, r;
            boost::multiprecision::divide_qr(mantissa_type(a << static_cast<unsigned>(s)), b, q, r);
            return big_float::from_parts(negative, std::move(q), ea - eb - s, precision, !r.is_zero());
        }

        int compare_magnitude(const big_float& a, const big_float& b)
        {
            if (a.is_inf() || b.is_inf())
                return a.is_inf() == b.is_inf() ? 0 : (a.is_inf() ? 1 : -1);
            if (a.is_zero() || b.is_zero())
                return a.is_zero() == b.is_zero() ? 0 : (a.is_zero() ? -1 : 1);

            auto ta = bit_length(a.mantissa()) + a.binary_exponent();
            auto tb = bit_length(b.mantissa()) + b.binary_exponent();
            if (ta != tb)
                return ta < tb ? -1 : 1;

            auto ea = a.binary_exponent();
            auto eb = b.binary_exponent();
            if (ea >= eb)
                return mantissa_type(a.mantissa() << static_cast<unsigned>(ea - eb)).compare(b.mantissa());
            return a.mantissa().compare(mantissa_type(b.mantissa() << static_cast<unsigned>(eb - ea)));
        }

    }//! namespace;

    big_float::big_float()
        : m_mantissa()
        , m_exponent(0)
        , m_precision(default_precision)
        , m_form(form::zero)
        , m_negative(false)
    {}

    big_float::big_float(double v, unsigned precision)
        : big_float()
    {
        check_precision(precision);
        m_precision = precision;
        if (std::isnan(v))
            throw nan_error("big_float: NaN has no representation");
        if (v == 0)
        {
            m_negative = std::signbit(v);
            return;
        }
        if (std::isinf(v))
        {
            m_form = form::infinite;
            m_negative = v < 0;
            return;
        }

        int ex = 0;
        double f = std::frexp(std::fabs(v), &ex);
        auto bits = static_cast<std::uint64_t>(std::ldexp(f, 53));
        *this = from_parts(v < 0, mantissa_type(bits), static_cast<exponent_type>(ex) - 53, precision);
    }

    big_float big_float::from_parts(bool negative, mantissa_type m, exponent_type e, unsigned precision, bool sticky)
    {
        check_precision(precision);
        if (m.is_zero())
            return zero(negative, precision);

        round_half_even(m, e, precision, sticky);
        auto z = boost::multiprecision::lsb(m);
        m >>= z;
        e += z;

        auto top = bit_length(m) + e;
        if (top > max_top)
            return infinity(negative, precision);
        if (top < min_top)
            return zero(negative, precision);

        big_float r;
        r.m_mantissa = std::move(m);
        r.m_exponent = e;
        r.m_precision = precision;
        r.m_form = form::finite;
        r.m_negative = negative;
        return r;
    }

    big_float big_float::from_integer(const mantissa_type& v, unsigned precision)
    {
        return from_parts(v.sign() < 0, boost::multiprecision::abs(v), 0, precision);
    }

    big_float big_float::from_ratio(const mantissa_type& num, const mantissa_type& den, unsigned precision)
    {
        check_precision(precision);
        if (den.is_zero())
            throw std::invalid_argument("big_float: zero denominator");
        bool negative = (num.sign() < 0) != (den.sign() < 0);
        if (num.is_zero())
            return zero(negative, precision);
        return divide_parts(negative, boost::multiprecision::abs(num), 0, boost::multiprecision::abs(den), 0, precision);
    }

    big_float big_float::from_string(const std::string& text, unsigned precision)
    {
        check_precision(precision);

        std::string s;
        for (auto c : text)
            if (!std::isspace(static_cast<unsigned char>(c)))
                s.push_back(c);

        std::size_t i = 0;
        bool negative = false;
        if (i < s.size() && (s[i] == '+' || s[i] == '-'))
            negative = s[i++] == '-';

        std::string rest;
        for (auto j = i; j < s.size(); ++j)
            rest.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[j]))));
        if (rest == "inf" || rest == "infinity")
            return infinity(negative, precision);

        mantissa_type digits;
        exponent_type scale = 0;
        bool anyDigit = false;
        bool seenPoint = false;
        for (; i < s.size(); ++i)
        {
            auto c = s[i];
            if (std::isdigit(static_cast<unsigned char>(c)))
            {
                digits = digits * 10 + (c - '0');
                if (seenPoint)
                    --scale;
                anyDigit = true;
            }
            else if (c == '.' && !seenPoint)
                seenPoint = true;
            else
                break;
        }

        if (!anyDigit)
            throw std::invalid_argument("big_float: malformed number '" + text + "'");

        if (i < s.size())
        {
            if (s[i] != 'e' && s[i] != 'E')
                throw std::invalid_argument("big_float: malformed number '" + text + "'");
            ++i;
            bool expNegative = false;
            if (i < s.size() && (s[i] == '+' || s[i] == '-'))
                expNegative = s[i++] == '-';
            if (i == s.size())
                throw std::invalid_argument("big_float: malformed exponent in '" + text + "'");
            exponent_type ex = 0;
            for (; i < s.size(); ++i)
            {
                if (!std::isdigit(static_cast<unsigned char>(s[i])) || ex > 100000000)
                    throw std::invalid_argument("big_float: malformed exponent in '" + text + "'");
                ex = ex * 10 + (s[i] - '0');
            }
            scale += expNegative ? -ex : ex;
        }

        if (digits.is_zero())
            return zero(negative, precision);
        if (scale >= 0)
            return from_parts(negative, digits * pow10(scale), 0, precision);
        return divide_parts(negative, digits, 0, pow10(-scale), 0, precision);
    }

    big_float big_float::zero(bool negative, unsigned precision)
    {
        check_precision(precision);
        big_float r;
        r.m_precision = precision;
        r.m_negative = negative;
        return r;
    }

    big_float big_float::infinity(bool negative, unsigned precision)
    {
        check_precision(precision);
        big_float r;
        r.m_precision = precision;
        r.m_negative = negative;
        r.m_form = form::infinite;
        return r;
    }

    big_float big_float::add(const big_float& a, const big_float& b, unsigned precision)
    {
        check_precision(precision);
        if (a.is_inf() || b.is_inf())
        {
            if (a.is_inf() && b.is_inf() && a.m_negative != b.m_negative)
                throw nan_error("big_float: inf - inf");
            return infinity(a.is_inf() ? a.m_negative : b.m_negative, precision);
        }
        if (a.is_zero() && b.is_zero())
            return zero(a.m_negative && b.m_negative, precision);
        if (a.is_zero())
            return b.with_precision(precision);
        if (b.is_zero())
            return a.with_precision(precision);

        const big_float* x = &a;
        const big_float* y = &b;
        auto tx = bit_length(x->m_mantissa) + x->m_exponent;
        auto ty = bit_length(y->m_mantissa) + y->m_exponent;
        if (tx < ty)
        {
            std::swap(x, y);
            std::swap(tx, ty);
        }

        //! An operand lying wholly below the rounding position only contributes a sticky bit, so it is replaced by a
        //! single bit at the same level to keep the exact sum small.
        mantissa_type my = y->m_mantissa;
        auto ey = y->m_exponent;
        auto limit = (std::min)(x->m_exponent, tx - static_cast<exponent_type>(precision) - 1) - 1;
        if (ty <= limit)
        {
            my = 1;
            ey = limit - 1;
        }

        auto e0 = (std::min)(x->m_exponent, ey);
        mantissa_type mx = x->m_mantissa << static_cast<unsigned>(x->m_exponent - e0);
        my <<= static_cast<unsigned>(ey - e0);

        if (x->m_negative == y->m_negative)
            return from_parts(x->m_negative, mx + my, e0, precision);
        if (mx >= my)
        {
            if (mx == my)
                return zero(false, precision);
            return from_parts(x->m_negative, mx - my, e0, precision);
        }
        return from_parts(y->m_negative, my - mx, e0, precision);
    }

    big_float big_float::sub(const big_float& a, const big_float& b, unsigned precision)
    {
        return add(a, -b, precision);
    }

    big_float big_float::mul(const big_float& a, const big_float& b, unsigned precision)
    {
        check_precision(precision);
        bool negative = a.m_negative != b.m_negative;
        if ((a.is_zero() && b.is_inf()) || (a.is_inf() && b.is_zero()))
            throw nan_error("big_float: 0 * inf");
        if (a.is_inf() || b.is_inf())
            return infinity(negative, precision);
        if (a.is_zero() || b.is_zero())
            return zero(negative, precision);
        return from_parts(negative, a.m_mantissa * b.m_mantissa, a.m_exponent + b.m_exponent, precision);
    }

    big_float big_float::div(const big_float& a, const big_float& b, unsigned precision)
    {
        check_precision(precision);
        bool negative = a.m_negative != b.m_negative;
        if (a.is_inf() && b.is_inf())
            throw nan_error("big_float: inf / inf");
        if (a.is_zero() && b.is_zero())
            throw nan_error("big_float: 0 / 0");
        if (a.is_inf() || b.is_zero())
            return infinity(negative, precision);
        if (a.is_zero() || b.is_inf())
            return zero(negative, precision);
        return divide_parts(negative, a.m_mantissa, a.m_exponent, b.m_mantissa, b.m_exponent, precision);
    }

    big_float big_float::with_precision(unsigned precision) const
    {
        check_precision(precision);
        if (m_form != form::finite)
        {
            big_float r(*this);
            r.m_precision = precision;
            return r;
        }
        return from_parts(m_negative, m_mantissa, m_exponent, precision);
    }

    bool big_float::is_int() const
    {
        return m_form == form::zero || (m_form == form::finite && m_exponent >= 0);
    }

    bool big_float::is_odd_integer() const
    {
        //! The canonical mantissa has no trailing zeros, so the integer part is odd exactly when the scale is 2^0.
        return m_form == form::finite && m_exponent == 0 && boost::multiprecision::bit_test(m_mantissa, 0);
    }

    big_float::exponent_type big_float::exponent() const
    {
        if (m_form == form::zero)
            return (std::numeric_limits<exponent_type>::min)();
        if (m_form == form::infinite)
            return (std::numeric_limits<exponent_type>::max)();
        return bit_length(m_mantissa) + m_exponent - 1;
    }

    double big_float::to_double() const
    {
        if (m_form == form::zero)
            return m_negative ? -0.0 : 0.0;
        if (m_form == form::infinite)
            return m_negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();

        mantissa_type m = m_mantissa;
        auto e = m_exponent;
        round_half_even(m, e, 53, false);
        auto top = bit_length(m) + e;
        if (top > 1025)
            return m_negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        if (top < -1100)
            return m_negative ? -0.0 : 0.0;

        auto d = std::ldexp(m.convert_to<double>(), static_cast<int>(e));
        return m_negative ? -d : d;
    }

    big_float::mantissa_type big_float::to_integer() const
    {
        if (m_form == form::infinite)
            throw std::overflow_error("big_float: infinity has no integer value");
        if (m_form == form::zero)
            return mantissa_type(0);

        mantissa_type r;
        if (m_exponent >= 0)
            r = m_mantissa << static_cast<unsigned>(m_exponent);
        else if (-m_exponent < bit_length(m_mantissa))
            r = m_mantissa >> static_cast<unsigned>(-m_exponent);
        return m_negative ? mantissa_type(-r) : r;
    }

    std::int64_t big_float::to_int64() const
    {
        if (m_form == form::finite && exponent() >= 63)
            throw std::overflow_error("big_float: value out of int64 range");
        auto v = to_integer();
        if (v > (std::numeric_limits<std::int64_t>::max)() || v < (std::numeric_limits<std::int64_t>::min)())
            throw std::overflow_error("big_float: value out of int64 range");
        return v.convert_to<std::int64_t>();
    }

    std::string big_float::str(std::size_t digits) const
    {
        if (m_form == form::infinite)
            return m_negative ? "-inf" : "+inf";
        if (m_form == form::zero)
            return m_negative ? "-0" : "0";

        if (digits == 0)
            digits = static_cast<std::size_t>(m_precision * 0.30102999566398120) + 1;

        //! Lower bound of the decimal exponent; the loop corrects it by at most one step.
        auto e10 = static_cast<exponent_type>(std::floor((bit_length(m_mantissa) - 1 + m_exponent) * 0.30102999566398120));
        auto limit = pow10(static_cast<exponent_type>(digits));
        mantissa_type scaled;
        for (int attempt = 0; attempt < 3; ++attempt)
        {
            mantissa_type num = m_mantissa;
            mantissa_type den = 1;
            if (m_exponent >= 0)
                num <<= static_cast<unsigned>(m_exponent);
            else
                den <<= static_cast<unsigned>(-m_exponent);

            auto k = static_cast<exponent_type>(digits) - 1 - e10;
            if (k >= 0)
                num *= pow10(k);
            else
                den *= pow10(-k);

            mantissa_type q, r;
            boost::multiprecision::divide_qr(num, den, q, r);
            auto twice = mantissa_type(r << 1);
            if (twice > den || (twice == den && boost::multiprecision::bit_test(q, 0)))
                ++q;
            scaled = q;
            if (scaled < limit)
                break;
            ++e10;
        }

        auto text = scaled.str();
        while (text.size() > 1 && text.back() == '0')
            text.pop_back();

        std::string result = m_negative ? "-" : "";
        result += text[0];
        if (text.size() > 1)
        {
            result += '.';
            result += text.substr(1);
        }
        result += e10 < 0 ? "e-" : "e+";
        auto ex = std::to_string(e10 < 0 ? -e10 : e10);
        if (ex.size() < 2)
            ex.insert(ex.begin(), '0');
        return result + ex;
    }

    bool big_float::identical(const big_float& o) const
    {
        return m_form == o.m_form && m_negative == o.m_negative && m_precision == o.m_precision
            && m_exponent == o.m_exponent && m_mantissa == o.m_mantissa;
    }

    big_float big_float::operator-() const
    {
        big_float r(*this);
        r.m_negative = !r.m_negative;
        return r;
    }

    big_float& big_float::operator+=(const big_float& rhs)
    {
        *this = add(*this, rhs, m_precision);
        return *this;
    }

    big_float& big_float::operator-=(const big_float& rhs)
    {
        *this = sub(*this, rhs, m_precision);
        return *this;
    }

    big_float& big_float::operator*=(const big_float& rhs)
    {
        *this = mul(*this, rhs, m_precision);
        return *this;
    }

    big_float& big_float::operator/=(const big_float& rhs)
    {
        *this = div(*this, rhs, m_precision);
        return *this;
    }

    int compare(const big_float& a, const big_float& b)
    {
        auto sa = a.is_zero() ? 0 : (a.signbit() ? -1 : 1);
        auto sb = b.is_zero() ? 0 : (b.signbit() ? -1 : 1);
        if (sa != sb)
            return sa < sb ? -1 : 1;
        if (sa == 0)
            return 0;
        auto m = compare_magnitude(a, b);
        return sa < 0 ? -m : m;
    }

    big_float abs(const big_float& x)
    {
        return x.signbit() ? -x : x;
    }

    big_float sqrt(const big_float& x)
    {
        if (x.is_zero())
            return x;
        if (x.signbit())
            throw nan_error("big_float: sqrt of a negative value");
        if (x.is_inf())
            return x;

        auto precision = x.precision();
        auto e = x.binary_exponent();
        auto s = (std::max)(exponent_type(0), 2 * (static_cast<exponent_type>(precision) + 2) - bit_length(x.mantissa()));
        if ((e - s) & 1)
            ++s;

        mantissa_type m = x.mantissa() << static_cast<unsigned>(s);
        mantissa_type r;
        mantissa_type root = boost::multiprecision::sqrt(m, r);
        return big_float::from_parts(false, std::move(root), (e - s) / 2, precision, !r.is_zero());
    }

    big_float ldexp(const big_float& x, std::int64_t n)
    {
        if (!x.is_finite() || x.is_zero())
            return x;
        return big_float::from_parts(x.signbit(), x.mantissa(), x.binary_exponent() + n, x.precision());
    }

    big_float trunc(const big_float& x)
    {
        if (x.is_int() || x.is_inf())
            return x;
        auto shift = -x.binary_exponent();
        if (shift >= bit_length(x.mantissa()))
            return big_float::zero(x.signbit(), x.precision());
        return big_float::from_parts(x.signbit(), x.mantissa() >> static_cast<unsigned>(shift), 0, x.precision());
    }

    big_float floor(const big_float& x)
    {
        auto t = trunc(x);
        if (x.signbit() && !x.is_int() && x.is_finite())
            return big_float::sub(t, big_float(1, 64), x.precision());
        return t;
    }

    std::ostream& operator<<(std::ostream& os, const big_float& x)
    {
        return os << x.str();
    }

}//! namespace hpm;
