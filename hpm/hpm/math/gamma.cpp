//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/gamma.hpp>
#include <hpm/config.hpp>
#include <hpm/math/constants.hpp>
#include <hpm/math/exp.hpp>
#include <hpm/math/factorial.hpp>
#include <hpm/math/kernels.hpp>
#include <hpm/math/log.hpp>
#include <hpm/math/pow.hpp>
#include <hpm/math/precision_policy.hpp>
#include <hpm/math/trig.hpp>
#include <hpm/logging.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace hpm {

    namespace {

        using boost::multiprecision::cpp_int;

        constexpr std::int64_t exact_gamma_limit = 171;
        constexpr double stirling_threshold = 15.0;
        constexpr unsigned godfrey_precision_limit = 64;
        constexpr unsigned lanczos_precision_limit = 113;

        //! Godfrey's g = 7, n = 9 coefficients.
        const std::array<double, 9> godfrey_coefficients = {
            0.99999999999980993
          , 676.5203681218851
          , -1259.1392167224028
          , 771.32342877765313
          , -176.61502916214059
          , 12.507343278686905
          , -0.13857109526572012
          , 9.9843695780195716e-6
          , 1.5056327351493116e-7
        };

        //! Numerator of the N = 24, g = 20.3209821879863739013671875 rational Lanczos sum (constant term first).
        const std::array<const char*, 24> lanczos24_numerator = {
            "2029889364934367661624137213253.22102954656825019111612712252027"
          , "2338599599286656537526273232565.27273497143387681614218824784175"
          , "1288527989493833400335117708406.39537119061759604491867206802014"
          , "451779745834728745064649902914.550539158066332484594436145043389"
          , "113141284461097964029239556815.291212318665536114012605167994061"
          , "21533689802794625866812941616.7509064680880468667055339259146063"
          , "3235510315314840089932120340.71494940111731241353655381919722177"
          , "393537392344185475704891959.081297108513472083749083165179784098"
          , "39418265082950435024868801.5005452240816902251477336582325944930"
          , "3290158764187118871697791.05850632319194734270969161036889516415"
          , "230677110449632078321772.618245845856640677845629174549731890661"
          , "13652233645509183190158.5916189185218250859402806777406323001463"
          , "683661466754325350495.216655026531202476397782296585200982429378"
          , "28967871782219334117.0122379171041074970463982134039409352925258"
          , "1036104088560167006.20228340985723464594426017185145544883521176"
          , "31128490785613152.8380102669349814751268126141105475287632676570"
          , "779327504127342.536207878988196814811198475410572992436243686675"
          , "16067543181294.6433506887891247770204073371339261741505823339507"
          , "268161795520.300916569439413185778557212729611517883948634711190"
          , "3533216359.10528191668842486732408440112703691790824611391987709"
          , "35378979.5479656110614685178752543826919239614088343789329169536"
          , "253034.881362204346444503097491737872930637147096453940375713746"
          , "1151.61895453463992438325318456328526085882924197763140514450976"
          , "2.50662827463100050241576528481104515966515623051532908941425544"
        };

        const char* const lanczos24_g = "20.3209821879863739013671875";

        bool is_pole(const big_float& x)
        {
            return x.is_int() && (x.is_zero() || x.signbit());
        }

        //! Special cases shared by every gamma entry point. general() handles the remaining positive arguments.
        template <typename General>
        big_float gamma_dispatch(const big_float& x, const char* name, General&& general)
        {
            auto p = x.precision();
            if (x.is_inf())
            {
                if (x.signbit())
                    logger()->debug("{}: -inf has no limit, returning the undefined sentinel", name);
                return big_float::infinity(false, p);
            }
            if (is_pole(x))
            {
                logger()->debug("{}: pole at {}", name, x.str());
                return big_float::infinity(false, p);
            }
            if (x.signbit())
            {
                //! Gamma(x) = pi / (sin(pi x) Gamma(1 - x))
                auto wp = working_precision(p) + 16 + static_cast<unsigned>((std::max)(std::int64_t(0), x.exponent()));
                auto xw = x.with_precision(wp);
                auto piw = pi(wp);
                auto s = sin(piw * xw);
                auto g = gamma_dispatch(1 - xw, name, general);
                logger()->debug("{}: reflection for {}", name, x.str());
                return (piw / (s * g)).with_precision(p);
            }
            if (x.is_int() && x < exact_gamma_limit)
                return big_float::from_integer(factorial(x.to_int64() - 1), p);
            return general(x);
        }

        big_float godfrey_lanczos(const big_float& x, unsigned wp)
        {
            if (x < 0.5)
            {
                auto piw = pi(wp);
                return piw / (sin(piw * x) * godfrey_lanczos(1 - x, wp));
            }

            auto z = x.with_precision(wp) - 1;
            big_float a(godfrey_coefficients[0], wp);
            for (std::size_t i = 1; i < godfrey_coefficients.size(); ++i)
                a += big_float(godfrey_coefficients[i], wp) / (z + i);
            auto t = z + 7.5;
            auto sqrtTwoPi = sqrt(ldexp(pi(wp), 1));
            return sqrtTwoPi * exp((z + 0.5) * log(t) - t) * a;
        }

        big_float lanczos24(const big_float& x, unsigned wp)
        {
            //! Denominator z (z + 1) ... (z + 22) expanded exactly, constant term first.
            std::vector<cpp_int> den(1, cpp_int(1));
            den.insert(den.begin(), cpp_int(0));
            for (int k = 1; k <= 22; ++k)
            {
                std::vector<cpp_int> next(den.size() + 1);
                for (std::size_t i = 0; i < den.size(); ++i)
                {
                    next[i] += k * den[i];
                    next[i + 1] += den[i];
                }
                den.swap(next);
            }

            auto z = x.with_precision(wp);
            auto numSum = big_float::zero(false, wp);
            auto denSum = big_float::zero(false, wp);
            for (std::size_t i = lanczos24_numerator.size(); i-- > 0;)
            {
                numSum = numSum * z + big_float::from_string(lanczos24_numerator[i], wp);
                denSum = denSum * z + big_float::from_integer(den[i], wp);
            }

            auto zgh = z + big_float::from_string(lanczos24_g, wp) - 0.5;
            return numSum / denSum * exp((z - 0.5) * log(zgh) - zgh);
        }

        big_float lanczos_general(const big_float& x)
        {
            auto p = x.precision();
            auto wp = working_precision(p);
            if (p <= godfrey_precision_limit)
                return godfrey_lanczos(x.with_precision(wp), wp).with_precision(p);
            if (p > lanczos_precision_limit)
                logger()->debug("gamma_lanczos: {} bits exceeds the accuracy of the 24 term set", p);
            return lanczos24(x, wp).with_precision(p);
        }

        //! (x - 1/2) ln x - x grows for x >= 4, so its value at 2^exponent(x) bounds ln Gamma(x) from below.
        bool overflows_exp(const big_float& x)
        {
            auto e = x.exponent();
            if (e < 2)
                return false;
            if (e > 1000)
                return true;
            auto lower = std::ldexp(1.0, static_cast<int>(e));
            return (lower - 0.5) * static_cast<double>(e) * 0.6931471805599453 - lower > HPM_EXP_LIMIT;
        }

        big_float stirling_general(const big_float& x)
        {
            auto p = x.precision();
            auto wp = working_precision(p);

            if (overflows_exp(x))
            {
                logger()->debug("gamma_stirling: {} is beyond the exponential range", x.str(10));
                return big_float::infinity(false, p);
            }

            auto xd = x.to_double();

            //! The smallest series term is about exp(-2 pi x); shift x until it is below 2^-(wp + 16).
            auto threshold = (std::max)(10.0, (wp + 16) / 9.0);
            auto shift = xd < threshold ? static_cast<std::int64_t>(std::ceil(threshold - xd)) : std::int64_t(0);
            auto zd = xd + static_cast<double>(shift);
            auto amplification = zd * std::log(zd);
            auto wp2 = wp + 8 + (amplification > 1.0 ? static_cast<unsigned>(std::ceil(std::log2(amplification))) : 0u);

            auto z = x.with_precision(wp2) + shift;
            auto lnz = log(z);
            auto lg = (z - 0.5) * lnz - z + ldexp(log(ldexp(pi(wp2), 1)), -1);

            auto maxTerms = static_cast<std::size_t>((std::min)(std::ceil(3.14159265358979 * zd) + 1.0, wp2 / 2.0 + 8.0));
            auto t = tangent_numbers(maxTerms);
            auto z2 = z * z;
            auto zpow = z;
            auto sum = big_float::zero(false, wp2);
            auto limit = abs(lg) * series_threshold(wp2);
            auto lastMagnitude = big_float::infinity(false, wp2);
            bool converged = false;
            for (std::size_t k = 1; k <= maxTerms; ++k)
            {
                //! B_2k / (2k (2k - 1)) = (-1)^(k - 1) T_k / (2^2k (2^2k - 1) (2k - 1))
                cpp_int fourK = cpp_int(1) << static_cast<unsigned>(2 * k);
                cpp_int den = fourK * (fourK - 1) * (2 * k - 1);
                auto term = big_float::from_ratio(t[k], den, wp2) / zpow;
                auto magnitude = abs(term);
                if (magnitude > lastMagnitude)
                    break;
                sum += (k % 2 == 1) ? term : -term;
                if (magnitude <= limit)
                {
                    converged = true;
                    break;
                }
                lastMagnitude = magnitude;
                zpow *= z2;
            }
            if (!converged)
                logger()->warn("gamma_stirling: series stopped before reaching {} bits for x={}", wp2, x.str());

            auto result = exp(lg + sum);
            if (shift > 0)
            {
                auto product = big_float(1, wp2);
                auto xw = x.with_precision(wp2);
                for (std::int64_t i = 0; i < shift; ++i)
                    product *= xw + i;
                result /= product;
            }
            return result.with_precision(p);
        }

        big_float spouge_general(const big_float& x)
        {
            auto p = x.precision();
            auto wp = working_precision(p);
            if (x < 1)
            {
                //! Gamma(x) = Gamma(x + 1) / x keeps the argument where the error bound holds.
                auto xw = x.with_precision(wp);
                return (spouge_general(xw + 1) / xw).with_precision(p);
            }

            //! Relative error below (2 pi)^-(a + 1/2); the alternating coefficients cost about 2a extra bits.
            auto a = (std::max)(std::int64_t(12), static_cast<std::int64_t>(std::ceil(wp / 2.65)) + 1);
            auto ws = wp + static_cast<unsigned>(2 * a);

            auto z = x.with_precision(ws) - 1;
            auto sum = sqrt(ldexp(pi(ws), 1));
            auto eInverse = 1 / e(ws);
            auto ePower = exp(big_float(a - 1, ws));
            cpp_int kFactorial = 1;
            for (std::int64_t k = 1; k < a; ++k)
            {
                //! c_k = (-1)^(k - 1) / (k - 1)! (a - k)^(k - 1/2) e^(a - k)
                if (k > 1)
                {
                    kFactorial *= (k - 1);
                    ePower *= eInverse;
                }
                auto base = big_float(a - k, ws);
                auto c = pow_int(base, k - 1) * sqrt(base) * ePower / big_float::from_integer(kFactorial, ws);
                auto term = c / (z + k);
                sum += (k % 2 == 1) ? term : -term;
            }

            auto za = z + a;
            return (exp((z + 0.5) * log(za) - za) * sum).with_precision(p);
        }

        big_float automatic_general(const big_float& x)
        {
            auto p = x.precision();
            if (x > stirling_threshold)
            {
                logger()->debug("gamma: stirling for {} at {} bits", x.str(), p);
                return stirling_general(x);
            }
            if (p <= lanczos_precision_limit)
            {
                logger()->debug("gamma: lanczos for {} at {} bits", x.str(), p);
                return lanczos_general(x);
            }
            logger()->debug("gamma: shifted stirling for {} at {} bits", x.str(), p);
            return stirling_general(x);
        }

    }//! namespace;

    big_float gamma(const big_float& x)
    {
        return gamma_dispatch(x, "gamma", automatic_general);
    }

    big_float gamma_float64(double x)
    {
        if (std::isnan(x))
            return big_float::infinity(false, big_float::default_precision);
        return gamma(big_float(x));
    }

    big_float gamma_lanczos(const big_float& x)
    {
        return gamma_dispatch(x, "gamma_lanczos", lanczos_general);
    }

    big_float gamma_stirling(const big_float& x)
    {
        return gamma_dispatch(x, "gamma_stirling", stirling_general);
    }

    big_float gamma_spouge(const big_float& x)
    {
        return gamma_dispatch(x, "gamma_spouge", spouge_general);
    }

    big_float stirling_approximation(const big_float& n)
    {
        auto p = n.precision();
        if (n.signbit() && !n.is_zero())
            return big_float::infinity(false, p);
        if (n.is_zero())
            return big_float(1, p);
        if (n.is_inf())
            return n;

        auto wp = working_precision(p) + 8;
        auto nw = n.with_precision(wp);
        auto twoPiN = ldexp(pi(wp), 1) * nw;
        return (sqrt(twoPiN) * exp(nw * (log(nw) - 1))).with_precision(p);
    }

}//! namespace hpm;
