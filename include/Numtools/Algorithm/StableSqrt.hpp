/*
* Copyright (c) 2019, Intel Corporation
* All rights reserved.
*
* Redistribution and use in source and binary forms, with or without
* modification, are permitted provided that the following conditions are met:
*     * Redistributions of source code must retain the above copyright
*       notice, this list of conditions and the following disclaimer.
*     * Redistributions in binary form must reproduce the above copyright
*       notice, this list of conditions and the following disclaimer in the
*       documentation and/or other materials provided with the distribution.
*     * Neither the name of the Intel Corporation nor the
*       names of its contributors may be used to endorse or promote products
*       derived from this software without specific prior written permission.
*
* THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
* ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
* WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
* DISCLAIMED. IN NO EVENT SHALL <COPYRIGHT HOLDER> BE LIABLE FOR ANY
* DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
* LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
* ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
* SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/


#pragma once

#include "Numtools/Algorithm/NumericTraits.hpp"
// In alphabetical order
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

/// \brief This namespace defines the public interfaces of
/// the \ref numtools_module module
namespace Numtools
{
    namespace detail
    {
        template <typename T>
        void throw_below_minus_one(T x)
        {
            std::ostringstream message;
            message << x << " < -1";
            throw std::domain_error(message.str());
        }

        template <typename T, typename U>
        void throw_negative_radicand(const T &x, const U &a)
        {
            std::ostringstream message;
            message << "a^2 + x < 0 for x = " << x << ", a = " << a;
            throw std::domain_error(message.str());
        }
    }

    /// \brief Computes `sqrt(1 + x) - 1` without cancellation for small *x*.
    ///
    /// The naive formula returns 0 for |x| ~ 1e-16 as all significant
    /// digits cancel. Below `2 * epsilon` the first Taylor term `x / 2` is
    /// exact to the last bit; above it the difference is evaluated as
    /// `x / (sqrt(1 + x) + 1)`, which is algebraically the same and has no
    /// subtraction at all.
    ///
    /// sqrtm1(-1) == -1, sqrtm1(0) == 0, sqrtm1(1e-16) == 5e-17
    ///
    /// \param x    Argument, x >= -1
    /// \returns    sqrt(1 + x) - 1
    /// \throws std::domain_error if x < -1
    template <typename T>
    typename std::enable_if<std::is_floating_point<T>::value, T>::type
        sqrtm1(T x)
    {
        if (x < -1)
            detail::throw_below_minus_one(x);

        if (std::fabs(x) < 2 * std::numeric_limits<T>::epsilon())
            return x / 2;

        // inf / inf would give nan
        if (std::isinf(x))
            return x;

        return x / (std::sqrt(1 + x) + 1);
    }

    /// Integers are never small enough to cancel -- the direct formula is exact enough
    template <typename T>
    typename std::enable_if<std::is_integral<T>::value, double>::type
        sqrtm1(T x)
    {
        if (x < -1)
            detail::throw_below_minus_one(x);
        return std::sqrt(1.0 + static_cast<double>(x)) - 1.0;
    }

    /// \brief Computes `sqrt(a^2 + x) - a`, useful when *x* is tiny compared to a^2.
    ///
    /// For positive *a* the result is `a * sqrtm1(x / a^2)`. Otherwise the
    /// terms add up instead of cancelling and the formula is evaluated as is;
    /// in particular `sqrtm1(x, 0) == sqrt(x)`.
    ///
    /// *x* must have the dimension of `a * a`. Dimensioned types are
    /// supported as long as `sqrt` is found by argument dependent lookup,
    /// the types can be constructed from 0 and written to a std::ostream.
    ///
    /// \throws std::domain_error if a^2 + x < 0
    template <typename T, typename U>
    typename real_type<U>::type sqrtm1(T x, U a)
    {
        using result_type = typename real_type<U>::type;
        using std::sqrt;

        auto b = static_cast<result_type>(a);
        if (b > result_type(0))
        {
            auto scaled = x / (b * b);
            if (scaled < -1)
                detail::throw_negative_radicand(x, a);
            return b * sqrtm1(scaled);
        }

        auto radicand = b * b + x;
        if (radicand < decltype(radicand)(0))
            detail::throw_negative_radicand(x, a);

        return sqrt(radicand) - b;
    }
}
