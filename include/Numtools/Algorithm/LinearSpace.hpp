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
#include <stdexcept>
#include <vector>

/// \brief This namespace defines the public interfaces of
/// the \ref numtools_module module
namespace Numtools
{
    /// \brief Generates *num* points between *start* and *stop* with a constant step.
    ///
    /// The first point is exactly *start*. Each following point adds the
    /// step `d = (stop - start) / n` to its predecessor, where `n = num - 1`
    /// when *endpoint* is set and `n = num` otherwise. With *endpoint*
    /// the last point equals *stop* up to the rounding of the step.
    ///
    /// Integer arguments yield a sequence of doubles.
    ///
    /// \param start    Starting point
    /// \param stop     Ending point
    /// \param num      Number of points, must be at least 2
    /// \param endpoint True to include *stop* as the last point
    ///
    /// \returns Vector of *num* linearly spaced points
    ///
    /// \throws std::invalid_argument if num <= 1
    ///
    /// See also: \ref numtools_specs_linear_space
    template <typename T, typename U>
    std::vector<typename sequence_type<T, U>::type> linspace(T start, U stop, int num = 50, bool endpoint = true)
    {
        using value_type = typename sequence_type<T, U>::type;

        if (num <= 1)
            throw std::invalid_argument("num <= 1");

        auto first = static_cast<value_type>(start);
        auto last = static_cast<value_type>(stop);
        auto n = endpoint ? num - 1 : num;
        auto step = (last - first) / n;

        std::vector<value_type> points(static_cast<size_t>(num), first);
        for (size_t k = 1; k < points.size(); ++k)
            points[k] = points[k - 1] + step;

        return points;
    }

    /// \brief Generates *num* points between *start* and *stop* with a constant ratio.
    ///
    /// The first point is exactly *start*. Each following point is its
    /// predecessor multiplied by `q = (stop / start)^(1 / n)`, with *n* as in
    /// \ref linspace.
    ///
    /// *start* and *stop* must be non-zero and of the same sign; the sign
    /// is carried through the whole sequence.
    ///
    /// \param start    Starting point
    /// \param stop     Ending point
    /// \param num      Number of points, must be at least 2
    /// \param endpoint True to include *stop* as the last point
    ///
    /// \returns Vector of *num* geometrically spaced points
    ///
    /// \throws std::invalid_argument if num <= 1
    template <typename T, typename U>
    std::vector<typename sequence_type<T, U>::type> geomspace(T start, U stop, int num = 50, bool endpoint = true)
    {
        using value_type = typename sequence_type<T, U>::type;
        using std::pow;

        if (num <= 1)
            throw std::invalid_argument("num <= 1");

        auto first = static_cast<value_type>(start);
        auto last = static_cast<value_type>(stop);
        auto n = endpoint ? num - 1 : num;
        auto ratio = pow(last / first, 1.0 / static_cast<double>(n));

        std::vector<value_type> points(static_cast<size_t>(num), first);
        for (size_t k = 1; k < points.size(); ++k)
            points[k] = points[k - 1] * ratio;

        return points;
    }

    /// Geometric sequence from base^start_exp to base^stop_exp
    inline std::vector<double> logspace(double start_exp, double stop_exp, int num = 50, bool endpoint = true, double base = 10.0)
    {
        return geomspace(std::pow(base, start_exp), std::pow(base, stop_exp), num, endpoint);
    }
}
