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

// In alphabetical order
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

/// \brief This namespace defines the public interfaces of
/// the \ref numtools_module module
namespace Numtools
{
    /// What to return for query points outside of the sampled range
    enum class extrapolation_kind
    {
        unspecified,    // Let the user of the interpolator decide (a constant 0 for the plain interpolator)
        constant,       // Return a fixed level
        flat,           // Repeat the first / last sample
        linear,         // Extend the first / last segment
        throw_error     // Throw std::out_of_range
    };

    /// \brief Extrapolation boundary condition
    ///
    /// Implicitly constructible from a value of type T, so that a plain
    /// number can be given where a boundary condition is expected:
    ///
    ///     linear_interpolator<double>(x, y, -1.0);
    ///     linear_interpolator<double>(x, y, extrapolation_bc<double>::throw_error());
    template <typename T>
    struct extrapolation_bc
    {
        extrapolation_kind kind;
        T level;            // Valid for extrapolation_kind::constant

        extrapolation_bc() : kind(extrapolation_kind::unspecified), level() { }
        extrapolation_bc(T value) : kind(extrapolation_kind::constant), level(value) { }
        extrapolation_bc(extrapolation_kind k, T value) : kind(k), level(value) { }

        static extrapolation_bc throw_error() { return extrapolation_bc(extrapolation_kind::throw_error, T()); }
        static extrapolation_bc flat() { return extrapolation_bc(extrapolation_kind::flat, T()); }
        static extrapolation_bc linear() { return extrapolation_bc(extrapolation_kind::linear, T()); }

        bool is_specified() const { return kind != extrapolation_kind::unspecified; }
    };

    /// \brief Piecewise linear interpolation of sampled data
    ///
    /// The x samples must be strictly increasing. The y samples may contain
    /// infinities; e.g. a -inf sample stands for log(0) when the data has
    /// been log transformed. Between two samples the value is
    /// `(1 - t) * y0 + t * y1`, which keeps -inf between two -inf samples.
    /// An exact hit of a sample returns that sample as is.
    ///
    /// The object is immutable after construction and safe to evaluate
    /// from multiple threads.
    template <typename T>
    class linear_interpolator
    {
    public:
        using type = T;
        using boundary_type = extrapolation_bc<T>;

        linear_interpolator(std::vector<T> x, std::vector<T> y, extrapolation_bc<T> bc = {})
            : x_data(std::move(x)), y_data(std::move(y)), boundary(bc)
        {
            if (x_data.size() != y_data.size())
                throw std::invalid_argument("input vectors don't match in size");

            if (x_data.size() < 2)
                throw std::invalid_argument("At least two samples are required for interpolation");

            for (size_t i = 0; i < x_data.size(); i++)
            {
                if (std::isnan(x_data[i]))
                    throw std::invalid_argument("x samples must not contain nan");
                if (i > 0 && !(x_data[i - 1] < x_data[i]))
                    throw std::invalid_argument("x samples must be strictly increasing");
            }

            if (!boundary.is_specified())
                boundary = extrapolation_bc<T>(T(0));
        }

        /// Evaluates the interpolant at a single point
        T operator()(T point) const
        {
            if (std::isnan(point))
                return point;

            if (point < x_data.front() || point > x_data.back())
                return extrapolate(point);

            // Binary search the first sample strictly above the point
            auto upper = std::upper_bound(x_data.begin(), x_data.end(), point);
            if (upper == x_data.end())
                return y_data.back();

            auto upper_index = static_cast<size_t>(upper - x_data.begin());
            auto lower_index = upper_index - 1;
            if (x_data[lower_index] == point)
                return y_data[lower_index];

            return segment(lower_index, point);
        }

        /// Evaluates the interpolant at each of the points
        std::vector<T> operator()(const std::vector<T> &points) const
        {
            std::vector<T> output;
            output.reserve(points.size());
            for (auto &point : points)
                output.push_back(operator()(point));
            return output;
        }

        T x_min() const { return x_data.front(); }
        T x_max() const { return x_data.back(); }
        const extrapolation_bc<T> &extrapolation() const { return boundary; }

    private:
        std::vector<T> x_data;
        std::vector<T> y_data;
        extrapolation_bc<T> boundary;

        // (1-t)*v0 + t*v1 along the segment starting at sample `lower`
        T segment(size_t lower, T point) const
        {
            auto t = (point - x_data[lower]) / (x_data[lower + 1] - x_data[lower]);
            return (1 - t) * y_data[lower] + t * y_data[lower + 1];
        }

        T extrapolate(T point) const
        {
            auto below = point < x_data.front();
            switch (boundary.kind)
            {
            case extrapolation_kind::flat:
                return below ? y_data.front() : y_data.back();
            case extrapolation_kind::linear:
                return segment(below ? 0 : x_data.size() - 2, point);
            case extrapolation_kind::throw_error:
            {
                std::ostringstream message;
                message << "Interpolation point " << point << " is outside of the sampled range ["
                    << x_data.front() << ", " << x_data.back() << "]";
                throw std::out_of_range(message.str());
            }
            default:
                return boundary.level;
            }
        }
    };

    /// <summary>
    /// Linearly interpolates input data in sampling points as in Matlab.
    /// x_data must be strictly monotonically increasing.
    /// Values outside of input range are set to zero unless another
    /// boundary condition is given.
    /// </summary>
    template <typename T>
    inline std::vector<T> interp1d(
        const std::vector<T> &x_data,
        const std::vector<T> &y_data,
        const std::vector<T> &sampling_points,
        typename linear_interpolator<T>::boundary_type bc = T(0))
    {
        return linear_interpolator<T>(x_data, y_data, bc)(sampling_points);
    }
}
