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

#include "Numtools/Algorithm/Interpolate.hpp"
#include "Numtools/Algorithm/NumericTraits.hpp"
#include "Numtools/Diagnostics.hpp"
// In alphabetical order
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/// \brief This namespace defines the public interfaces of
/// the \ref numtools_module module
namespace Numtools
{
    /// Coordinate space in which the samples are linearly interpolated
    enum class interpolation_method
    {
        loglog,     // log(y) against log(x) -- power laws are reproduced exactly
        xlog,       // y against log(x)
        ylog        // log(y) against x -- exponentials are reproduced exactly
    };

    inline std::string to_string(interpolation_method method)
    {
        switch (method)
        {
        case interpolation_method::xlog: return "xlog";
        case interpolation_method::ylog: return "ylog";
        default: return "loglog";
        }
    }

    /// Parses "loglog", "xlog" or "ylog" -- throws std::invalid_argument for anything else
    inline interpolation_method parse_interpolation_method(const std::string &name)
    {
        if (name == "loglog")
            return interpolation_method::loglog;
        if (name == "xlog")
            return interpolation_method::xlog;
        if (name == "ylog")
            return interpolation_method::ylog;
        throw std::invalid_argument("Unknown method: " + name);
    }

    /// \brief Piecewise linear interpolant in log-log, log-x or log-y space
    ///
    /// The samples are divided by `unit_scale` of their type, transformed
    /// according to the method and handed to a \ref linear_interpolator.
    ///
    /// - loglog and ylog clamp negative y samples to 0 and interpolate
    ///   log(y), where log(0) = -inf. A nan produced by the -inf samples
    ///   evaluates to 0. By default the interpolant is 0 outside of the
    ///   sampled range.
    /// - xlog keeps y as is (negative values are fine) and defaults to 0
    ///   outside of the sampled range.
    /// - loglog and xlog can't be evaluated at x <= 0; such a query emits
    ///   a warning to the diagnostic sink and returns 0.
    ///
    /// A constant extrapolation level is divided by the y unit and given to
    /// the linear interpolator unchanged, i.e. it is a level in the
    /// interpolated coordinate. For loglog and ylog a level of -inf
    /// therefore gives 0 and a level of 0 gives 1 (times the y unit).
    /// `extrapolation_bc<TY>::throw_error()` makes out of range queries throw
    /// std::out_of_range in every method.
    ///
    /// The object is immutable after construction; it can be evaluated
    /// concurrently as long as its diagnostic sink can.
    template <typename TX, typename TY = TX>
    class log_interpolator
    {
    public:
        using x_type = TX;
        using y_type = TY;
        using boundary_type = extrapolation_bc<TY>;
        using real = typename std::common_type<
            typename magnitude_type<TX>::type,
            typename magnitude_type<TY>::type>::type;

        log_interpolator(
            const std::vector<TX> &x,
            const std::vector<TY> &y,
            interpolation_method method = interpolation_method::loglog,
            boundary_type bc = boundary_type(),
            diagnostic_sink sink = default_sink())
            : _method(method)
            , _sink(std::move(sink))
            , _backend(transform_samples(x, y, method, bc))
        {
        }

        log_interpolator(
            const std::vector<TX> &x,
            const std::vector<TY> &y,
            const std::string &method,
            boundary_type bc = boundary_type(),
            diagnostic_sink sink = default_sink())
            : log_interpolator(x, y, parse_interpolation_method(method), bc, std::move(sink))
        {
        }

        TY operator()(const TX &query) const
        {
            auto point = static_cast<real>(query / unit_scale<TX>::value());

            if (takes_log_x(_method))
            {
                if (point <= 0)
                {
                    std::ostringstream message;
                    message << "log_interpolator: non-positive x = " << point
                        << " queried from a " << to_string(_method) << " interpolant, returning 0";
                    emit(_sink, log_level::warning, message.str());
                    return to_y(real(0));
                }
                point = std::log(point);
            }

            auto value = _backend(point);

            if (takes_log_y(_method))
            {
                value = std::exp(value);
                if (std::isnan(value))
                    value = 0;
            }
            return to_y(value);
        }

        std::vector<TY> operator()(const std::vector<TX> &queries) const
        {
            std::vector<TY> output;
            output.reserve(queries.size());
            for (auto &query : queries)
                output.push_back(operator()(query));
            return output;
        }

        interpolation_method method() const { return _method; }

        /// Sampled range in the units of the input
        TX x_min() const { return to_x(_backend.x_min()); }
        TX x_max() const { return to_x(_backend.x_max()); }

    private:
        interpolation_method _method;
        diagnostic_sink _sink;
        linear_interpolator<real> _backend;

        static bool takes_log_x(interpolation_method m) { return m != interpolation_method::ylog; }
        static bool takes_log_y(interpolation_method m) { return m != interpolation_method::xlog; }

        TY to_y(real value) const { return value * unit_scale<TY>::value(); }

        TX to_x(real value) const
        {
            return (takes_log_x(_method) ? std::exp(value) : value) * unit_scale<TX>::value();
        }

        static linear_interpolator<real> transform_samples(
            const std::vector<TX> &x,
            const std::vector<TY> &y,
            interpolation_method method,
            const boundary_type &bc)
        {
            auto x_unit = unit_scale<TX>::value();
            auto y_unit = unit_scale<TY>::value();

            std::vector<real> xs;
            xs.reserve(x.size());
            for (auto &sample : x)
            {
                auto value = static_cast<real>(sample / x_unit);
                xs.push_back(takes_log_x(method) ? std::log(value) : value);
            }

            std::vector<real> ys;
            ys.reserve(y.size());
            for (auto &sample : y)
            {
                auto value = static_cast<real>(sample / y_unit);
                if (takes_log_y(method))
                    value = std::log(value < 0 ? real(0) : value);
                ys.push_back(value);
            }

            extrapolation_bc<real> boundary;
            switch (bc.kind)
            {
            case extrapolation_kind::unspecified:
                // exp(lowest) == 0 for the log-y methods
                boundary = extrapolation_bc<real>(takes_log_y(method) ? std::numeric_limits<real>::lowest() : real(0));
                break;
            case extrapolation_kind::constant:
                boundary = extrapolation_bc<real>(static_cast<real>(bc.level / y_unit));
                break;
            default:
                boundary = extrapolation_bc<real>(bc.kind, real(0));
                break;
            }

            return linear_interpolator<real>(std::move(xs), std::move(ys), boundary);
        }
    };

    /// \brief Builds a \ref log_interpolator over the samples (x, y)
    ///
    /// \param x        Strictly increasing sample points
    /// \param y        Sample values, same size as x
    /// \param method   loglog (default), xlog or ylog
    /// \param bc       Extrapolation condition, see \ref log_interpolator
    /// \param sink     Receiver of the warnings emitted by the interpolant
    template <typename TX, typename TY>
    log_interpolator<TX, TY> make_log_interpolator(
        const std::vector<TX> &x,
        const std::vector<TY> &y,
        interpolation_method method = interpolation_method::loglog,
        typename log_interpolator<TX, TY>::boundary_type bc = {},
        diagnostic_sink sink = default_sink())
    {
        return log_interpolator<TX, TY>(x, y, method, bc, std::move(sink));
    }

    template <typename TX, typename TY>
    log_interpolator<TX, TY> make_log_interpolator(
        const std::vector<TX> &x,
        const std::vector<TY> &y,
        const std::string &method,
        typename log_interpolator<TX, TY>::boundary_type bc = {},
        diagnostic_sink sink = default_sink())
    {
        return log_interpolator<TX, TY>(x, y, parse_interpolation_method(method), bc, std::move(sink));
    }
}
