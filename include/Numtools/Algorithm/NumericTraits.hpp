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
#include <type_traits>
#include <utility>

/// \brief This namespace defines the public interfaces of
/// the \ref numtools_module module
namespace Numtools
{
    /// \brief Maps a sample type to the type used for fractional results
    ///
    /// Integral types are promoted to double, so that e.g. a sequence
    /// generated between two integers gets a floating point step.
    /// Floating point and user defined (e.g. unit carrying) types are kept.
    template <typename T, typename Enable = void>
    struct real_type
    {
        using type = T;
    };

    template <typename T>
    struct real_type<T, typename std::enable_if<std::is_integral<T>::value>::type>
    {
        using type = double;
    };

    /// Element type of a sequence spanning from a value of type T to a value of type U
    template <typename T, typename U>
    struct sequence_type
    {
        using type = typename real_type<typename std::common_type<T, U>::type>::type;
    };

    /// \brief Representative unit of a (possibly dimensioned) sample type
    ///
    /// Dividing a sample by `unit_scale<T>::value()` yields a plain number,
    /// and multiplying a plain number by it restores the dimension.
    /// For arithmetic types this is the identity. A quantity type opts in
    /// by specializing this template.
    template <typename T>
    struct unit_scale
    {
        static T value() { return T(1); }
    };

    /// Dimensionless (and fractional) type of `T / unit_scale<T>::value()`
    template <typename T>
    struct magnitude_type
    {
        using type = typename real_type<
            typename std::decay<decltype(std::declval<T>() / std::declval<T>())>::type>::type;
    };
}
