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

#include "Numtools/Diagnostics.hpp"
// In alphabetical order
#include <cmath>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace numtools_specs
{
    /// Minimal dimensioned value: a double carrying the power L of a length unit
    /// Products and ratios track the power, square root halves it.
    template <int L>
    struct quantity
    {
        double value;
        quantity() : value(0.0) { }
        explicit quantity(double v) : value(v) { }
    };

    using length = quantity<1>;
    using area = quantity<2>;

    template <int L> quantity<L> operator +(quantity<L> a, quantity<L> b) { return quantity<L>(a.value + b.value); }
    template <int L> quantity<L> operator -(quantity<L> a, quantity<L> b) { return quantity<L>(a.value - b.value); }
    template <int L> quantity<L> operator *(quantity<L> a, double b) { return quantity<L>(a.value * b); }
    template <int L> quantity<L> operator *(double a, quantity<L> b) { return quantity<L>(a * b.value); }
    template <int L> quantity<L> operator /(quantity<L> a, double b) { return quantity<L>(a.value / b); }
    template <int L> double operator /(quantity<L> a, quantity<L> b) { return a.value / b.value; }
    template <int L, int M> quantity<L + M> operator *(quantity<L> a, quantity<M> b) { return quantity<L + M>(a.value * b.value); }

    template <int L> bool operator <(quantity<L> a, quantity<L> b) { return a.value < b.value; }
    template <int L> bool operator >(quantity<L> a, quantity<L> b) { return a.value > b.value; }
    template <int L> bool operator ==(quantity<L> a, quantity<L> b) { return a.value == b.value; }

    template <int L>
    std::ostream &operator <<(std::ostream &os, quantity<L> a)
    {
        return os << a.value << " m^" << L;
    }

    template <int L>
    quantity<L / 2> sqrt(quantity<L> a)
    {
        static_assert(L % 2 == 0, "square root of an odd power of length");
        return quantity<L / 2>(std::sqrt(a.value));
    }

    /// Diagnostic sink recording every message
    struct captured_messages
    {
        std::vector<std::pair<Numtools::log_level, std::string>> records;
        std::mutex guard;

        Numtools::diagnostic_sink sink()
        {
            return [this](Numtools::log_level level, const std::string &message)
            {
                std::lock_guard<std::mutex> lock(guard);
                records.emplace_back(level, message);
            };
        }

        size_t size()
        {
            std::lock_guard<std::mutex> lock(guard);
            return records.size();
        }
    };
}
