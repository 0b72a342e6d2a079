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
#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

/// \brief This namespace defines the public interfaces of
/// the \ref numtools_module module
namespace Numtools
{
    /// Severity of a diagnostic message -- larger is more severe
    enum class log_level
    {
        notset = 0,
        debug = 10,
        info = 20,
        warning = 30,
        error = 40,
        critical = 50
    };

    inline const char *to_string(log_level level)
    {
        switch (level)
        {
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warning: return "WARNING";
        case log_level::error: return "ERROR";
        case log_level::critical: return "CRITICAL";
        default: return "NOTSET";
        }
    }

    /// Receiver of diagnostic messages -- e.g. a logger, a test probe or nothing at all
    using diagnostic_sink = std::function<void(log_level, const std::string &)>;

    /// \brief Minimum level printed by \ref stderr_sink
    ///
    /// Read once from the environment variable `NUMTOOLS_LOG_LEVEL`,
    /// which holds an integer level (e.g. 10 to see debug messages).
    /// Missing or malformed values select `log_level::warning`.
    inline log_level minimum_log_level()
    {
        static const log_level level = []() -> log_level
        {
            const char *env_level = std::getenv("NUMTOOLS_LOG_LEVEL");
            if (env_level == nullptr)
                return log_level::warning;
            try
            {
                return static_cast<log_level>(std::max(0, std::stoi(env_level)));
            }
            catch (const std::invalid_argument &)
            {
                return log_level::warning;
            }
            catch (const std::out_of_range &)
            {
                return log_level::warning;
            }
        }();
        return level;
    }

    namespace detail
    {
        inline std::mutex &stderr_guard()
        {
            static std::mutex guard;
            return guard;
        }

        inline std::mutex &default_sink_guard()
        {
            static std::mutex guard;
            return guard;
        }
    }

    /// Sink printing "LEVEL: message" lines to std::cerr, filtered by \ref minimum_log_level
    inline diagnostic_sink stderr_sink()
    {
        return [](log_level level, const std::string &message)
        {
            if (static_cast<int>(level) < static_cast<int>(minimum_log_level()))
                return;

            std::lock_guard<std::mutex> lock(detail::stderr_guard());
            std::cerr << to_string(level) << ": " << message << std::endl;
        };
    }

    /// Sink ignoring all messages
    inline diagnostic_sink null_sink()
    {
        return [](log_level, const std::string &) { };
    }

    namespace detail
    {
        inline diagnostic_sink &default_sink_storage()
        {
            static diagnostic_sink sink = stderr_sink();
            return sink;
        }
    }

    /// \brief Returns a copy of the process wide sink
    ///
    /// Objects reporting diagnostics take their copy at construction,
    /// so replacing the default later does not affect existing objects.
    inline diagnostic_sink default_sink()
    {
        std::lock_guard<std::mutex> lock(detail::default_sink_guard());
        return detail::default_sink_storage();
    }

    /// Replaces the process wide sink; an empty sink restores \ref stderr_sink
    inline void set_default_sink(diagnostic_sink sink)
    {
        std::lock_guard<std::mutex> lock(detail::default_sink_guard());
        detail::default_sink_storage() = sink ? std::move(sink) : stderr_sink();
    }

    /// Forwards a message to the sink if there is one
    inline void emit(const diagnostic_sink &sink, log_level level, const std::string &message)
    {
        if (sink)
            sink(level, message);
    }
}
