/*
Copyright (c) 2025, 2026 acrion innovations GmbH
Authors: Stefan Zipproth, s.zipproth@acrion.ch

This file is part of agora.

agora is offered under a commercial and under the AGPL license.
For commercial licensing, contact us at https://acrion.ch/sales. For AGPL licensing, see below.

AGPL licensing:

agora is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

agora is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with agora. If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace agora
{
    class StopWatch
    {
    public:
        StopWatch() { start(); }

        void start()
        {
            _start   = std::chrono::steady_clock::now();
            _running = true;
        }

        void stop()
        {
            _stop    = std::chrono::steady_clock::now();
            _running = false;
        }

        bool is_running() const { return _running; }

        // microseconds
        uint64_t duration() const
        {
            auto end = _running ? std::chrono::steady_clock::now() : _stop;
            return std::chrono::duration_cast<std::chrono::microseconds>(end - _start).count();
        }

        double milliseconds() const { return static_cast<double>(duration()) / 1000.0; }

        std::string format() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3) << milliseconds() << " ms";
            return oss.str();
        }

    private:
        std::chrono::steady_clock::time_point _start;
        std::chrono::steady_clock::time_point _stop;
        bool                                  _running{false};
    };
}
