// Copyright 2024-2025 Francesco Biscani
//
// This file is part of the orbint library.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#ifndef ORBINT_JULIAN_HPP
#define ORBINT_JULIAN_HPP

namespace orbint
{

// Gregorian calendar date and time of day (UTC).
struct calendar_date {
    int year = 2000;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    double second = 0;
};

// Julian date of a Gregorian calendar date.
[[nodiscard]] double calendar_to_jd(int year, int month, int day, int hour = 0, int minute = 0, double second = 0);
[[nodiscard]] double calendar_to_jd(const calendar_date &);

// Gregorian calendar date of a Julian date. Only dates after
// the 1582 calendar reform are supported.
[[nodiscard]] calendar_date jd_to_calendar(double);

} // namespace orbint

#endif
