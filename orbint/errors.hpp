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

#ifndef ORBINT_ERRORS_HPP
#define ORBINT_ERRORS_HPP

#include <stdexcept>

namespace orbint
{

// Malformed orbital elements (non-positive semi-major axis,
// eccentricity outside [0, 1), non-finite values).
class invalid_elements : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// The Kepler solver did not converge within its iteration budget.
class numeric_divergence : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An empty (or otherwise unusable) trajectory was supplied.
class insufficient_data : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Unknown propulsion tag in the cost estimator.
class invalid_propulsion_type : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace orbint

#endif
