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

#ifndef ORBINT_DETAIL_ATOMIC_MINMAX_HPP
#define ORBINT_DETAIL_ATOMIC_MINMAX_HPP

#include <atomic>

namespace orbint::detail
{

// Helper to atomically set out to std::min(out, val).
// NOTE: this assumes no NaNs are involved in the comparison.
template <typename T>
void atomic_min(std::atomic<T> &out, T val)
{
    auto orig_val = out.load();

    // NOTE: compare_exchange_weak() reloads orig_val on failure.
    while (val < orig_val && !out.compare_exchange_weak(orig_val, val)) {
    }
}

} // namespace orbint::detail

#endif
