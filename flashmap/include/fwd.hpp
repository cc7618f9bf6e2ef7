// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <range/v3/algorithm/copy.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/subrange.hpp>
#include <range/v3/view/transform.hpp>

namespace rg = ranges;
namespace rgv = rg::views;

using std::literals::string_literals::operator""s;
using std::literals::string_view_literals::operator""sv;

inline constexpr auto operator""_b(unsigned long long val) {
  return std::uint8_t(val);
}

using byte_vector = std::vector<std::uint8_t>;

// 32 bit target address space, ranges are computed in 64 bits
using address_t = std::uint32_t;
inline constexpr std::uint64_t address_space_end = std::uint64_t{1} << 32;
