// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <MemoryMap.hpp>
#include <fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace Memory {

struct Contribution {
  std::size_t source{};
  byte_vector data;
  bool operator==(Contribution const &) const = default;
};

// Keyed by range start. Every contribution of one entry has the same length
// and the contributions are ordered by source index, ascending.
using OverlapMap = std::map<address_t, std::vector<Contribution>>;

// Splits the inputs at every block boundary of every map. Later maps in the
// input sequence have higher priority when flattening.
OverlapMap overlap(std::span<SparseMemoryMap const> maps);

// Last writer wins for each range, adjacent ranges are joined
SparseMemoryMap flatten(OverlapMap const &overlaps);

inline SparseMemoryMap flatten(std::span<SparseMemoryMap const> maps) {
  return flatten(overlap(maps));
}

// Splits blocks at page_size boundaries. Without fill no byte is invented,
// with fill each touched page becomes one complete page.
SparseMemoryMap paginate(SparseMemoryMap const &map, std::uint32_t page_size,
                         std::optional<std::uint8_t> fill = std::nullopt);

inline std::uint64_t page_floor(std::uint64_t addr, std::uint32_t page_size) {
  return addr - addr % page_size;
}

inline std::uint64_t page_ceil(std::uint64_t addr, std::uint32_t page_size) {
  return page_floor(addr + page_size - 1, page_size);
}

} // namespace Memory
