// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <MapAlgebra.hpp>

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace Memory {

namespace {
byte_vector copy_range(Block const &b, std::uint64_t from, std::uint64_t to) {
  const auto first = std::next(b.data.begin(), from - b.base_addr);
  return byte_vector(first, std::next(first, to - from));
}

std::vector<std::uint64_t>
block_boundaries(std::span<SparseMemoryMap const> maps) {
  std::vector<std::uint64_t> bounds;
  for (SparseMemoryMap const &map : maps) {
    for (Block const &b : map) {
      bounds.push_back(b.base_addr);
      bounds.push_back(b.end());
    }
  }
  std::sort(bounds.begin(), bounds.end());
  bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());
  return bounds;
}

void ensure_resolvable(address_t addr, std::vector<Contribution> const &c) {
  if (c.empty()) {
    throw OverlapResolutionAmbiguous(
        fmt::format("No contribution for range at 0x{:08x}", addr));
  }
  const auto len = c.front().data.size();
  for (auto it = c.begin(); it != c.end(); ++it) {
    if (it->data.size() != len || it->data.empty()) {
      throw OverlapResolutionAmbiguous(fmt::format(
          "Contributions of differing length at 0x{:08x}", addr));
    }
    if (it != c.begin() && std::prev(it)->source >= it->source) {
      throw OverlapResolutionAmbiguous(fmt::format(
          "Contributions out of priority order at 0x{:08x}", addr));
    }
  }
}
} // namespace

OverlapMap overlap(std::span<SparseMemoryMap const> maps) {
  const auto bounds = block_boundaries(maps);
  std::vector<SparseMemoryMap::const_iterator> cursors;
  cursors.reserve(maps.size());
  for (SparseMemoryMap const &map : maps) {
    cursors.push_back(map.begin());
  }

  OverlapMap res;
  for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
    const auto lo = bounds[i];
    const auto hi = bounds[i + 1];
    std::vector<Contribution> contributions;
    for (std::size_t src = 0; src < maps.size(); ++src) {
      auto &it = cursors[src];
      while (it != maps[src].end() && it->end() <= lo) {
        ++it;
      }
      // every block end is a boundary, so a block starting at or below lo
      // covers the whole [lo, hi) range
      if (it != maps[src].end() && it->base_addr <= lo) {
        contributions.push_back(Contribution{src, copy_range(*it, lo, hi)});
      }
    }
    if (!contributions.empty()) {
      res.emplace_hint(res.end(), static_cast<address_t>(lo),
                       std::move(contributions));
    }
  }
  return res;
}

SparseMemoryMap flatten(OverlapMap const &overlaps) {
  SparseMemoryMap res;
  std::uint64_t prev_end = 0;
  for (auto const &[addr, contributions] : overlaps) {
    ensure_resolvable(addr, contributions);
    if (addr < prev_end) {
      throw OverlapResolutionAmbiguous(
          fmt::format("Overlapping ranges in overlap map at 0x{:08x}", addr));
    }
    auto const &winner = contributions.back().data;
    prev_end = std::uint64_t{addr} + winner.size();
    res.set(addr, winner);
  }
  return res.join();
}

SparseMemoryMap paginate(SparseMemoryMap const &map, std::uint32_t page_size,
                         std::optional<std::uint8_t> fill) {
  if (page_size == 0) {
    throw MalformedRange("Page size must be positive");
  }
  SparseMemoryMap res;
  std::optional<Block> page;
  auto flush = [&] {
    if (page) {
      res.set(page->base_addr, std::move(page->data));
      page.reset();
    }
  };

  for (Block const &b : map) {
    for (std::uint64_t pos = b.base_addr; pos < b.end();) {
      const auto page_start = page_floor(pos, page_size);
      const auto to = std::min(b.end(), page_start + page_size);
      if (!fill) {
        res.set(static_cast<address_t>(pos), copy_range(b, pos, to));
      } else {
        if (!page || page->base_addr != page_start) {
          flush();
          ensure_fits(page_start, page_size);
          page = Block{static_cast<address_t>(page_start),
                       byte_vector(page_size, *fill)};
        }
        const auto src = std::next(b.data.begin(), pos - b.base_addr);
        std::copy(src, std::next(src, to - pos),
                  std::next(page->data.begin(), pos - page_start));
      }
      pos = to;
    }
  }
  flush();
  return res;
}

} // namespace Memory
