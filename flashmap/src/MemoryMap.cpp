// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <MemoryMap.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

using namespace Memory;

void Memory::ensure_fits(std::uint64_t addr, std::uint64_t length) {
  if (addr >= address_space_end || length > address_space_end - addr) {
    throw MalformedRange(fmt::format(
        "Range [0x{:x}, +0x{:x}) exceeds the 32 bit address space", addr,
        length));
  }
}

namespace {
byte_vector sub_bytes(Block const &b, std::uint64_t from, std::uint64_t to) {
  const auto first = std::next(b.data.begin(), from - b.base_addr);
  const auto last = std::next(b.data.begin(), to - b.base_addr);
  return byte_vector(first, last);
}
} // namespace

SparseMemoryMap SparseMemoryMap::from_bytes(address_t addr, byte_vector bytes) {
  SparseMemoryMap res;
  res.set(addr, std::move(bytes));
  return res;
}

SparseMemoryMap
SparseMemoryMap::from_padded_bytes(address_t addr,
                                   std::span<std::uint8_t const> bytes,
                                   std::uint8_t pad, std::size_t min_pad_run) {
  if (min_pad_run == 0) {
    throw std::invalid_argument("minimum padding run must be positive");
  }
  SparseMemoryMap res;
  if (bytes.empty()) {
    return res;
  }
  ensure_fits(addr, bytes.size());

  const auto is_pad = [pad](std::uint8_t b) { return b == pad; };
  auto emit = [&](auto first, auto last) {
    if (first != last) {
      const auto offset = std::distance(bytes.begin(), first);
      res.m_blocks.push_back(Block{static_cast<address_t>(addr + offset),
                                   byte_vector(first, last)});
    }
  };

  auto data_start = bytes.begin();
  auto it = bytes.begin();
  while (it != bytes.end()) {
    it = std::find_if(it, bytes.end(), is_pad);
    const auto run_end = std::find_if_not(it, bytes.end(), is_pad);
    if (static_cast<std::size_t>(std::distance(it, run_end)) >= min_pad_run) {
      emit(data_start, it);
      data_start = run_end;
    }
    it = run_end;
  }
  emit(data_start, bytes.end());
  return res;
}

SparseMemoryMap::const_iterator
SparseMemoryMap::first_ending_after(std::uint64_t addr) const noexcept {
  return std::partition_point(
      m_blocks.begin(), m_blocks.end(),
      [addr](Block const &b) { return b.end() <= addr; });
}

void SparseMemoryMap::set(address_t addr, byte_vector bytes) {
  if (bytes.empty()) {
    throw MalformedRange(
        fmt::format("Zero length block at 0x{:08x}", addr));
  }
  ensure_fits(addr, bytes.size());
  clear(addr, bytes.size());
  const auto pos = std::partition_point(
      m_blocks.begin(), m_blocks.end(),
      [addr](Block const &b) { return b.base_addr < addr; });
  m_blocks.insert(pos, Block{addr, std::move(bytes)});
}

void SparseMemoryMap::clear(address_t addr, std::uint64_t length) {
  ensure_fits(addr, length);
  if (length == 0) {
    return;
  }
  const std::uint64_t lo = addr;
  const std::uint64_t hi = lo + length;

  const auto first_idx =
      std::distance(m_blocks.cbegin(), first_ending_after(lo));
  auto first = std::next(m_blocks.begin(), first_idx);
  auto last = first;
  std::vector<Block> remainders;
  for (; last != m_blocks.end() && last->base_addr < hi; ++last) {
    if (last->base_addr < lo) {
      remainders.push_back(
          Block{last->base_addr, sub_bytes(*last, last->base_addr, lo)});
    }
    if (last->end() > hi) {
      remainders.push_back(
          Block{static_cast<address_t>(hi), sub_bytes(*last, hi, last->end())});
    }
  }
  const auto pos = m_blocks.erase(first, last);
  m_blocks.insert(pos, std::make_move_iterator(remainders.begin()),
                  std::make_move_iterator(remainders.end()));
}

SparseMemoryMap SparseMemoryMap::slice(address_t addr,
                                       std::uint64_t length) const {
  ensure_fits(addr, length);
  SparseMemoryMap res;
  const std::uint64_t lo = addr;
  const std::uint64_t hi = lo + length;
  for (auto it = first_ending_after(lo);
       it != m_blocks.end() && it->base_addr < hi; ++it) {
    const auto from = std::max<std::uint64_t>(it->base_addr, lo);
    const auto to = std::min(it->end(), hi);
    res.m_blocks.push_back(
        Block{static_cast<address_t>(from), sub_bytes(*it, from, to)});
  }
  return res;
}

bool SparseMemoryMap::contains(SparseMemoryMap const &other) const noexcept {
  for (Block const &needle : other) {
    std::uint64_t pos = needle.base_addr;
    auto it = first_ending_after(pos);
    while (pos < needle.end()) {
      if (it == m_blocks.end() || it->base_addr > pos) {
        return false;
      }
      const auto to = std::min(it->end(), needle.end());
      const auto ours = std::next(it->data.begin(), pos - it->base_addr);
      const auto theirs =
          std::next(needle.data.begin(), pos - needle.base_addr);
      if (!std::equal(ours, std::next(ours, to - pos), theirs)) {
        return false;
      }
      pos = to;
      ++it;
    }
  }
  return true;
}

SparseMemoryMap SparseMemoryMap::join() const {
  SparseMemoryMap res;
  for (Block const &b : m_blocks) {
    if (!res.m_blocks.empty() && res.m_blocks.back().end() == b.base_addr) {
      auto &tail = res.m_blocks.back().data;
      tail.insert(tail.end(), b.data.begin(), b.data.end());
    } else {
      res.m_blocks.push_back(b);
    }
  }
  return res;
}

std::optional<std::uint8_t>
SparseMemoryMap::at(address_t addr) const noexcept {
  const auto it = first_ending_after(addr);
  if (it == m_blocks.end() || it->base_addr > addr) {
    return std::nullopt;
  }
  return it->data[addr - it->base_addr];
}

std::size_t SparseMemoryMap::byte_count() const noexcept {
  return rg::accumulate(m_blocks, std::size_t{0}, std::plus<>{},
                        [](Block const &b) { return b.size(); });
}

std::optional<address_t> SparseMemoryMap::lowest_address() const noexcept {
  if (m_blocks.empty()) {
    return std::nullopt;
  }
  return m_blocks.front().base_addr;
}

std::optional<std::uint64_t>
SparseMemoryMap::highest_address() const noexcept {
  if (m_blocks.empty()) {
    return std::nullopt;
  }
  return m_blocks.back().end();
}
