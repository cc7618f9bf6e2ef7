// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <vector>

namespace Memory {

// zero-length block, or a range not fitting the 32 bit address space
struct MalformedRange : std::out_of_range {
  using std::out_of_range::out_of_range;
};

// inconsistent state while resolving overlapping contributions
struct OverlapResolutionAmbiguous : std::logic_error {
  using std::logic_error::logic_error;
};

struct Block {
  address_t base_addr{};
  byte_vector data;

  std::uint64_t end() const noexcept {
    return std::uint64_t{base_addr} + data.size();
  }
  std::size_t size() const noexcept { return data.size(); }
  bool operator==(Block const &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, Block const &b) {
  return os << fmt::format("[{:08x}h,{:08x}h) {} bytes", b.base_addr, b.end(),
                           b.size());
}

void ensure_fits(std::uint64_t addr, std::uint64_t length);

// Sparse byte addressed image. Blocks are kept sorted by base address and
// never overlap, adjacent blocks are allowed (see join()).
class SparseMemoryMap {
public:
  using const_iterator = std::vector<Block>::const_iterator;

  SparseMemoryMap() = default;

  static SparseMemoryMap from_bytes(address_t addr, byte_vector bytes);

  // Builds a sparse map from a dense dump (e.g. a full flash read), runs of
  // at least min_pad_run pad bytes are treated as erased and left out
  static SparseMemoryMap from_padded_bytes(address_t addr,
                                           std::span<std::uint8_t const> bytes,
                                           std::uint8_t pad = 0xFF,
                                           std::size_t min_pad_run = 256);

  // inserts the block, trimming or splitting whatever it overlaps
  void set(address_t addr, byte_vector bytes);

  void clear(address_t addr, std::uint64_t length);

  [[nodiscard]] SparseMemoryMap slice(address_t addr,
                                      std::uint64_t length) const;

  // true iff every byte of other is present here with the same value
  bool contains(SparseMemoryMap const &other) const noexcept;

  // adjacent blocks concatenated into maximal contiguous runs
  [[nodiscard]] SparseMemoryMap join() const;

  std::optional<std::uint8_t> at(address_t addr) const noexcept;

  std::span<Block const> blocks() const noexcept { return m_blocks; }
  const_iterator begin() const noexcept { return m_blocks.begin(); }
  const_iterator end() const noexcept { return m_blocks.end(); }

  bool empty() const noexcept { return m_blocks.empty(); }
  std::size_t block_count() const noexcept { return m_blocks.size(); }
  std::size_t byte_count() const noexcept;
  std::optional<address_t> lowest_address() const noexcept;
  std::optional<std::uint64_t> highest_address() const noexcept;

  bool operator==(SparseMemoryMap const &) const = default;

private:
  // first block whose end lies above addr
  const_iterator first_ending_after(std::uint64_t addr) const noexcept;

  std::vector<Block> m_blocks;
};

} // namespace Memory
