// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>
#include <numeric>
#include <ostream>
#include <span>
#include <stdexcept>
#include <type_traits>

#include "IDumper.hpp"
#include "MemoryMap.hpp"
#include <fwd.hpp>

#include <fmt/format.h>

namespace IntelHex {
enum class RecordType : uint8_t {
  DATA = 0x00,
  END_OF_FILE = 0x01,
  EXTENDED_LIN_ADDR = 0x04

};

template <typename Enum> inline constexpr auto to_underlying(Enum e) {
  return static_cast<std::underlying_type_t<Enum>>(e);
}

// Writes sparse images in Intel HEX format, e.g. the write payload
// handed over to the programming probe.
// Format:
// <StartCode><ByteCount><Address><Record type><Data><Checksum>
class Dumper : public IDumper {
public:
  inline static constexpr auto lineformat = ":{:02X}{:04X}{:02X}"sv;

  void dump_start() override { addr_hi = 0; }
  void dump_end() override { os << ":00000001FF\n"; }
  void dump_block(Memory::Block const &block) override {
    dump_data_memory(block.base_addr, block.data);
  }
  explicit Dumper(std::ostream &os, std::size_t bytes_per_line = 16)
      : os{os}, bytes_per_line{bytes_per_line} {
    if (bytes_per_line == 0 || bytes_per_line > 0xFF) {
      throw std::out_of_range("Intel HEX line width must be in [1, 255]");
    }
  }

  static uint8_t extended_linear_addr_chk(uint16_t addr_hi) noexcept {
    const auto base_chk = uint32_t{2} + uint32_t{4} + (addr_hi & 0xFF) +
                          ((addr_hi & 0xFF00) >> 8);
    return static_cast<uint8_t>((~base_chk + 1) & 0xFF);
  }

  static uint8_t data_chk(uint16_t addr_lo,
                          std::span<uint8_t const> data) noexcept {
    const auto base_chk = std::accumulate(data.begin(), data.end(),
                                          data.size() + (addr_lo & 0xFF) +
                                              ((addr_lo & 0xFF00) >> 8),
                                          std::plus<>{});
    const auto chk = (~((base_chk & 0xFF))) + 1;
    return static_cast<uint8_t>(chk & 0xFF);
  }

  void dump_extended_linear_addr(uint16_t addr_hi);
  void dump_data_line(uint16_t addr_lo, std::span<uint8_t const> data);
  // splits data into lines, never crossing a 64KiB segment
  void dump_data_memory(uint32_t base_addr, std::span<uint8_t const> data);

private:
  std::ostream &os;
  std::size_t bytes_per_line{};
  // upper 16 bits of the address currently in effect
  uint16_t addr_hi{};
};

} // namespace IntelHex
