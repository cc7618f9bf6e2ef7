// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IDumper.hpp>
#include <MemoryMap.hpp>
#include <fwd.hpp>

#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <ranges>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>
#include <range/v3/range/concepts.hpp>
#include <range/v3/range/traits.hpp>
#include <range/v3/view/chunk.hpp>

// NOTE: nRF devices are little endian, all multi-byte words read out of
// an image are interpreted in LE format

template <typename R>
concept byte_range =
    rg::input_range<std::remove_reference_t<R>> &&
    rg::sized_range<std::remove_reference_t<R>> &&
    std::unsigned_integral<rg::range_value_t<std::remove_reference_t<R>>> &&
    sizeof(rg::range_value_t<std::remove_reference_t<R>>) == 1;

// cast a byte range into a builtin integer, where the byte range
// holds a representation in little endian format
template <std::unsigned_integral T, byte_range R>
constexpr auto range_cast(R &&r) noexcept {
  T tmp{};
  auto it = rg::begin(r);
  const auto end = rg::end(r);
  for (size_t i = 0; i != sizeof(T) && it != end; ++i, ++it) {
    tmp += static_cast<T>(static_cast<T>(*it) << i * 8);
  }
  return tmp;
}

// Human readable hex dump, one header line per block:
// 0x001000 | 00 04 00 20 d9 0a 00 00 | ... .... |
struct OstreamDumper : IDumper {
  void dump_start() override {}
  void dump_end() override {}
  explicit OstreamDumper(std::ostream &os, std::size_t bytes_per_line = 16)
      : os{os}, bytes_per_line{bytes_per_line} {}

  void dump_block(Memory::Block const &block) override {
    os << "Block " << block << '\n';
    dump_memory(block.base_addr, block.data);
  }

  template <std::ranges::forward_range Rng>
    requires(std::integral<rg::range_value_t<Rng>> &&
             sizeof(rg::range_value_t<Rng>) == 1)
  void dump_memory(uint32_t addr, Rng &&data) {
    for (auto &&line : data | ranges::views::chunk(bytes_per_line)) {
      dump_line(addr, line);
      addr += bytes_per_line;
      os << '\n';
    }
  }

  template <std::ranges::forward_range Rng>
    requires(std::integral<rg::range_value_t<Rng>> &&
             sizeof(rg::range_value_t<Rng>) == 1)
  void dump_line(uint32_t addr, Rng &&data) {
    std::ostream_iterator<char> out(os);
    constexpr auto &addr_format = "0x{:06x} | ";
    fmt::format_to(out, addr_format, addr);
    const auto data_size = dump_data_padded(out, data);
    fmt::format_to(out, "| ");
    dump_ascii_padded(out, data_size, data);
    fmt::format_to(out, " |");
  }

private:
  template <std::ranges::forward_range Rng>
    requires std::integral<rg::range_value_t<Rng>>
  auto dump_data_padded(std::ostream_iterator<char> out, Rng &&data) {
    size_t i = 0;
    for (auto val : data) {
      fmt::format_to(out, "{:02x} ", static_cast<uint8_t>(val));
      ++i;
    }
    for (auto pad = i; pad < bytes_per_line; ++pad) {
      fmt::format_to(out, "   ");
    }
    return i;
  }

  template <std::ranges::forward_range Rng>
    requires std::integral<rg::range_value_t<Rng>>
  void dump_ascii_padded(std::ostream_iterator<char> out,
                         std::size_t data_size, Rng &&data) {
    for (auto v : data) {
      const int val = static_cast<uint8_t>(v);
      os << (isprint(val) ? static_cast<char>(val) : '.');
    }
    for (auto pad = data_size; pad < bytes_per_line; ++pad) {
      fmt::format_to(out, " ");
    }
  }
  //////////////
  std::ostream &os;
  std::size_t bytes_per_line{};
};
