// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <IntelHex.hpp>

#include <algorithm>
#include <iterator>

namespace IntelHex {

void Dumper::dump_extended_linear_addr(uint16_t hi) {
  std::ostream_iterator<char> oit(os);
  oit = fmt::format_to(oit, lineformat, 2, 0,
                       to_underlying(RecordType::EXTENDED_LIN_ADDR));
  oit = fmt::format_to(oit, "{:04X}", hi);
  oit = fmt::format_to(oit, "{:02X}\n", extended_linear_addr_chk(hi));
  addr_hi = hi;
}

void Dumper::dump_data_memory(uint32_t base_addr,
                              std::span<uint8_t const> data_span) {
  std::uint64_t addr = base_addr;
  while (!data_span.empty()) {
    const auto hi = static_cast<uint16_t>(addr >> 16);
    if (hi != addr_hi) {
      dump_extended_linear_addr(hi);
    }
    const auto addr_lo = static_cast<uint16_t>(addr & 0xFFFF);
    const auto to_segment_end = std::size_t{0x10000} - addr_lo;
    const auto len =
        std::min({bytes_per_line, to_segment_end, data_span.size()});
    dump_data_line(addr_lo, data_span.first(len));
    data_span = data_span.subspan(len);
    addr += len;
  }
}

void Dumper::dump_data_line(uint16_t addr_lo,
                            std::span<uint8_t const> data_span) {
  std::ostream_iterator<char> oit(os);
  oit = fmt::format_to(oit, lineformat, data_span.size(), addr_lo,
                       to_underlying(RecordType::DATA));
  for (auto byte : data_span) {
    oit = fmt::format_to(oit, "{:02X}", byte);
  }
  oit = fmt::format_to(oit, "{:02X}\n", data_chk(addr_lo, data_span));
}

} // namespace IntelHex
