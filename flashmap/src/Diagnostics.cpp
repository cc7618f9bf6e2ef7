// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Diagnostics.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>

namespace Address {

std::vector<std::string>
outside_writable_ranges(Memory::OverlapMap const &overlaps,
                        Device::DeviceInfo const &info) {
  const std::uint64_t config_start = info.config_page_address();
  const std::uint64_t config_end = info.config_page().end;
  std::vector<std::string> res;
  for (auto const &[start, contributions] : overlaps) {
    if (contributions.empty()) {
      continue;
    }
    const auto end = std::uint64_t{start} + contributions.front().data.size();
    if ((start < config_start && end > info.rom_size) ||
        (start >= config_start && end > config_end)) {
      res.push_back(fmt::format("{:08X}-{:08X}", start, end));
    }
  }
  return res;
}

bool has_overlapping_files(Memory::OverlapMap const &overlaps) noexcept {
  return rg::any_of(overlaps, [](auto const &entry) {
    return entry.second.size() > 1;
  });
}

std::vector<std::string> file_warnings(Memory::OverlapMap const &overlaps,
                                       Device::DeviceInfo const &info) {
  std::vector<std::string> res;
  if (has_overlapping_files(overlaps)) {
    res.emplace_back("Some of the HEX files have overlapping data.");
  }
  if (const auto outside = outside_writable_ranges(overlaps, info);
      !outside.empty()) {
    res.push_back(
        fmt::format("There is data outside the user-writable areas ({}).",
                    fmt::join(outside, ", ")));
  }
  return res;
}

} // namespace Address
