// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Address {
enum class RegionName {
  NONE = 0,
  APPLICATION,
  SOFTDEVICE,
  BOOTLOADER,
  MBR,
  UICR,
};

inline constexpr std::string_view region_to_string(RegionName region) {
  switch (region) {
  case RegionName::NONE:
    return "NONE"sv;
  case RegionName::APPLICATION:
    return "APPLICATION"sv;
  case RegionName::SOFTDEVICE:
    return "SOFTDEVICE"sv;
  case RegionName::BOOTLOADER:
    return "BOOTLOADER"sv;
  case RegionName::MBR:
    return "MBR"sv;
  case RegionName::UICR:
    return "UICR"sv;
  default:
    return "UNKNOWN"sv;
  }
}

inline constexpr RegionName string_to_region(std::string_view str) {
  if (str == "NONE"sv) {
    return RegionName::NONE;
  } else if (str == "APPLICATION"sv) {
    return RegionName::APPLICATION;
  } else if (str == "SOFTDEVICE"sv) {
    return RegionName::SOFTDEVICE;
  } else if (str == "BOOTLOADER"sv) {
    return RegionName::BOOTLOADER;
  } else if (str == "MBR"sv) {
    return RegionName::MBR;
  } else if (str == "UICR"sv) {
    return RegionName::UICR;
  } else {
    throw std::invalid_argument("Invalid region string");
  }
}

struct Region {
  RegionName name{RegionName::NONE};
  address_t start{};
  std::uint32_t size{};
  std::set<std::string> file_names;

  std::uint64_t end() const noexcept { return std::uint64_t{start} + size; }
  auto name_str() const noexcept { return region_to_string(name); }
  bool operator==(Region const &) const = default;
};

using RegionList = std::vector<Region>;
using RegionNameSet = std::set<RegionName>;

inline std::ostream &operator<<(std::ostream &os, Region const &r) {
  return os << fmt::format("Region name:{} address:[{:08x}h,{:08x}h) files:{}",
                           r.name_str(), r.start, r.end(),
                           fmt::join(r.file_names, ","));
}

} // namespace Address
