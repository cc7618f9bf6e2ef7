// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceInfo.hpp>
#include <MemoryMap.hpp>
#include <fwd.hpp>

#include <cstdint>
#include <string_view>

namespace Safety {

enum class WriteVerdict {
  // config page of the target is erased, anything may be written
  BLANK_CONFIG_PAGE,
  // the images leave the config page as it is on the target
  CONFIG_PAGE_UNCHANGED,
  // the config page would change, it must be erased first
  ERASE_REQUIRED,
};

inline constexpr std::string_view verdict_to_string(WriteVerdict v) {
  switch (v) {
  case WriteVerdict::BLANK_CONFIG_PAGE:
    return "blank config page"sv;
  case WriteVerdict::CONFIG_PAGE_UNCHANGED:
    return "no config page updates"sv;
  case WriteVerdict::ERASE_REQUIRED:
    return "must erase all"sv;
  default:
    return "UNKNOWN"sv;
  }
}

WriteVerdict evaluate_write(Memory::SparseMemoryMap const &target,
                            address_t config_page_addr,
                            std::uint32_t config_page_size,
                            Memory::SparseMemoryMap const &files) noexcept;

// The caller must not write at all when this is false, there is no override
bool can_write(Memory::SparseMemoryMap const &target,
               address_t config_page_addr, std::uint32_t config_page_size,
               Memory::SparseMemoryMap const &files) noexcept;

// Paginated image to transmit. A config page already holding the wanted
// content is left out.
Memory::SparseMemoryMap
build_write_payload(Memory::SparseMemoryMap const &files,
                    Memory::SparseMemoryMap const &target,
                    address_t config_page_addr, std::uint32_t config_page_size,
                    std::uint32_t page_size);

inline bool can_write(Memory::SparseMemoryMap const &target,
                      Device::DeviceInfo const &info,
                      Memory::SparseMemoryMap const &files) noexcept {
  return can_write(target, info.config_page_address(),
                   info.config_page_size(), files);
}

inline Memory::SparseMemoryMap
build_write_payload(Memory::SparseMemoryMap const &files,
                    Memory::SparseMemoryMap const &target,
                    Device::DeviceInfo const &info) {
  return build_write_payload(files, target, info.config_page_address(),
                             info.config_page_size(), info.page_size);
}

} // namespace Safety
