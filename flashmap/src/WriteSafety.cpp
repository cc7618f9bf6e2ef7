// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <WriteSafety.hpp>

#include <MapAlgebra.hpp>

namespace Safety {

WriteVerdict evaluate_write(Memory::SparseMemoryMap const &target,
                            address_t config_page_addr,
                            std::uint32_t config_page_size,
                            Memory::SparseMemoryMap const &files) noexcept {
  if (config_page_size == 0) {
    return WriteVerdict::BLANK_CONFIG_PAGE;
  }
  // a config page we can not even address is never safe to touch
  if (std::uint64_t{config_page_addr} + config_page_size > address_space_end) {
    return WriteVerdict::ERASE_REQUIRED;
  }

  const auto blank = Memory::SparseMemoryMap::from_bytes(
      config_page_addr, byte_vector(config_page_size, 0xFF_b));
  if (target.contains(blank)) {
    return WriteVerdict::BLANK_CONFIG_PAGE;
  }

  // an unread config page on the target refuses every config page update
  const auto updates = files.slice(config_page_addr, config_page_size);
  if (target.contains(updates)) {
    return WriteVerdict::CONFIG_PAGE_UNCHANGED;
  }
  return WriteVerdict::ERASE_REQUIRED;
}

bool can_write(Memory::SparseMemoryMap const &target,
               address_t config_page_addr, std::uint32_t config_page_size,
               Memory::SparseMemoryMap const &files) noexcept {
  return evaluate_write(target, config_page_addr, config_page_size, files) !=
         WriteVerdict::ERASE_REQUIRED;
}

Memory::SparseMemoryMap
build_write_payload(Memory::SparseMemoryMap const &files,
                    Memory::SparseMemoryMap const &target,
                    address_t config_page_addr, std::uint32_t config_page_size,
                    std::uint32_t page_size) {
  auto image = files;
  if (evaluate_write(target, config_page_addr, config_page_size, files) ==
      WriteVerdict::CONFIG_PAGE_UNCHANGED) {
    image.clear(config_page_addr, config_page_size);
  }
  return Memory::paginate(image, page_size);
}

} // namespace Safety
