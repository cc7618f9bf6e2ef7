// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <DeviceInfo.hpp>
#include <utils.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>

#include <span>

namespace Device {

namespace {
std::optional<std::uint32_t> word_at(Memory::Block const &b,
                                     std::uint64_t addr) noexcept {
  if (addr < b.base_addr || addr + 4 > b.end()) {
    return std::nullopt;
  }
  return range_cast<std::uint32_t>(
      std::span(b.data).subspan(addr - b.base_addr, 4));
}
} // namespace

family_layout const &layout_of(Family f) {
  switch (f) {
  case Family::NRF51:
    return families::nrf51;
  case Family::NRF52:
    return families::nrf52;
  default:
    throw std::invalid_argument("Unhandled device family");
  }
}

void validate(DeviceInfo const &info) {
  if (info.page_size == 0 || info.code_page_size == 0) {
    throw InvalidDeviceInfo("page size must be positive");
  }
  if (info.rom_size == 0 || info.rom_size % info.page_size != 0) {
    throw InvalidDeviceInfo(fmt::format(
        "ROM size 0x{:x} is not a multiple of the page size 0x{:x}",
        info.rom_size, info.page_size));
  }
  if (info.config_page_size() == 0 ||
      std::uint64_t{info.config_page_address()} + info.config_page_size() >
          address_space_end) {
    throw InvalidDeviceInfo("config page does not fit the address space");
  }
  if (info.bootloader_address && *info.bootloader_address >= info.rom_size) {
    throw InvalidDeviceInfo(
        fmt::format("bootloader address 0x{:08x} is outside of ROM",
                    *info.bootloader_address));
  }
}

DeviceInfo make_device_info(Family family, std::uint32_t rom_size,
                            std::uint32_t page_size, std::uint32_t ram_size,
                            std::optional<address_t> bootloader_address) {
  DeviceInfo info{layout_of(family), rom_size, page_size,
                  page_size,         ram_size, bootloader_address};
  validate(info);
  return info;
}

std::string_view model_name(Family family, std::uint32_t rom_size) noexcept {
  switch (family) {
  case Family::NRF51:
    switch (rom_size) {
    case 128 * 1024:
      return "NRF51xxx_xxAB"sv;
    case 256 * 1024:
      return "NRF51xxx_xxAA"sv;
    default:
      break;
    }
    break;
  case Family::NRF52:
    switch (rom_size) {
    case 192 * 1024:
      return "NRF52810_xxAA"sv;
    case 256 * 1024:
      return "NRF52832_xxAB"sv;
    case 512 * 1024:
      return "NRF52832_xxAA"sv;
    case 1024 * 1024:
      return "NRF52840_xxAA"sv;
    default:
      break;
    }
    break;
  }
  return "Unknown model"sv;
}

std::optional<std::uint32_t> read_word(Memory::SparseMemoryMap const &image,
                                       std::uint64_t addr) noexcept {
  if (addr + 4 > address_space_end) {
    return std::nullopt;
  }
  const auto word = image.slice(static_cast<address_t>(addr), 4);
  if (word.byte_count() != 4) {
    return std::nullopt;
  }
  return range_cast<std::uint32_t>(word.join().blocks().front().data);
}

std::optional<address_t>
bootloader_address(Memory::SparseMemoryMap const &image,
                   DeviceInfo const &info) noexcept {
  const auto val = read_word(image, std::uint64_t{info.config_page_address()} +
                                        info.layout.bootloader_addr_reg);
  if (!val || *val == 0xFFFF'FFFF || *val >= info.rom_size) {
    return std::nullopt;
  }
  return *val;
}

BlockPredicate signature_predicate(family_layout const &layout) {
  return [sig = layout.radio_stack](Memory::Block const &b) {
    return rg::any_of(sig.bases, [&](address_t base) {
      return base >= b.base_addr &&
             word_at(b, std::uint64_t{base} + sig.offset) == sig.magic;
    });
  };
}

BlockPredicate vector_table_predicate(DeviceInfo const &info) {
  const auto ram =
      range{info.layout.ram_base, info.layout.ram_base + info.ram_size};
  return [ram, rom_size = info.rom_size](Memory::Block const &b) {
    const auto sp = word_at(b, b.base_addr);
    const auto reset = word_at(b, std::uint64_t{b.base_addr} + 4);
    if (!sp || !reset) {
      return false;
    }
    // the initial stack pointer may point one past the end of RAM
    const auto sp_ok = *sp > ram.start && *sp <= ram.end && *sp % 4 == 0;
    const auto reset_ok = (*reset & 1) == 1 && *reset < rom_size;
    return sp_ok && reset_ok;
  };
}

} // namespace Device
