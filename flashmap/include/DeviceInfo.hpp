// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <MemoryMap.hpp>
#include <fwd.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace Device {

struct InvalidDeviceInfo : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

enum class Family { NRF51, NRF52 };

inline constexpr std::string_view family_to_string(Family f) {
  switch (f) {
  case Family::NRF51:
    return "nRF51"sv;
  case Family::NRF52:
    return "nRF52"sv;
  default:
    return "UNKNOWN"sv;
  }
}

inline constexpr Family string_to_family(std::string_view str) {
  if (str == "nrf51"sv || str == "nRF51"sv) {
    return Family::NRF51;
  } else if (str == "nrf52"sv || str == "nRF52"sv) {
    return Family::NRF52;
  } else {
    throw std::invalid_argument("Invalid device family string");
  }
}

struct range {
  address_t start{};
  address_t end{};

  constexpr auto size() const {
    return end >= start ? end - start
                        : throw std::out_of_range("end must be geq to start");
  }
  constexpr bool contains(std::uint64_t addr) const noexcept {
    return addr >= start && addr < end;
  }
};

// Signature of the radio stack info structure: a magic word at a fixed
// offset from the radio stack base, for each base the family allows.
struct info_struct_signature {
  std::uint32_t offset{};
  std::uint32_t magic{};
  std::array<address_t, 2> bases{};
};

// Fixed per-family memory layout
struct family_layout {
  Family family;
  address_t config_page_address{};
  std::uint32_t config_page_size{};
  range mbr{};
  address_t vector_table_address{};
  address_t ram_base{};
  // offset of the bootloader start address register in the config page
  std::uint32_t bootloader_addr_reg{};
  info_struct_signature radio_stack{};
};

namespace families {
constexpr auto nrf51 = family_layout{Family::NRF51,
                                     0x1000'1000,
                                     0x400,
                                     range{0x0, 0x1000},
                                     0x1000,
                                     0x2000'0000,
                                     0x14,
                                     {0x2004, 0x51B1'E5DB, {0x0, 0x1000}}};

constexpr auto nrf52 = family_layout{Family::NRF52,
                                     0x1000'1000,
                                     0x400,
                                     range{0x0, 0x1000},
                                     0x1000,
                                     0x2000'0000,
                                     0x14,
                                     {0x2004, 0x51B1'E5DB, {0x0, 0x1000}}};
} // namespace families

family_layout const &layout_of(Family f);

// Immutable per session device metadata
struct DeviceInfo {
  family_layout layout;
  std::uint32_t rom_size{};
  std::uint32_t page_size{};
  std::uint32_t code_page_size{};
  std::uint32_t ram_size{};
  std::optional<address_t> bootloader_address{};

  Family family() const noexcept { return layout.family; }
  address_t config_page_address() const noexcept {
    return layout.config_page_address;
  }
  std::uint32_t config_page_size() const noexcept {
    return layout.config_page_size;
  }
  range config_page() const noexcept {
    return {layout.config_page_address,
            layout.config_page_address + layout.config_page_size};
  }
};

// throws InvalidDeviceInfo on inconsistent values
void validate(DeviceInfo const &info);

DeviceInfo make_device_info(Family family, std::uint32_t rom_size,
                            std::uint32_t page_size, std::uint32_t ram_size,
                            std::optional<address_t> bootloader_address = {});

std::string_view model_name(Family family, std::uint32_t rom_size) noexcept;

// Start of the bootloader, as recorded in the config page of the image.
// Erased (0xFFFFFFFF) or out of ROM values yield nullopt.
std::optional<address_t>
bootloader_address(Memory::SparseMemoryMap const &image,
                   DeviceInfo const &info) noexcept;

std::optional<std::uint32_t>
read_word(Memory::SparseMemoryMap const &image, std::uint64_t addr) noexcept;

using BlockPredicate = std::function<bool(Memory::Block const &)>;

// radio stack detection by the family info structure signature
BlockPredicate signature_predicate(family_layout const &layout);

// Cortex-M vector table: initial stack pointer inside RAM, reset handler
// a Thumb address inside ROM
BlockPredicate vector_table_predicate(DeviceInfo const &info);

inline std::ostream &operator<<(std::ostream &os, DeviceInfo const &d) {
  return os << fmt::format(
             "Device family:{} ROM:{}KiB page size:{:x}h RAM:{}KiB config "
             "page:[{:08x}h,{:08x}h)",
             family_to_string(d.family()), d.rom_size / 1024, d.page_size,
             d.ram_size / 1024, d.config_page().start, d.config_page().end);
}

} // namespace Device
