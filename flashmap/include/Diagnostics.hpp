// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceInfo.hpp>
#include <MapAlgebra.hpp>

#include <string>
#include <vector>

namespace Address {

// "AAAAAAAA-BBBBBBBB" ranges of data that neither lies in ROM nor in the
// config page
std::vector<std::string>
outside_writable_ranges(Memory::OverlapMap const &overlaps,
                        Device::DeviceInfo const &info);

// some address is written by more than one source
bool has_overlapping_files(Memory::OverlapMap const &overlaps) noexcept;

// Human readable warnings about the loaded files
std::vector<std::string> file_warnings(Memory::OverlapMap const &overlaps,
                                       Device::DeviceInfo const &info);

} // namespace Address
