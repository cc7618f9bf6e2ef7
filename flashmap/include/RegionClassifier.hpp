// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceInfo.hpp>
#include <MapAlgebra.hpp>
#include <MemoryMap.hpp>
#include <Region.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Address {

using RegionPredicate = Device::BlockPredicate;

// Heuristics injected into the classifier. An empty predicate never matches.
struct Strategies {
  RegionPredicate looks_like_radio_stack;
  RegionPredicate looks_like_application;
};

// Default strategies of a device family: info structure signature for the
// radio stack, Cortex-M vector table for applications
Strategies default_strategies(Device::DeviceInfo const &info);

struct SourceImage {
  std::string name;
  Memory::SparseMemoryMap map;
};

struct Classification {
  RegionList regions;
  RegionNameSet detected_names;
};

// Maximal contiguous runs sharing the same set of contributing sources, all
// named NONE. Sources without a name in file_names contribute no name.
RegionList provisional_regions(Memory::OverlapMap const &overlaps,
                               std::span<std::string const> file_names);

// Labels the regions of the overlapping sources. target_regions are the
// classified regions of the connected device, empty when classifying the
// device itself.
Classification classify(Memory::OverlapMap const &overlaps,
                        std::span<std::string const> file_names,
                        Device::DeviceInfo const &info,
                        Strategies const &strategies,
                        RegionList const &target_regions = {});

Classification classify_files(std::span<SourceImage const> files,
                              Device::DeviceInfo const &info,
                              Strategies const &strategies,
                              RegionList const &target_regions = {});

// Classifies a single (already flattened) image, e.g. the device contents
Classification classify_image(Memory::SparseMemoryMap const &image,
                              Device::DeviceInfo const &info,
                              Strategies const &strategies);

// The individual passes, each rebuilding the region list
RegionList label_fixed_regions(RegionList regions,
                               Device::DeviceInfo const &info,
                               std::optional<address_t> bootloader_addr);
RegionList label_by_predicate(RegionList regions,
                              Memory::SparseMemoryMap const &image,
                              RegionPredicate const &pred, RegionName name);
RegionList infer_application(RegionList regions,
                             RegionList const &target_regions,
                             Device::DeviceInfo const &info);
RegionList coalesce_bootloader(RegionList regions,
                               RegionList const &target_regions,
                               Device::DeviceInfo const &info);
RegionList coalesce_application(RegionList regions,
                                RegionList const &target_regions,
                                Device::DeviceInfo const &info);

bool has_overlapping_regions(RegionList regions);

// APPLICATION, SOFTDEVICE and BOOTLOADER, as far as present
RegionNameSet detected_region_names(RegionList const &regions);

std::optional<Region> find_region(RegionList const &regions, RegionName name);

} // namespace Address
