// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <RegionClassifier.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/sort.hpp>

namespace Address {

namespace {
bool is_unclassified(Region const &r) noexcept {
  return r.name == RegionName::NONE;
}

void sort_by_start(RegionList &regions) {
  rg::sort(regions, std::less<>{}, &Region::start);
}

// first region with the given name, file side before device side
std::optional<Region> find_anchor(RegionList const &regions,
                                  RegionList const &target_regions,
                                  RegionName name) {
  auto res = find_region(regions, name);
  return res ? res : find_region(target_regions, name);
}

// Start of the first region above `from` that can not be folded into the
// region at `from`
template <typename Pred>
std::uint64_t fold_limit(RegionList const &regions, address_t from,
                         Pred const &candidate) {
  std::uint64_t res = address_space_end;
  for (Region const &r : regions) {
    if (r.start > from && !candidate(r)) {
      res = std::min<std::uint64_t>(res, r.start);
    }
  }
  return res;
}
} // namespace

Strategies default_strategies(Device::DeviceInfo const &info) {
  return {Device::signature_predicate(info.layout),
          Device::vector_table_predicate(info)};
}

std::optional<Region> find_region(RegionList const &regions,
                                  RegionName name) {
  const auto it = rg::find_if(
      regions, [name](Region const &r) { return r.name == name; });
  if (it == regions.end()) {
    return std::nullopt;
  }
  return *it;
}

RegionNameSet detected_region_names(RegionList const &regions) {
  RegionNameSet res;
  for (Region const &r : regions) {
    if (r.name == RegionName::APPLICATION || r.name == RegionName::SOFTDEVICE ||
        r.name == RegionName::BOOTLOADER) {
      res.insert(r.name);
    }
  }
  return res;
}

RegionList provisional_regions(Memory::OverlapMap const &overlaps,
                               std::span<std::string const> file_names) {
  RegionList res;
  std::set<std::size_t> prev_sources;
  for (auto const &[addr, contributions] : overlaps) {
    std::set<std::size_t> sources;
    for (Memory::Contribution const &c : contributions) {
      sources.insert(c.source);
    }
    const auto len = contributions.empty()
                         ? std::size_t{0}
                         : contributions.front().data.size();
    if (len == 0) {
      continue;
    }
    if (!res.empty() && res.back().end() == addr && sources == prev_sources) {
      res.back().size += static_cast<std::uint32_t>(len);
    } else {
      res.push_back(Region{RegionName::NONE, addr,
                           static_cast<std::uint32_t>(len), {}});
    }
    for (const auto src : sources) {
      if (src < file_names.size()) {
        res.back().file_names.insert(file_names[src]);
      }
    }
    prev_sources = std::move(sources);
  }
  return res;
}

RegionList label_fixed_regions(RegionList regions,
                               Device::DeviceInfo const &info,
                               std::optional<address_t> bootloader_addr) {
  const auto config_page = info.config_page();
  const auto mbr = info.layout.mbr;
  for (Region &r : regions) {
    if (config_page.contains(r.start)) {
      r.name = RegionName::UICR;
    } else if (mbr.size() > 0 && r.start == mbr.start && r.end() <= mbr.end) {
      r.name = RegionName::MBR;
    } else if (bootloader_addr && r.start == *bootloader_addr) {
      r.name = RegionName::BOOTLOADER;
    }
  }
  return regions;
}

RegionList label_by_predicate(RegionList regions,
                              Memory::SparseMemoryMap const &image,
                              RegionPredicate const &pred, RegionName name) {
  if (!pred) {
    return regions;
  }
  for (Region &r : regions) {
    if (!is_unclassified(r)) {
      continue;
    }
    const auto data = image.slice(r.start, r.size).join();
    if (data.block_count() == 1 && pred(data.blocks().front())) {
      r.name = name;
      break;
    }
  }
  return regions;
}

RegionList infer_application(RegionList regions,
                             RegionList const &target_regions,
                             Device::DeviceInfo const &info) {
  const auto softdevice =
      find_anchor(regions, target_regions, RegionName::SOFTDEVICE);

  if (!softdevice) {
    // without a radio stack only a self hosted application right above the
    // MBR keeps its label
    for (Region &r : regions) {
      if (r.name == RegionName::APPLICATION &&
          r.start != info.layout.vector_table_address) {
        r.name = RegionName::NONE;
      }
    }
    return regions;
  }

  if (find_region(regions, RegionName::APPLICATION)) {
    return regions;
  }

  // The application may start one page further than the first page boundary
  // above the radio stack
  const auto boundary = Memory::page_ceil(softdevice->end(), info.page_size);
  for (const auto candidate : {boundary, boundary + info.page_size}) {
    const auto it = rg::find_if(regions, [candidate](Region const &r) {
      return r.start == candidate && is_unclassified(r);
    });
    if (it != regions.end()) {
      it->name = RegionName::APPLICATION;
      break;
    }
  }
  return regions;
}

RegionList coalesce_bootloader(RegionList regions,
                               RegionList const &target_regions,
                               Device::DeviceInfo const &info) {
  const auto anchor =
      find_anchor(regions, target_regions, RegionName::BOOTLOADER);
  if (!anchor) {
    return regions;
  }

  if (!find_region(regions, RegionName::BOOTLOADER)) {
    // bootloader only known from the device, its image starts at the anchor
    const auto it = rg::find_if(regions, [&](Region const &r) {
      return r.start == anchor->start && is_unclassified(r);
    });
    if (it != regions.end()) {
      it->name = RegionName::BOOTLOADER;
    }
  }
  const auto is_anchor = [&](Region const &r) {
    return r.name == RegionName::BOOTLOADER && r.start == anchor->start;
  };
  const auto blocks_anchor = [&](Region const &r) {
    return !is_anchor(r) && r.start <= anchor->start &&
           r.end() > anchor->start;
  };
  if (rg::any_of(regions, blocks_anchor)) {
    return regions;
  }

  const auto candidate = [&](Region const &r) {
    return is_unclassified(r) && r.end() < info.rom_size;
  };
  const auto limit = fold_limit(regions, anchor->start, candidate);
  const auto folded = [&](Region const &r) {
    return candidate(r) && r.start > anchor->start && r.end() <= limit;
  };

  std::optional<std::uint64_t> bl_end;
  std::set<std::string> file_names;
  for (Region const &r : regions | rgv::filter(folded)) {
    bl_end = std::max(bl_end.value_or(0), r.end());
    file_names.insert(r.file_names.begin(), r.file_names.end());
  }
  if (!bl_end) {
    return regions;
  }

  RegionList res;
  bool extended = false;
  for (Region &r : regions) {
    if (folded(r)) {
      continue;
    }
    if (is_anchor(r)) {
      r.size = static_cast<std::uint32_t>(*bl_end - r.start);
      r.file_names.insert(file_names.begin(), file_names.end());
      extended = true;
    }
    res.push_back(std::move(r));
  }
  if (!extended) {
    res.push_back(Region{RegionName::BOOTLOADER, anchor->start,
                         static_cast<std::uint32_t>(*bl_end - anchor->start),
                         std::move(file_names)});
    sort_by_start(res);
  }
  return res;
}

RegionList coalesce_application(RegionList regions,
                                RegionList const &target_regions,
                                Device::DeviceInfo const &info) {
  const auto app = find_region(regions, RegionName::APPLICATION);
  if (!app) {
    return regions;
  }
  const auto bootloader =
      find_anchor(regions, target_regions, RegionName::BOOTLOADER);
  const std::uint64_t bound = bootloader ? bootloader->start : info.rom_size;

  const auto candidate = [&](Region const &r) {
    return is_unclassified(r) && r.end() <= bound;
  };
  const auto limit = fold_limit(regions, app->start, candidate);
  const auto folded = [&](Region const &r) {
    return candidate(r) && r.start > app->start && r.end() <= limit;
  };

  std::uint64_t app_end = app->end();
  std::set<std::string> file_names;
  for (Region const &r : regions | rgv::filter(folded)) {
    app_end = std::max(app_end, r.end());
    file_names.insert(r.file_names.begin(), r.file_names.end());
  }

  RegionList res;
  for (Region &r : regions) {
    if (folded(r)) {
      continue;
    }
    if (r.name == RegionName::APPLICATION && r.start == app->start) {
      r.size = static_cast<std::uint32_t>(app_end - r.start);
      r.file_names.insert(file_names.begin(), file_names.end());
    }
    res.push_back(std::move(r));
  }
  return res;
}

bool has_overlapping_regions(RegionList regions) {
  sort_by_start(regions);
  for (std::size_t i = 1; i < regions.size(); ++i) {
    if (regions[i].start < regions[i - 1].end()) {
      return true;
    }
  }
  return false;
}

Classification classify(Memory::OverlapMap const &overlaps,
                        std::span<std::string const> file_names,
                        Device::DeviceInfo const &info,
                        Strategies const &strategies,
                        RegionList const &target_regions) {
  const auto image = Memory::flatten(overlaps);
  const auto bootloader_addr = info.bootloader_address
                                   ? info.bootloader_address
                                   : Device::bootloader_address(image, info);

  auto regions = provisional_regions(overlaps, file_names);
  regions = label_fixed_regions(std::move(regions), info, bootloader_addr);
  regions = label_by_predicate(std::move(regions), image,
                               strategies.looks_like_radio_stack,
                               RegionName::SOFTDEVICE);
  regions = label_by_predicate(std::move(regions), image,
                               strategies.looks_like_application,
                               RegionName::APPLICATION);
  regions = infer_application(std::move(regions), target_regions, info);
  regions = coalesce_bootloader(std::move(regions), target_regions, info);
  regions = coalesce_application(std::move(regions), target_regions, info);

  if (has_overlapping_regions(regions)) {
    throw std::logic_error("Classification produced overlapping regions");
  }
  auto names = detected_region_names(regions);
  return Classification{std::move(regions), std::move(names)};
}

Classification classify_files(std::span<SourceImage const> files,
                              Device::DeviceInfo const &info,
                              Strategies const &strategies,
                              RegionList const &target_regions) {
  std::vector<Memory::SparseMemoryMap> maps;
  std::vector<std::string> names;
  for (SourceImage const &f : files) {
    maps.push_back(f.map);
    names.push_back(f.name);
  }
  return classify(Memory::overlap(maps), names, info, strategies,
                  target_regions);
}

Classification classify_image(Memory::SparseMemoryMap const &image,
                              Device::DeviceInfo const &info,
                              Strategies const &strategies) {
  return classify(Memory::overlap(std::span(&image, 1)), {}, info, strategies);
}

} // namespace Address
