#include <catch2/catch.hpp>

#include "Diagnostics.hpp"
#include "RegionClassifier.hpp"
#include "test_utils.hpp"

#include <sstream>
#include <vector>

using Address::Region;
using Address::RegionList;
using Address::RegionName;
using Address::SourceImage;

namespace {
auto classify_sources(std::vector<SourceImage> const &files,
                      Device::DeviceInfo const &info,
                      RegionList const &target_regions = {}) {
  return Address::classify_files(files, info,
                                 Address::default_strategies(info),
                                 target_regions);
}
} // namespace

TEST_CASE("region names", "[region]") {
  REQUIRE(Address::region_to_string(RegionName::SOFTDEVICE) == "SOFTDEVICE");
  REQUIRE(Address::string_to_region("BOOTLOADER") == RegionName::BOOTLOADER);
  REQUIRE_THROWS_AS(Address::string_to_region("EEPROM"),
                    std::invalid_argument);

  std::stringstream ss;
  ss << region(RegionName::MBR, 0x0, 0x1000, {"mbr.bin", "sd.bin"});
  REQUIRE(ss.str() ==
          "Region name:MBR address:[00000000h,00001000h) files:mbr.bin,sd.bin");
}

TEST_CASE("provisional regions follow the contributing files",
          "[classifier][provisional]") {
  const std::vector<Memory::SparseMemoryMap> maps{
      map_of(0x1000, 0x1000), map_of(0x2000, 0x1000), map_of(0x2800, 0x1000)};
  const std::vector<std::string> names{"a", "b", "c"};
  const auto regions =
      Address::provisional_regions(Memory::overlap(maps), names);

  REQUIRE(regions ==
          RegionList{region(RegionName::NONE, 0x1000, 0x1000, {"a"}),
                     region(RegionName::NONE, 0x2000, 0x800, {"b"}),
                     region(RegionName::NONE, 0x2800, 0x800, {"b", "c"}),
                     region(RegionName::NONE, 0x3000, 0x800, {"c"})});
}

TEST_CASE("fixed regions", "[classifier]") {
  const auto info = nrf52_info(0x78000);
  const auto res =
      classify_sources({source("mbr.bin", 0x0, filled(0x1000, 0x00)),
                        source("uicr.bin", 0x1000'1000, filled(0x20)),
                        source("bl.bin", 0x78000, filled(0x4000))},
                       info);
  REQUIRE(res.regions ==
          RegionList{
              region(RegionName::MBR, 0x0, 0x1000, {"mbr.bin"}),
              region(RegionName::BOOTLOADER, 0x78000, 0x4000, {"bl.bin"}),
              region(RegionName::UICR, 0x1000'1000, 0x20, {"uicr.bin"})});
  REQUIRE(res.detected_names ==
          Address::RegionNameSet{RegionName::BOOTLOADER});
}

TEST_CASE("bootloader address from the config page of the images",
          "[classifier]") {
  const auto info = nrf52_info();
  auto uicr = filled(0x20, 0xFF);
  put_word(uicr, 0x14, 0x78000);
  const auto res =
      classify_sources({source("bl.bin", 0x78000, filled(0x1000)),
                        source("uicr.bin", 0x1000'1000, uicr)},
                       info);
  REQUIRE(Address::find_region(res.regions, RegionName::BOOTLOADER));
}

TEST_CASE("radio stack and application", "[classifier]") {
  const auto info = nrf52_info();

  SECTION("application recognized by its vector table") {
    const auto res =
        classify_sources({source("sd.bin", 0x1000, radio_stack_image(0x25000)),
                          source("app.bin", 0x30000,
                                 application_image(0x30000, 0x800))},
                         info);
    REQUIRE(res.regions ==
            RegionList{region(RegionName::SOFTDEVICE, 0x1000, 0x25000,
                              {"sd.bin"}),
                       region(RegionName::APPLICATION, 0x30000, 0x800,
                              {"app.bin"})});
    REQUIRE(res.detected_names ==
            Address::RegionNameSet{RegionName::APPLICATION,
                                   RegionName::SOFTDEVICE});
  }

  // radio stack ending at 0x26000, 4KiB pages
  SECTION("application inferred right after the radio stack") {
    const auto res =
        classify_sources({source("sd.bin", 0x1000, radio_stack_image(0x25000)),
                          source("app.bin", 0x26000, filled(0x800))},
                         info);
    const auto app = Address::find_region(res.regions, RegionName::APPLICATION);
    REQUIRE(app);
    REQUIRE(app->start == 0x26000);
    REQUIRE(app->size == 0x800);
  }
  SECTION("application inferred one page further") {
    const auto res =
        classify_sources({source("sd.bin", 0x1000, radio_stack_image(0x24800)),
                          source("app.bin", 0x27000, filled(0x800))},
                         info);
    const auto app = Address::find_region(res.regions, RegionName::APPLICATION);
    REQUIRE(app);
    REQUIRE(app->start == 0x27000);
  }
  SECTION("nothing at the expected place") {
    const auto res =
        classify_sources({source("sd.bin", 0x1000, radio_stack_image(0x25000)),
                          source("data.bin", 0x40000, filled(0x800))},
                         info);
    REQUIRE_FALSE(Address::find_region(res.regions, RegionName::APPLICATION));
  }
  SECTION("radio stack known from the device only") {
    const auto res =
        classify_sources({source("app.bin", 0x26000, filled(0x800))}, info,
                         {region(RegionName::SOFTDEVICE, 0x1000, 0x25000)});
    const auto app = Address::find_region(res.regions, RegionName::APPLICATION);
    REQUIRE(app);
    REQUIRE(app->start == 0x26000);
  }
  SECTION("without radio stack only an application at the vector table "
          "address keeps its label") {
    const auto misplaced = classify_sources(
        {source("app.bin", 0x30000, application_image(0x30000, 0x800))}, info);
    REQUIRE_FALSE(
        Address::find_region(misplaced.regions, RegionName::APPLICATION));
    REQUIRE(misplaced.detected_names.empty());

    const auto standalone = classify_sources(
        {source("app.bin", 0x1000, application_image(0x1000, 0x800))}, info);
    REQUIRE(Address::find_region(standalone.regions, RegionName::APPLICATION));
  }
}

TEST_CASE("injected strategies", "[classifier]") {
  const auto info = nrf52_info();
  const std::vector<SourceImage> files{source("a.bin", 0x1000, filled(0x1000)),
                                       source("b.bin", 0x3000, filled(0x1000))};

  Address::Strategies strategies{
      [](Memory::Block const &b) { return b.base_addr == 0x1000; }, {}};
  const auto res = Address::classify_files(files, info, strategies);
  REQUIRE(res.regions.at(0).name == RegionName::SOFTDEVICE);
  REQUIRE(res.regions.at(1).name == RegionName::APPLICATION);
  REQUIRE(res.regions.at(1).start == 0x3000);

  SECTION("empty strategies never match") {
    const auto none = Address::classify_files(files, info, {});
    REQUIRE(none.regions.at(0).name == RegionName::NONE);
    REQUIRE(none.regions.at(1).name == RegionName::NONE);
  }
}

TEST_CASE("bootloader coalescing", "[classifier][coalesce]") {
  const auto info = nrf52_info();

  SECTION("gaps after a bootloader known from the device") {
    const auto res =
        classify_sources({source("bl1.bin", 0x71000, filled(0x1000)),
                          source("bl2.bin", 0x72000, filled(0x1000)),
                          source("bl3.bin", 0x73000, filled(0x1000))},
                         info,
                         {region(RegionName::BOOTLOADER, 0x70000, 0x1000)});
    REQUIRE(res.regions ==
            RegionList{region(RegionName::BOOTLOADER, 0x70000, 0x4000,
                              {"bl1.bin", "bl2.bin", "bl3.bin"})});
    REQUIRE(res.detected_names ==
            Address::RegionNameSet{RegionName::BOOTLOADER});
  }
  SECTION("bootloader image at the address known from the device") {
    const auto res =
        classify_sources({source("bl.bin", 0x70000, filled(0x1000)),
                          source("settings.bin", 0x72000, filled(0x1000))},
                         info,
                         {region(RegionName::BOOTLOADER, 0x70000, 0x1000)});
    REQUIRE_FALSE(Address::has_overlapping_regions(res.regions));
    REQUIRE(res.regions ==
            RegionList{region(RegionName::BOOTLOADER, 0x70000, 0x3000,
                              {"bl.bin", "settings.bin"})});
  }
  SECTION("image crossing the bootloader address known from the device") {
    const auto res =
        classify_sources({source("app.bin", 0x6F000, filled(0x2000)),
                          source("settings.bin", 0x72000, filled(0x1000))},
                         info,
                         {region(RegionName::BOOTLOADER, 0x70000, 0x1000)});
    REQUIRE_FALSE(Address::has_overlapping_regions(res.regions));
    REQUIRE(res.regions ==
            RegionList{region(RegionName::NONE, 0x6F000, 0x2000, {"app.bin"}),
                       region(RegionName::NONE, 0x72000, 0x1000,
                              {"settings.bin"})});
    REQUIRE(res.detected_names.empty());
  }
  SECTION("settings page of the bootloader image") {
    const auto with_bl = nrf52_info(0x78000);
    const auto res =
        classify_sources({source("bl.bin", 0x78000, filled(0x4000)),
                          source("settings.bin", 0x7E000, filled(0x1000))},
                         with_bl);
    REQUIRE(res.regions ==
            RegionList{region(RegionName::BOOTLOADER, 0x78000, 0x7000,
                              {"bl.bin", "settings.bin"})});
  }
  SECTION("data reaching the end of ROM is left alone") {
    const auto with_bl = nrf52_info(0x78000);
    const auto res =
        classify_sources({source("bl.bin", 0x78000, filled(0x4000)),
                          source("tail.bin", 0x7F000, filled(0x1000))},
                         with_bl);
    REQUIRE(res.regions.size() == 2);
    REQUIRE(res.regions.at(1) ==
            region(RegionName::NONE, 0x7F000, 0x1000, {"tail.bin"}));
  }
}

TEST_CASE("application coalescing", "[classifier][coalesce]") {
  const auto info = nrf52_info(0x78000);
  const auto res =
      classify_sources({source("sd.bin", 0x1000, radio_stack_image(0x25000)),
                        source("app.bin", 0x26000, filled(0x1000)),
                        source("data.bin", 0x30000, filled(0x1000)),
                        source("bl.bin", 0x78000, filled(0x1000))},
                       info);
  REQUIRE(res.regions ==
          RegionList{region(RegionName::SOFTDEVICE, 0x1000, 0x25000,
                            {"sd.bin"}),
                     region(RegionName::APPLICATION, 0x26000, 0xB000,
                            {"app.bin", "data.bin"}),
                     region(RegionName::BOOTLOADER, 0x78000, 0x1000,
                            {"bl.bin"})});
  REQUIRE(res.detected_names ==
          Address::RegionNameSet{RegionName::APPLICATION,
                                 RegionName::SOFTDEVICE,
                                 RegionName::BOOTLOADER});
}

TEST_CASE("application stops below the bootloader known from the device",
          "[classifier][coalesce]") {
  const auto info = nrf52_info();
  const auto res =
      classify_sources({source("sd.bin", 0x1000, radio_stack_image(0x25000)),
                        source("app.bin", 0x26000, filled(0x1000)),
                        source("data.bin", 0x30000, filled(0x1000)),
                        source("tail.bin", 0x6F000, filled(0x2000))},
                       info,
                       {region(RegionName::BOOTLOADER, 0x70000, 0x1000)});
  REQUIRE_FALSE(Address::has_overlapping_regions(res.regions));
  REQUIRE(res.regions ==
          RegionList{region(RegionName::SOFTDEVICE, 0x1000, 0x25000,
                            {"sd.bin"}),
                     region(RegionName::APPLICATION, 0x26000, 0xB000,
                            {"app.bin", "data.bin"}),
                     region(RegionName::NONE, 0x6F000, 0x2000,
                            {"tail.bin"})});
}

TEST_CASE("overlapping regions", "[region]") {
  REQUIRE_FALSE(Address::has_overlapping_regions({}));
  REQUIRE_FALSE(Address::has_overlapping_regions(
      {region(RegionName::NONE, 0x2000, 0x1000),
       region(RegionName::NONE, 0x1000, 0x1000)}));
  REQUIRE(Address::has_overlapping_regions(
      {region(RegionName::BOOTLOADER, 0x70000, 0x3000),
       region(RegionName::NONE, 0x6F000, 0x2000)}));
}

TEST_CASE("classification of a device image", "[classifier]") {
  const auto info = nrf52_info();
  auto image = Memory::SparseMemoryMap::from_bytes(0x0, filled(0x1000, 0x00));
  image.set(0x1000, radio_stack_image(0x25000));
  image.set(0x26000, filled(0x2000));
  auto uicr = filled(0x400, 0xFF);
  put_word(uicr, 0x14, 0x78000);
  image.set(0x1000'1000, uicr);
  image.set(0x78000, filled(0x2000));

  const auto res =
      Address::classify_image(image, info, Address::default_strategies(info));
  // a single source yields one region per contiguous run, so the MBR, the
  // radio stack and the application form one region
  REQUIRE(res.regions.size() == 3);
  REQUIRE(res.regions.at(0) == region(RegionName::SOFTDEVICE, 0x0, 0x28000));
  REQUIRE(res.regions.at(1) ==
          region(RegionName::BOOTLOADER, 0x78000, 0x2000));
  REQUIRE(res.regions.at(2) ==
          region(RegionName::UICR, 0x1000'1000, 0x400));
  REQUIRE(res.detected_names ==
          Address::RegionNameSet{RegionName::SOFTDEVICE,
                                 RegionName::BOOTLOADER});
}

TEST_CASE("file warnings", "[diagnostics]") {
  const auto info = nrf52_info();

  SECTION("clean input") {
    const std::vector<Memory::SparseMemoryMap> maps{map_of(0x1000, 0x100),
                                                    map_of(0x2000, 0x100)};
    REQUIRE(Address::file_warnings(Memory::overlap(maps), info).empty());
  }
  SECTION("overlapping files") {
    const std::vector<Memory::SparseMemoryMap> maps{map_of(0x1000, 0x100),
                                                    map_of(0x1080, 0x100)};
    const auto overlaps = Memory::overlap(maps);
    REQUIRE(Address::has_overlapping_files(overlaps));
    REQUIRE(Address::file_warnings(overlaps, info) ==
            std::vector<std::string>{
                "Some of the HEX files have overlapping data."});
  }
  SECTION("adjacent files do not overlap") {
    const std::vector<Memory::SparseMemoryMap> maps{map_of(0x1000, 0x100),
                                                    map_of(0x1100, 0x100)};
    REQUIRE_FALSE(Address::has_overlapping_files(Memory::overlap(maps)));
  }
  SECTION("data outside of ROM and of the config page") {
    const std::vector<Memory::SparseMemoryMap> maps{
        map_of(0x7F000, 0x2000), map_of(0x1000'1000, 0x800)};
    const auto overlaps = Memory::overlap(maps);
    REQUIRE(Address::outside_writable_ranges(overlaps, info) ==
            std::vector<std::string>{"0007F000-00081000",
                                     "10001000-10001800"});
    REQUIRE(Address::file_warnings(overlaps, info) ==
            std::vector<std::string>{
                "There is data outside the user-writable areas "
                "(0007F000-00081000, 10001000-10001800)."});
  }
}
