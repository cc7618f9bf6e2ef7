// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "prog_utils.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <argparse/argparse.hpp>

#include <Diagnostics.hpp>
#include <IntelHex.hpp>
#include <MapAlgebra.hpp>
#include <WriteSafety.hpp>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <utils.hpp>

std::unique_ptr<AugmentedParser> get_parser() {
  std::unique_ptr<AugmentedParser> parser(new AugmentedParser{

      argparse::ArgumentParser{"flashmap", FLASHMAP_VER,
                               argparse::default_arguments::all},
      0});

  auto *program = &parser->parser;
  // Exec section
  auto &exec_group = program->add_mutually_exclusive_group();

  exec_group.add_argument("-r", "--regions")
      .help("classify the regions of the target and of the input files, "
            "then exits")
      .flag();

  exec_group.add_argument("-c", "--check")
      .help("tells whether the input files can be written without erasing "
            "the whole non-volatile memory")
      .flag();

  exec_group.add_argument("-w", "--write")
      .help("emit the paginated write payload in Intel Hex format")
      .flag();

  exec_group.add_argument("-d", "--dump")
      .help("hex dump of the merged input files, or of the target when no "
            "file is given")
      .flag();

  program->add_argument("--family")
      .help("device family (nrf51 or nrf52)")
      .default_value(std::string{"nrf52"})
      .choices("nrf51", "nrf52", "nRF51", "nRF52");

  program->add_argument("--rom-size")
      .help("size of the code flash in bytes")
      .default_value(0x80000u)
      .scan<'i', unsigned>();

  program->add_argument("--page-size")
      .help("flash erase page size in bytes")
      .default_value(0x1000u)
      .scan<'i', unsigned>();

  program->add_argument("--ram-size")
      .help("size of the RAM in bytes")
      .default_value(0x10000u)
      .scan<'i', unsigned>();

  program->add_argument("--bootloader-address")
      .help("start of the bootloader (read from the target config page when "
            "missing)")
      .scan<'i', unsigned>();

  program->add_argument("-t", "--target")
      .help("raw dump of the target code flash, path[@address]");

  program->add_argument("-u", "--uicr")
      .help("raw dump of the target config page (UICR)");

  program->add_argument("-f", "--file")
      .default_value<std::vector<std::string>>({})
      .append()
      .help("raw binary image to program, path[@address], can be repeated. "
            "Later files take precedence where they overlap");

  program->add_argument("-o", "--output")
      .help("output file for the write payload (stdout otherwise)");

  program->add_argument("--line-width")
      .help("number of data bytes per Intel Hex record")
      .default_value(std::size_t{64})
      .scan<'u', std::size_t>();

  program->add_argument("-V", "--verbose")
      .action([verbose = std::addressof(parser->verbosity)](const auto &) {
        *verbose += 1;
      })
      .append()
      .nargs(0)
      .help("print more information about the operation")
      .default_value(false)
      .implicit_value(true);

  return parser;
}

address_t parse_number(std::string_view str) {
  const auto orig = str;
  int base = 10;
  if (str.starts_with("0x"sv) || str.starts_with("0X"sv)) {
    str.remove_prefix(2);
    base = 16;
  }
  address_t val{};
  const auto last = str.data() + str.size();
  const auto [ptr, ec] = std::from_chars(str.data(), last, val, base);
  if (str.empty() || ec != std::errc{} || ptr != last) {
    throw std::invalid_argument(fmt::format("Invalid number: '{}'", orig));
  }
  return val;
}

ImageArg parse_image_arg(std::string_view arg) {
  const auto pos = arg.rfind('@');
  if (pos == std::string_view::npos) {
    return {fs::path(arg), 0};
  }
  return {fs::path(arg.substr(0, pos)), parse_number(arg.substr(pos + 1))};
}

byte_vector load_binary(fs::path const &path) {
  if (const auto exists = fs::exists(path);
      !exists || !fs::is_regular_file(path)) {
    throw fs::filesystem_error(
        "Input file non-existent or not a file", path,
        std::make_error_code(!exists ? std::errc::no_such_file_or_directory
                                     : std::errc::is_a_directory));
  }
  std::ifstream ifs(path, std::ios::binary);
  byte_vector res;
  std::transform(std::istreambuf_iterator<char>(ifs),
                 std::istreambuf_iterator<char>(), std::back_inserter(res),
                 [](char c) { return static_cast<std::uint8_t>(c); });
  return res;
}

Memory::SparseMemoryMap load_target(argparse::ArgumentParser const &parser,
                                    Device::family_layout const &layout,
                                    Log const &log) {
  Memory::SparseMemoryMap target;
  if (const auto arg = parser.present("--target")) {
    const auto [path, base_addr] = parse_image_arg(*arg);
    const auto bytes = load_binary(path);
    target = Memory::SparseMemoryMap::from_padded_bytes(base_addr, bytes);
    log.info("Target {}: {} non-empty blocks", path.string(),
             target.block_count());
  }
  if (const auto arg = parser.present("--uicr")) {
    // kept byte for byte, an erased page must stay visible
    auto bytes = load_binary(fs::path(*arg));
    if (!bytes.empty()) {
      target.set(layout.config_page_address, std::move(bytes));
    }
  }
  for (Memory::Block const &b : target) {
    log.debug("  target [{:08x}h,{:08x}h)", b.base_addr, b.end());
  }
  return target;
}

std::vector<Address::SourceImage>
load_files(argparse::ArgumentParser const &parser, Log const &log) {
  std::vector<Address::SourceImage> res;
  for (const auto &arg : parser.get<std::vector<std::string>>("--file")) {
    const auto [path, base_addr] = parse_image_arg(arg);
    auto bytes = load_binary(path);
    Memory::SparseMemoryMap map;
    if (!bytes.empty()) {
      map = Memory::SparseMemoryMap::from_bytes(base_addr, std::move(bytes));
    }
    for (Memory::Block const &b : map) {
      log.debug("  {} [{:08x}h,{:08x}h)", path.filename().string(),
                b.base_addr, b.end());
    }
    res.push_back({path.filename().string(), std::move(map)});
  }
  return res;
}

Device::DeviceInfo device_info(argparse::ArgumentParser const &parser,
                               Memory::SparseMemoryMap const &target) {
  auto info = Device::make_device_info(
      Device::string_to_family(parser.get<std::string>("--family")),
      parser.get<unsigned>("--rom-size"), parser.get<unsigned>("--page-size"),
      parser.get<unsigned>("--ram-size"));
  if (const auto bl = parser.present<unsigned>("--bootloader-address")) {
    info.bootloader_address = *bl;
  } else {
    info.bootloader_address = Device::bootloader_address(target, info);
  }
  Device::validate(info);
  return info;
}

Session load_session(argparse::ArgumentParser const &parser, Log const &log) {
  const auto &layout = Device::layout_of(
      Device::string_to_family(parser.get<std::string>("--family")));
  auto target = load_target(parser, layout, log);
  auto info = device_info(parser, target);
  std::ostringstream ss;
  ss << info;
  log.info("{} ({})", ss.str(),
           Device::model_name(info.family(), info.rom_size));
  auto files = load_files(parser, log);
  return Session{std::move(info), std::move(target), std::move(files)};
}

namespace {
std::vector<Memory::SparseMemoryMap> file_maps(Session const &session) {
  return session.files |
         rgv::transform([](Address::SourceImage const &f) { return f.map; }) |
         rg::to<std::vector>();
}
} // namespace

Memory::SparseMemoryMap merged_files(Session const &session) {
  return Memory::flatten(file_maps(session));
}

void print_regions(std::ostream &os, std::string_view title,
                   Address::Classification const &c) {
  os << title << ":\n";
  for (Address::Region const &r : c.regions) {
    os << "  " << r << '\n';
  }
  const auto names = c.detected_names |
                     rgv::transform(Address::region_to_string) |
                     rg::to<std::vector>();
  os << fmt::format("  Detected: {}\n", fmt::join(names, ", "));
}

int execRegions(Session const &session, Log const &log) {
  const auto strategies = Address::default_strategies(session.info);
  const auto device =
      Address::classify_image(session.target, session.info, strategies);
  print_regions(std::cout, "Device regions", device);

  const auto names =
      session.files |
      rgv::transform([](Address::SourceImage const &f) { return f.name; }) |
      rg::to<std::vector>();
  const auto overlaps = Memory::overlap(file_maps(session));
  const auto files = Address::classify(overlaps, names, session.info,
                                       strategies, device.regions);
  print_regions(std::cout, "File regions", files);

  for (const auto &w : Address::file_warnings(overlaps, session.info)) {
    log.warning("{}", w);
  }
  return 0;
}

int execCheck(Session const &session, Log const &log) {
  const auto verdict =
      Safety::evaluate_write(session.target, session.info.config_page_address(),
                             session.info.config_page_size(),
                             merged_files(session));
  log.info("Config page: {}", Safety::verdict_to_string(verdict));
  const auto ok = verdict != Safety::WriteVerdict::ERASE_REQUIRED;
  std::cout << (ok ? "Write allowed\n" : "Erase required\n");
  return ok ? 0 : 2;
}

int execWrite(argparse::ArgumentParser const &args, Session const &session,
              Log const &log) {
  const auto files = merged_files(session);
  if (!Safety::can_write(session.target, session.info, files)) {
    log.error("Can not write in the current state. Try erasing all "
              "non-volatile memory in the target.");
    return 2;
  }
  const auto payload =
      Safety::build_write_payload(files, session.target, session.info);
  log.info("Payload: {} bytes in {} blocks", payload.byte_count(),
           payload.block_count());

  const auto line_width = args.get<std::size_t>("--line-width");
  if (const auto out = args.present("--output")) {
    std::ofstream ofs(*out);
    if (!ofs) {
      throw fs::filesystem_error(
          "Can not open output file", fs::path(*out),
          std::error_code(errno, std::generic_category()));
    }
    IntelHex::Dumper dumper(ofs, line_width);
    dump_map(dumper, payload);
  } else {
    IntelHex::Dumper dumper(std::cout, line_width);
    dump_map(dumper, payload);
  }
  return 0;
}

int execDump(Session const &session) {
  OstreamDumper dumper(std::cout);
  dump_map(dumper, session.files.empty() ? session.target
                                         : merged_files(session));
  return 0;
}
