// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceInfo.hpp>
#include <MemoryMap.hpp>
#include <Region.hpp>
#include <RegionClassifier.hpp>
#include <fwd.hpp>

#include <argparse/argparse.hpp>
#include <concepts>
#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <iosfwd>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class Verbosity { ERROR = 0, INFO = 1, DEBUG = 2, MAX = DEBUG };

template <std::integral T> Verbosity verbosity(T val) {
  return static_cast<Verbosity>(
      std::clamp(val, T{0}, static_cast<T>(Verbosity::MAX)));
}

// Diagnostic output on stderr, stdout is reserved for results
struct Log {
  Verbosity level{Verbosity::ERROR};
  std::ostream *os{&std::cerr};

  template <typename... Args>
  void error(fmt::format_string<Args...> f, Args &&...args) const {
    emit(Verbosity::ERROR, "ERROR:", f, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void warning(fmt::format_string<Args...> f, Args &&...args) const {
    emit(Verbosity::ERROR, "WARNING:", f, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void info(fmt::format_string<Args...> f, Args &&...args) const {
    emit(Verbosity::INFO, "", f, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void debug(fmt::format_string<Args...> f, Args &&...args) const {
    emit(Verbosity::DEBUG, "", f, std::forward<Args>(args)...);
  }

private:
  template <typename... Args>
  void emit(Verbosity v, std::string_view prefix,
            fmt::format_string<Args...> f, Args &&...args) const {
    if (v > level) {
      return;
    }
    *os << prefix << fmt::format(f, std::forward<Args>(args)...) << '\n';
  }
};

namespace fs = std::filesystem;

struct AugmentedParser {
  argparse::ArgumentParser parser;
  int verbosity = 0;
};

std::unique_ptr<AugmentedParser> get_parser();

// decimal or 0x prefixed hexadecimal 32 bit value
address_t parse_number(std::string_view str);

struct ImageArg {
  fs::path path;
  address_t base_addr{};
};

// "path[@addr]", base address defaults to 0
ImageArg parse_image_arg(std::string_view arg);

byte_vector load_binary(fs::path const &path);

// Everything known about one invocation: the device, its current
// content and the images to program
struct Session {
  Device::DeviceInfo info;
  Memory::SparseMemoryMap target;
  std::vector<Address::SourceImage> files;
};

Memory::SparseMemoryMap load_target(argparse::ArgumentParser const &parser,
                                    Device::family_layout const &layout,
                                    Log const &log);

std::vector<Address::SourceImage>
load_files(argparse::ArgumentParser const &parser, Log const &log);

Device::DeviceInfo device_info(argparse::ArgumentParser const &parser,
                               Memory::SparseMemoryMap const &target);

Session load_session(argparse::ArgumentParser const &parser, Log const &log);

Memory::SparseMemoryMap merged_files(Session const &session);

void print_regions(std::ostream &os, std::string_view title,
                   Address::Classification const &c);

int execRegions(Session const &session, Log const &log);

int execCheck(Session const &session, Log const &log);

int execWrite(argparse::ArgumentParser const &args, Session const &session,
              Log const &log);

int execDump(Session const &session);
