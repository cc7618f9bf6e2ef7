// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <MemoryMap.hpp>

struct IDumper {
  virtual void dump_start() = 0;
  virtual void dump_end() = 0;
  virtual void dump_block(Memory::Block const &block) = 0;

protected:
  ~IDumper() = default;
};

inline void dump_map(IDumper &dumper, Memory::SparseMemoryMap const &map) {
  dumper.dump_start();
  for (Memory::Block const &b : map) {
    dumper.dump_block(b);
  }
  dumper.dump_end();
}
