#pragma once
#include "emulator.h"
#include "fixtures.h"
#include "hooks.h"
#include "macho.h"
#include "objects.h"
#include <cstdint>
#include <string>
#include <vector>

// Per-run context handed to every hook and to the trap callback as its
// user-data pointer. Nothing in here outlives one generation.
class Sandbox {
public:
  // What the binary reads through the _kDADiskDescriptionVolumeUUIDKey slot,
  // which points into the ret-filled trampoline region.
  static constexpr uint64_t VOLUME_UUID_SENTINEL = 0xC3C3C3C3C3C3C3C3ULL;
  static const char *const VOLUME_UUID_KEY;
  static constexpr size_t CFSTRING_MAX_LENGTH = 0x10000;

  explicit Sandbox(const FixtureSet &fixtures);
  Sandbox(const Sandbox &) = delete;
  Sandbox &operator=(const Sandbox &) = delete;

  // Engine, stack, heap, stop page, trampoline region, OS hooks and the trap
  // callback. No image.
  bool setup_machine();
  // setup_machine() plus mapping and binding of a thin x86_64 slice.
  bool setup(const std::vector<uint8_t> &slice);
  bool bind_imports(const std::vector<ImportSlot> &slots);

  CallResult call(uint64_t address, const std::vector<uint64_t> &args);

  Emulator &emulator() { return emu; }
  ObjectTable &objects() { return table; }
  HookTable &hooks() { return hook_table; }
  const FixtureSet &fixtures() const { return fixture_set; }
  const MachOImage &image() const { return macho; }
  const std::vector<ImportSlot> &bound_imports() const { return bound; }

  void set_trace(bool enabled) { trace = enabled; }
  bool tracing() const { return trace; }

  void arm_iterator() { iterator_pending = true; }
  bool take_iterator();

  // Resolves a handle of the expected type; faults InvalidHandle or
  // WrongObjectType and returns nullptr otherwise.
  CfObject *object(uint64_t handle, CfType expected);
  bool resolve_key(uint64_t word, std::string &key);
  bool parse_cfstring(uint64_t ptr, std::string &out);

private:
  static void on_trap(uc_engine *uc, uint64_t address, uint32_t size,
                      void *user_data);
  void dispatch(uint64_t address);

  Emulator emu;
  ObjectTable table;
  HookTable hook_table;
  FixtureSet fixture_set;
  MachOImage macho;
  std::vector<ImportSlot> bound;
  bool machine_ready;
  bool iterator_pending;
  bool trace;
};
