#pragma once
#include "error.h"
#include "macho.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unicorn/unicorn.h>
#include <vector>

struct CallResult {
  uint64_t return_value;
  bool success;
  EmuError error;
  std::string error_message;
};

// x86-64 machine with a flat address space. Regions are mapped once per run;
// the first fault sticks and every later call fails with it.
class Emulator {
public:
  static constexpr uint64_t PAGE_BYTES = 0x1000;
  static constexpr uint64_t STACK_BASE = 0x00300000;
  static constexpr uint64_t STACK_SIZE = 0x00100000;
  static constexpr uint64_t HEAP_BASE = 0x00400000;
  static constexpr uint64_t HEAP_SIZE = 0x00100000;
  static constexpr uint64_t STOP_ADDRESS = 0x00900000;
  static constexpr uint64_t HOOK_BASE = 0x00D00000;
  static constexpr uint64_t HOOK_SIZE = 0x1000;
  static constexpr uint8_t RET_OPCODE = 0xC3;
  static constexpr size_t ARG_REGISTER_COUNT = 6;
  // Largest single host-side transfer; guest lengths above it are a
  // BufferOverflow fault.
  static constexpr uint64_t MAX_TRANSFER = HEAP_SIZE;

  Emulator();
  ~Emulator();
  Emulator(const Emulator &) = delete;
  Emulator &operator=(const Emulator &) = delete;

  bool create();
  bool map_region(uint64_t base, uint64_t size, uint32_t perms);
  bool map_hook_region();
  bool map_stack();
  bool map_heap();
  bool map_stop_page();
  bool map_image(const std::vector<uint8_t> &slice, const MachOImage &image);

  uint64_t allocate(uint64_t size);
  uint64_t heap_used() const { return heap_cursor; }

  CallResult call(uint64_t address, const std::vector<uint64_t> &args);

  bool read_memory(uint64_t addr, size_t len, std::vector<uint8_t> &out);
  bool write_memory(uint64_t addr, const void *data, size_t len);
  bool write_memory(uint64_t addr, const std::vector<uint8_t> &bytes);
  bool fill_memory(uint64_t addr, uint8_t value, uint64_t len);
  bool read_u64(uint64_t addr, uint64_t *value);
  bool write_u64(uint64_t addr, uint64_t value);
  bool read_cstring(uint64_t addr, size_t max_len, std::string &out);

  uint64_t get_register(int reg);
  bool set_register(int reg, uint64_t value);
  // Reads `count` integer arguments as seen on entry to a called function:
  // rdi, rsi, rdx, rcx, r8, r9, then [rsp+8], [rsp+16], ...
  bool read_args(size_t count, std::vector<uint64_t> &args);

  bool add_code_hook(uint64_t begin, uint64_t end, void *callback,
                     void *user_data);

  void fault(EmuError err, uint64_t address, const std::string &message);
  bool has_fault() const { return faulted; }
  const EmuFault &last_fault() const { return fault_info; }

  uint64_t image_start() const { return image_lo; }
  uint64_t image_end() const { return image_hi; }

private:
  static bool on_invalid_memory(uc_engine *uc, uc_mem_type type,
                                uint64_t address, int size, int64_t value,
                                void *user_data);
  CallResult failed_call() const;

  uc_engine *uc;
  uint64_t heap_cursor;
  bool running;
  bool faulted;
  EmuFault fault_info;
  uc_hook invalid_hook;
  uint64_t image_lo;
  uint64_t image_hi;
};
