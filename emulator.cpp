#include "emulator.h"
#include "util.h"
#include <algorithm>
#include <cstring>

static const int ARG_REGISTERS[Emulator::ARG_REGISTER_COUNT] = {
    UC_X86_REG_RDI, UC_X86_REG_RSI, UC_X86_REG_RDX,
    UC_X86_REG_RCX, UC_X86_REG_R8,  UC_X86_REG_R9,
};

static uint64_t align_down(uint64_t v) { return v & ~(Emulator::PAGE_BYTES - 1); }

static uint64_t align_up(uint64_t v) {
  return (v + Emulator::PAGE_BYTES - 1) & ~(Emulator::PAGE_BYTES - 1);
}

Emulator::Emulator()
    : uc(nullptr), heap_cursor(0), running(false), faulted(false),
      fault_info{EmuError::None, 0, ""}, invalid_hook(0), image_lo(0),
      image_hi(0) {}

Emulator::~Emulator() {
  if (uc)
    uc_close(uc);
}

bool Emulator::create() {
  if (uc)
    return true;
  uc_err err = uc_open(UC_ARCH_X86, UC_MODE_64, &uc);
  if (err != UC_ERR_OK) {
    uc = nullptr;
    fault(EmuError::EngineError, 0,
          std::string("uc_open failed: ") + uc_strerror(err));
    return false;
  }
  err = uc_hook_add(uc, &invalid_hook, UC_HOOK_MEM_INVALID,
                    reinterpret_cast<void *>(on_invalid_memory), this, 1, 0);
  if (err != UC_ERR_OK) {
    fault(EmuError::EngineError, 0,
          std::string("cannot install memory hook: ") + uc_strerror(err));
    return false;
  }
  return true;
}

bool Emulator::map_region(uint64_t base, uint64_t size, uint32_t perms) {
  if (!uc) {
    fault(EmuError::EngineError, base, "engine not created");
    return false;
  }
  uc_err err = uc_mem_map(uc, base, size, perms);
  if (err != UC_ERR_OK) {
    fault(EmuError::EngineError, base,
          "cannot map " + Utils::hex(base) + "+" + Utils::hex(size) + ": " +
              uc_strerror(err));
    return false;
  }
  return true;
}

bool Emulator::map_hook_region() {
  if (!map_region(HOOK_BASE, HOOK_SIZE, UC_PROT_ALL))
    return false;
  std::vector<uint8_t> stubs(HOOK_SIZE, RET_OPCODE);
  return write_memory(HOOK_BASE, stubs);
}

bool Emulator::map_stack() {
  if (!map_region(STACK_BASE, STACK_SIZE, UC_PROT_READ | UC_PROT_WRITE))
    return false;
  return set_register(UC_X86_REG_RSP, STACK_BASE + STACK_SIZE);
}

bool Emulator::map_heap() {
  heap_cursor = 0;
  return map_region(HEAP_BASE, HEAP_SIZE, UC_PROT_READ | UC_PROT_WRITE);
}

bool Emulator::map_stop_page() {
  if (!map_region(STOP_ADDRESS, PAGE_BYTES, UC_PROT_ALL))
    return false;
  std::vector<uint8_t> stubs(PAGE_BYTES, RET_OPCODE);
  return write_memory(STOP_ADDRESS, stubs);
}

bool Emulator::map_image(const std::vector<uint8_t> &slice,
                         const MachOImage &image) {
  uint64_t lo = UINT64_MAX;
  uint64_t hi = 0;
  for (const auto &seg : image.segments) {
    if (seg.vmsize == 0 || seg.name == "__PAGEZERO")
      continue;
    lo = std::min(lo, seg.vmaddr);
    hi = std::max(hi, seg.vmaddr + seg.vmsize);
  }
  if (lo >= hi) {
    fault(EmuError::FormatError, 0, "image has no loadable segments");
    return false;
  }
  lo = align_down(lo);
  hi = align_up(hi);
  if (!map_region(lo, hi - lo, UC_PROT_ALL))
    return false;

  for (const auto &seg : image.segments) {
    if (seg.filesize == 0 || seg.name == "__PAGEZERO")
      continue;
    uint64_t len = std::min(seg.filesize, seg.vmsize);
    if (!write_memory(seg.vmaddr, slice.data() + seg.fileoff, len))
      return false;
  }

  // keep NULL dereferences faulting
  if (lo == 0) {
    uc_err err = uc_mem_unmap(uc, 0, PAGE_BYTES);
    if (err != UC_ERR_OK) {
      fault(EmuError::EngineError, 0,
            std::string("cannot unmap zero page: ") + uc_strerror(err));
      return false;
    }
  }
  image_lo = lo;
  image_hi = hi;
  return true;
}

uint64_t Emulator::allocate(uint64_t size) {
  if (size > HEAP_SIZE - heap_cursor) {
    fault(EmuError::BufferOverflow, HEAP_BASE + heap_cursor,
          "heap exhausted allocating " + std::to_string(size) + " bytes (" +
              Utils::format_size(heap_cursor) + " in use)");
    return 0;
  }
  uint64_t addr = HEAP_BASE + heap_cursor;
  heap_cursor += size;
  return addr;
}

CallResult Emulator::failed_call() const {
  return {0, false, fault_info.error, fault_info.message};
}

CallResult Emulator::call(uint64_t address, const std::vector<uint64_t> &args) {
  if (!uc)
    fault(EmuError::EngineError, address, "engine not created");
  if (faulted)
    return failed_call();

  uint64_t saved_sp = get_register(UC_X86_REG_RSP);
  size_t stack_args =
      args.size() > ARG_REGISTER_COUNT ? args.size() - ARG_REGISTER_COUNT : 0;

  // [rsp] = sentinel return address, [rsp+8..] = stack arguments; rsp+8 is
  // 16-byte aligned as on entry to a real call.
  uint64_t sp = (saved_sp - stack_args * 8) & ~0xFULL;
  sp -= 8;
  if (!write_u64(sp, STOP_ADDRESS))
    return failed_call();
  for (size_t i = 0; i < stack_args; i++) {
    if (!write_u64(sp + 8 + i * 8, args[ARG_REGISTER_COUNT + i]))
      return failed_call();
  }
  for (size_t i = 0; i < args.size() && i < ARG_REGISTER_COUNT; i++) {
    if (!set_register(ARG_REGISTERS[i], args[i]))
      return failed_call();
  }
  if (!set_register(UC_X86_REG_RSP, sp))
    return failed_call();

  running = true;
  uc_err err = uc_emu_start(uc, address, STOP_ADDRESS, 0, 0);
  running = false;

  uint64_t ret = get_register(UC_X86_REG_RAX);
  if (!set_register(UC_X86_REG_RSP, saved_sp) || faulted)
    return failed_call();
  if (err != UC_ERR_OK) {
    EmuError kind = EmuError::EngineError;
    switch (err) {
    case UC_ERR_READ_UNMAPPED:
    case UC_ERR_WRITE_UNMAPPED:
    case UC_ERR_FETCH_UNMAPPED:
    case UC_ERR_READ_PROT:
    case UC_ERR_WRITE_PROT:
    case UC_ERR_FETCH_PROT:
      kind = EmuError::UnmappedMemory;
      break;
    default:
      break;
    }
    fault(kind, get_register(UC_X86_REG_RIP),
          "emulation of " + Utils::hex(address) + " stopped: " + uc_strerror(err));
    return failed_call();
  }
  return {ret, true, EmuError::None, ""};
}

static bool within_transfer(Emulator &emu, uint64_t addr, uint64_t len) {
  if (len <= Emulator::MAX_TRANSFER)
    return true;
  emu.fault(EmuError::BufferOverflow, addr,
            "transfer of " + std::to_string(len) + " bytes at " +
                Utils::hex(addr) + " exceeds " +
                Utils::format_size(Emulator::MAX_TRANSFER));
  return false;
}

bool Emulator::read_memory(uint64_t addr, size_t len,
                           std::vector<uint8_t> &out) {
  out.clear();
  if (!within_transfer(*this, addr, len))
    return false;
  out.assign(len, 0);
  if (len == 0)
    return true;
  uc_err err = uc_mem_read(uc, addr, out.data(), len);
  if (err != UC_ERR_OK) {
    fault(EmuError::UnmappedMemory, addr,
          "read of " + std::to_string(len) + " bytes at " + Utils::hex(addr) +
              ": " + uc_strerror(err));
    return false;
  }
  return true;
}

bool Emulator::write_memory(uint64_t addr, const void *data, size_t len) {
  if (len == 0)
    return true;
  uc_err err = uc_mem_write(uc, addr, data, len);
  if (err != UC_ERR_OK) {
    fault(EmuError::UnmappedMemory, addr,
          "write of " + std::to_string(len) + " bytes at " + Utils::hex(addr) +
              ": " + uc_strerror(err));
    return false;
  }
  return true;
}

bool Emulator::write_memory(uint64_t addr, const std::vector<uint8_t> &bytes) {
  return write_memory(addr, bytes.data(), bytes.size());
}

bool Emulator::fill_memory(uint64_t addr, uint8_t value, uint64_t len) {
  if (!within_transfer(*this, addr, len))
    return false;
  std::vector<uint8_t> fill(len, value);
  return write_memory(addr, fill);
}

bool Emulator::read_u64(uint64_t addr, uint64_t *value) {
  std::vector<uint8_t> buf;
  if (!read_memory(addr, 8, buf))
    return false;
  uint64_t v = 0;
  for (int i = 7; i >= 0; i--)
    v = (v << 8) | buf[i];
  *value = v;
  return true;
}

bool Emulator::write_u64(uint64_t addr, uint64_t value) {
  uint8_t buf[8];
  for (int i = 0; i < 8; i++)
    buf[i] = (uint8_t)(value >> (i * 8));
  return write_memory(addr, buf, 8);
}

bool Emulator::read_cstring(uint64_t addr, size_t max_len, std::string &out) {
  out.clear();
  uint8_t c = 0;
  while (out.size() < max_len) {
    uc_err err = uc_mem_read(uc, addr + out.size(), &c, 1);
    if (err != UC_ERR_OK) {
      fault(EmuError::UnmappedMemory, addr + out.size(),
            "string read at " + Utils::hex(addr) + ": " + uc_strerror(err));
      return false;
    }
    if (c == 0)
      break;
    out.push_back((char)c);
  }
  return true;
}

uint64_t Emulator::get_register(int reg) {
  uint64_t value = 0;
  uc_err err = uc_reg_read(uc, reg, &value);
  if (err != UC_ERR_OK)
    fault(EmuError::EngineError, 0,
          "register read failed: " + std::string(uc_strerror(err)));
  return value;
}

bool Emulator::set_register(int reg, uint64_t value) {
  uc_err err = uc_reg_write(uc, reg, &value);
  if (err != UC_ERR_OK) {
    fault(EmuError::EngineError, 0,
          "register write failed: " + std::string(uc_strerror(err)));
    return false;
  }
  return true;
}

bool Emulator::read_args(size_t count, std::vector<uint64_t> &args) {
  args.clear();
  uint64_t sp = get_register(UC_X86_REG_RSP);
  for (size_t i = 0; i < count; i++) {
    if (i < ARG_REGISTER_COUNT) {
      args.push_back(get_register(ARG_REGISTERS[i]));
      continue;
    }
    uint64_t v = 0;
    if (!read_u64(sp + 8 + (i - ARG_REGISTER_COUNT) * 8, &v))
      return false;
    args.push_back(v);
  }
  return true;
}

bool Emulator::add_code_hook(uint64_t begin, uint64_t end, void *callback,
                             void *user_data) {
  uc_hook hh;
  uc_err err =
      uc_hook_add(uc, &hh, UC_HOOK_CODE, callback, user_data, begin, end);
  if (err != UC_ERR_OK) {
    fault(EmuError::EngineError, begin,
          std::string("cannot install code hook: ") + uc_strerror(err));
    return false;
  }
  return true;
}

void Emulator::fault(EmuError err, uint64_t address,
                     const std::string &message) {
  if (!faulted) {
    faulted = true;
    fault_info = {err, address, message};
  }
  if (running && uc)
    (void)uc_emu_stop(uc);
}

bool Emulator::on_invalid_memory(uc_engine *uc, uc_mem_type type,
                                 uint64_t address, int size, int64_t value,
                                 void *user_data) {
  Emulator *emu = static_cast<Emulator *>(user_data);
  const char *what = "access";
  switch (type) {
  case UC_MEM_READ_UNMAPPED:
  case UC_MEM_READ_PROT:
    what = "read";
    break;
  case UC_MEM_WRITE_UNMAPPED:
  case UC_MEM_WRITE_PROT:
    what = "write";
    break;
  case UC_MEM_FETCH_UNMAPPED:
  case UC_MEM_FETCH_PROT:
    what = "fetch";
    break;
  default:
    break;
  }
  uint64_t rip = 0;
  if (uc_reg_read(uc, UC_X86_REG_RIP, &rip) != UC_ERR_OK)
    rip = 0;
  emu->fault(EmuError::UnmappedMemory, address,
             std::string("invalid ") + what + " of " + std::to_string(size) +
                 " bytes at " + Utils::hex(address) + " (rip " + Utils::hex(rip) +
                 ")");
  (void)value;
  return false;
}
