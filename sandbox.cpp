#include "sandbox.h"
#include "os_hooks.h"
#include "util.h"
#include <exception>
#include <iostream>
#include <sstream>

const char *const Sandbox::VOLUME_UUID_KEY = "DADiskDescriptionVolumeUUIDKey";

Sandbox::Sandbox(const FixtureSet &fixtures)
    : hook_table(Emulator::HOOK_BASE, Emulator::HOOK_SIZE),
      fixture_set(fixtures), macho(), machine_ready(false),
      iterator_pending(false), trace(false) {}

bool Sandbox::setup_machine() {
  if (machine_ready)
    return true;
  if (!emu.create() || !emu.map_stack() || !emu.map_heap() ||
      !emu.map_stop_page() || !emu.map_hook_region())
    return false;
  OsHooks::install(hook_table);
  if (!emu.add_code_hook(Emulator::HOOK_BASE,
                         Emulator::HOOK_BASE + Emulator::HOOK_SIZE - 1,
                         reinterpret_cast<void *>(on_trap), this))
    return false;
  machine_ready = true;
  return true;
}

bool Sandbox::setup(const std::vector<uint8_t> &slice) {
  std::string error;
  if (!MachOParser::parse_image(slice, macho, error)) {
    emu.fault(EmuError::FormatError, 0, error);
    return false;
  }
  if (macho.cputype != CPU_TYPE_X86_64) {
    emu.fault(EmuError::FormatError, 0,
              "slice is " + MachOParser::cpu_name(macho.cputype) +
                  ", expected x86_64");
    return false;
  }
  if (!setup_machine() || !emu.map_image(slice, macho))
    return false;

  std::vector<ImportSlot> slots = MachOParser::get_indirect_imports(slice, macho);
  std::vector<ImportSlot> binds;
  if (!MachOParser::get_binds(slice, macho, binds, error)) {
    emu.fault(EmuError::FormatError, 0, error);
    return false;
  }
  slots.insert(slots.end(), binds.begin(), binds.end());
  return bind_imports(slots);
}

bool Sandbox::bind_imports(const std::vector<ImportSlot> &slots) {
  for (const auto &slot : slots) {
    uint64_t target = 0;
    if (!hook_table.resolve(slot.symbol, &target)) {
      emu.fault(EmuError::UnresolvedHook, slot.address,
                "trampoline region exhausted binding " + slot.symbol);
      return false;
    }
    if (!emu.write_u64(slot.address, target + (uint64_t)slot.addend))
      return false;
    bound.push_back(slot);
  }
  return true;
}

CallResult Sandbox::call(uint64_t address, const std::vector<uint64_t> &args) {
  return emu.call(address, args);
}

bool Sandbox::take_iterator() {
  bool pending = iterator_pending;
  iterator_pending = false;
  return pending;
}

CfObject *Sandbox::object(uint64_t handle, CfType expected) {
  CfObject *obj = table.resolve(handle);
  if (!obj) {
    emu.fault(EmuError::InvalidHandle, handle,
              "invalid object handle " + Utils::hex(handle));
    return nullptr;
  }
  if (obj->type != expected) {
    emu.fault(EmuError::WrongObjectType, handle,
              "handle " + std::to_string(handle) + " is " +
                  cf_type_name(obj->type) + ", expected " +
                  cf_type_name(expected));
    return nullptr;
  }
  return obj;
}

bool Sandbox::resolve_key(uint64_t word, std::string &key) {
  if (word == VOLUME_UUID_SENTINEL) {
    key = VOLUME_UUID_KEY;
    return true;
  }
  const CfObject *obj = table.resolve(word);
  if (obj && obj->type == CfType::String) {
    key = obj->string;
    return true;
  }
  return parse_cfstring(word, key);
}

bool Sandbox::parse_cfstring(uint64_t ptr, std::string &out) {
  // {isa, flags, data_ptr, length}
  uint64_t data_ptr = 0;
  uint64_t length = 0;
  if (!emu.read_u64(ptr + 16, &data_ptr) || !emu.read_u64(ptr + 24, &length))
    return false;
  if (length > CFSTRING_MAX_LENGTH) {
    emu.fault(EmuError::BufferOverflow, ptr,
              "constant string at " + Utils::hex(ptr) + " claims " +
                  std::to_string(length) + " bytes");
    return false;
  }
  std::vector<uint8_t> bytes;
  if (!emu.read_memory(data_ptr, length, bytes))
    return false;
  out.assign(bytes.begin(), bytes.end());
  return true;
}

void Sandbox::on_trap(uc_engine *uc, uint64_t address, uint32_t size,
                      void *user_data) {
  (void)uc;
  (void)size;
  Sandbox *sb = static_cast<Sandbox *>(user_data);
  // Nothing may unwind through Unicorn's frames.
  try {
    sb->dispatch(address);
  } catch (const std::exception &e) {
    sb->emu.fault(EmuError::EngineError, address,
                  std::string("hook raised: ") + e.what());
  }
}

void Sandbox::dispatch(uint64_t address) {
  if (emu.has_fault())
    return;
  std::string name;
  if (!hook_table.symbol_at(address, name)) {
    emu.fault(EmuError::UnresolvedHook, address,
              "no symbol bound at " + Utils::hex(address));
    return;
  }
  Hook *hook = hook_table.find(name);
  if (!hook) {
    emu.fault(EmuError::UnresolvedHook, address,
              "no hook for imported symbol " + name);
    return;
  }
  std::vector<uint64_t> args;
  if (!emu.read_args(hook->arity(), args))
    return;

  uint64_t ret = 0;
  EmuError err = hook_table.invoke(name, *this, args, &ret);
  if (err != EmuError::None) {
    emu.fault(err, address, std::string(emu_error_name(err)) + " in " + name);
    return;
  }
  if (trace) {
    std::ostringstream ss;
    ss << "[TRACE] " << name << "(";
    for (size_t i = 0; i < args.size(); i++)
      ss << (i ? ", " : "") << Utils::hex(args[i]);
    ss << ") = " << Utils::hex(ret);
    std::cerr << ss.str() << std::endl;
  }
  if (emu.has_fault()) {
    std::cerr << "[!] " << name << ": " << emu.last_fault().message
              << std::endl;
    return;
  }
  if (!emu.set_register(UC_X86_REG_RAX, ret))
    std::cerr << "[!] cannot return from " << name << std::endl;
}
