#pragma once
#include <cstdint>
#include <string>

enum class EmuError {
  None,
  FormatError,
  EngineError,
  UnmappedMemory,
  UnresolvedHook,
  InvalidHookArity,
  InvalidHandle,
  KeyNotFound,
  WrongObjectType,
  BufferOverflow,
  CallFailed,
};

const char *emu_error_name(EmuError err);
bool is_format_error(EmuError err);

struct EmuFault {
  EmuError error;
  uint64_t address;
  std::string message;
};
