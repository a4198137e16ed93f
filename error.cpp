#include "error.h"

const char *emu_error_name(EmuError err) {
  switch (err) {
  case EmuError::None:
    return "none";
  case EmuError::FormatError:
    return "FormatError";
  case EmuError::EngineError:
    return "EngineError";
  case EmuError::UnmappedMemory:
    return "UnmappedMemory";
  case EmuError::UnresolvedHook:
    return "UnresolvedHook";
  case EmuError::InvalidHookArity:
    return "InvalidHookArity";
  case EmuError::InvalidHandle:
    return "InvalidHandle";
  case EmuError::KeyNotFound:
    return "KeyNotFound";
  case EmuError::WrongObjectType:
    return "WrongObjectType";
  case EmuError::BufferOverflow:
    return "BufferOverflow";
  case EmuError::CallFailed:
    return "CallFailed";
  }
  return "unknown";
}

bool is_format_error(EmuError err) { return err == EmuError::FormatError; }
