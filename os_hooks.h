#pragma once
#include "hooks.h"

// libc, IOKit, CoreFoundation and DiskArbitration imports the validation
// binary calls, answered from the Sandbox's object table and fixtures.
class OsHooks {
public:
  static void install(HookTable &table);

  static constexpr uint64_t CF_DATA_TYPE_ID = 1;
  static constexpr uint64_t CF_STRING_TYPE_ID = 2;
  static constexpr uint64_t REGISTRY_ENTRY = 1;
  static constexpr uint64_t MATCHING_SERVICE = 92;
  static constexpr uint8_t MATCHING_ITERATOR = 93;
  static constexpr uint64_t ITERATOR_ENTRY = 94;
  static constexpr uint64_t DA_SESSION = 201;
  static constexpr uint64_t DA_DISK = 202;
  static constexpr size_t SERVICE_NAME_MAX = 256;
};
