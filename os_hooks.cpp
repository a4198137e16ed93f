#include "os_hooks.h"
#include "sandbox.h"
#include "util.h"
#include <algorithm>
#include <iostream>
#include <random>

using Args = const std::vector<uint64_t> &;

static void add(HookTable &table, const std::string &name, size_t arity,
                FunctionHook::Fn fn) {
  if (!table.add(name, arity, std::move(fn)))
    std::cerr << "[!] hook " << name << " registered twice" << std::endl;
}

static void constant(HookTable &table, const std::string &name,
                     uint64_t value, size_t arity = 0) {
  add(table, name, arity, [value](Sandbox &, Args) { return value; });
}

// Emulator accessors record their own faults, which stop the run after the
// hook returns; the hooks below only skip follow-up work.
static void install_libc(HookTable &table) {
  add(table, "_malloc", 1, [](Sandbox &sb, Args a) {
    return sb.emulator().allocate(a[0]);
  });
  constant(table, "_free", 0);
  constant(table, "___stack_chk_guard", 0);

  // (dest, c, len, dest_len)
  add(table, "___memset_chk", 4, [](Sandbox &sb, Args a) -> uint64_t {
    if (a[2] > a[3]) {
      sb.emulator().fault(EmuError::BufferOverflow, a[0],
                          "memset of " + std::to_string(a[2]) +
                              " bytes into a " + std::to_string(a[3]) +
                              " byte buffer");
      return 0;
    }
    sb.emulator().fill_memory(a[0], (uint8_t)(a[1] & 0xFF), a[2]);
    return 0;
  });
  add(table, "___bzero", 2, [](Sandbox &sb, Args a) -> uint64_t {
    sb.emulator().fill_memory(a[0], 0, a[1]);
    return 0;
  });
  // (dest, src, len)
  add(table, "_memcpy", 3, [](Sandbox &sb, Args a) -> uint64_t {
    std::vector<uint8_t> bytes;
    if (sb.emulator().read_memory(a[1], a[2], bytes))
      sb.emulator().write_memory(a[0], bytes);
    return 0;
  });
  constant(table, "_sysctlbyname", 0, 5);
  add(table, "_arc4random", 0, [](Sandbox &, Args) -> uint64_t {
    std::random_device rd;
    return (uint64_t)rd() & 0xFFFFFFFFULL;
  });
}

static void install_iokit(HookTable &table) {
  constant(table, "_kIOMasterPortDefault", 0);
  constant(table, "_IORegistryEntryFromPath", OsHooks::REGISTRY_ENTRY, 1);

  // (entry, key, allocator, options)
  add(table, "_IORegistryEntryCreateCFProperty", 4,
      [](Sandbox &sb, Args a) -> uint64_t {
        std::string key;
        if (!sb.resolve_key(a[1], key))
          return 0;
        const FixtureValue *value = sb.fixtures().iokit(key);
        if (!value) {
          if (sb.tracing())
            std::cerr << "[TRACE] no IOKit property \"" << key << "\""
                      << std::endl;
          return 0;
        }
        if (value->is_string)
          return sb.objects().intern(
              CfObject::make_string(value->string));
        return sb.objects().intern(CfObject::make_data(value->data));
      });

  // (entry, plane, parent_out)
  add(table, "_IORegistryEntryGetParentEntry", 3,
      [](Sandbox &sb, Args a) -> uint64_t {
        uint8_t parent = (uint8_t)((a[0] + 100) & 0xFF);
        sb.emulator().write_memory(a[2], &parent, 1);
        return 0;
      });

  add(table, "_IOServiceMatching", 1, [](Sandbox &sb, Args a) -> uint64_t {
    std::string name;
    if (!sb.emulator().read_cstring(a[0], OsHooks::SERVICE_NAME_MAX, name))
      return 0;
    ObjectTable &objects = sb.objects();
    uint64_t dict = objects.create_dictionary();
    uint64_t value = objects.intern(CfObject::make_string(name));
    EmuError err = objects.set(dict, "IOProviderClass", value);
    if (err != EmuError::None)
      sb.emulator().fault(err, dict, "cannot build matching dictionary");
    return dict;
  });

  constant(table, "_IOServiceGetMatchingService", OsHooks::MATCHING_SERVICE);

  // (port, matching, iterator_out)
  add(table, "_IOServiceGetMatchingServices", 3,
      [](Sandbox &sb, Args a) -> uint64_t {
        sb.arm_iterator();
        uint8_t iterator = OsHooks::MATCHING_ITERATOR;
        sb.emulator().write_memory(a[2], &iterator, 1);
        return 0;
      });
  add(table, "_IOIteratorNext", 1, [](Sandbox &sb, Args) -> uint64_t {
    return sb.take_iterator() ? OsHooks::ITERATOR_ENTRY : 0;
  });
  constant(table, "_IOObjectRelease", 0);
}

static void install_cf(HookTable &table) {
  constant(table, "_kCFAllocatorDefault", 0);
  constant(table, "_kCFBooleanTrue", 0);
  constant(table, "_CFRelease", 0);
  constant(table, "_CFDataGetTypeID", OsHooks::CF_DATA_TYPE_ID);
  constant(table, "_CFStringGetTypeID", OsHooks::CF_STRING_TYPE_ID);

  add(table, "_CFGetTypeID", 1, [](Sandbox &sb, Args a) -> uint64_t {
    const CfObject *obj = sb.objects().resolve(a[0]);
    if (!obj) {
      sb.emulator().fault(EmuError::InvalidHandle, a[0],
                          "CFGetTypeID on invalid handle " + Utils::hex(a[0]));
      return 0;
    }
    if (obj->type == CfType::Data)
      return OsHooks::CF_DATA_TYPE_ID;
    if (obj->type == CfType::String)
      return OsHooks::CF_STRING_TYPE_ID;
    sb.emulator().fault(EmuError::WrongObjectType, a[0],
                        std::string("CFGetTypeID on ") +
                            cf_type_name(obj->type));
    return 0;
  });

  add(table, "_CFDataGetLength", 1, [](Sandbox &sb, Args a) -> uint64_t {
    const CfObject *obj = sb.object(a[0], CfType::Data);
    return obj ? obj->data.size() : 0;
  });

  // (data, range.location, range.length, buffer)
  add(table, "_CFDataGetBytes", 4, [](Sandbox &sb, Args a) -> uint64_t {
    const CfObject *obj = sb.object(a[0], CfType::Data);
    if (!obj)
      return 0;
    uint64_t location = a[1];
    uint64_t length = a[2];
    if (location > obj->data.size() || length > obj->data.size() - location) {
      sb.emulator().fault(EmuError::BufferOverflow, a[0],
                          "range " + std::to_string(location) + "+" +
                              std::to_string(length) + " outside " +
                              std::to_string(obj->data.size()) + " bytes");
      return 0;
    }
    if (!sb.emulator().write_memory(a[3], obj->data.data() + location, length))
      return 0;
    return length;
  });

  add(table, "_CFDictionaryCreateMutable", 0, [](Sandbox &sb, Args) {
    return sb.objects().create_dictionary();
  });

  // (dict, key, value)
  add(table, "_CFDictionarySetValue", 3, [](Sandbox &sb, Args a) -> uint64_t {
    std::string key;
    if (!sb.resolve_key(a[1], key))
      return 0;
    ObjectTable &objects = sb.objects();
    uint64_t value = a[2];
    if (!objects.valid(value))
      value = objects.intern(CfObject::make_opaque(a[2]));
    EmuError err = objects.set(a[0], key, value);
    if (err != EmuError::None)
      sb.emulator().fault(err, a[0],
                          "CFDictionarySetValue(\"" + key + "\") failed");
    return 0;
  });

  // (dict, key)
  add(table, "_CFDictionaryGetValue", 2, [](Sandbox &sb, Args a) -> uint64_t {
    std::string key;
    if (!sb.resolve_key(a[1], key))
      return 0;
    uint64_t value = 0;
    EmuError err = sb.objects().get(a[0], key, &value);
    if (err != EmuError::None) {
      sb.emulator().fault(err, a[0],
                          "CFDictionaryGetValue(\"" + key + "\") failed");
      return 0;
    }
    return value;
  });

  add(table, "_CFStringGetLength", 1, [](Sandbox &sb, Args a) -> uint64_t {
    const CfObject *obj = sb.object(a[0], CfType::String);
    return obj ? obj->string.size() : 0;
  });
  // (length, encoding)
  add(table, "_CFStringGetMaximumSizeForEncoding", 2,
      [](Sandbox &, Args a) { return a[0]; });

  // (string, buffer, capacity, encoding)
  add(table, "_CFStringGetCString", 4, [](Sandbox &sb, Args a) -> uint64_t {
    const CfObject *obj = sb.object(a[0], CfType::String);
    if (!obj)
      return 0;
    uint64_t n = std::min<uint64_t>(obj->string.size(), a[2]);
    if (!sb.emulator().write_memory(a[1], obj->string.data(), n))
      return 0;
    return n;
  });

  // (allocator, uuid)
  add(table, "_CFUUIDCreateString", 2, [](Sandbox &, Args a) { return a[1]; });
}

static void install_disk(HookTable &table) {
  constant(table, "_kDADiskDescriptionVolumeUUIDKey", 0);
  constant(table, "_DASessionCreate", OsHooks::DA_SESSION);
  constant(table, "_DADiskCreateFromBSDName", OsHooks::DA_DISK);
  add(table, "_DADiskCopyDescription", 0, [](Sandbox &sb, Args) -> uint64_t {
    ObjectTable &objects = sb.objects();
    uint64_t dict = objects.create_dictionary();
    uint64_t uuid = objects.intern(
        CfObject::make_string(sb.fixtures().root_disk_uuid()));
    EmuError err = objects.set(dict, Sandbox::VOLUME_UUID_KEY, uuid);
    if (err != EmuError::None)
      sb.emulator().fault(err, dict, "cannot build disk description");
    return dict;
  });
  constant(table, "_statfs$INODE64", 0);
}

void OsHooks::install(HookTable &table) {
  install_libc(table);
  install_iokit(table);
  install_cf(table);
  install_disk(table);
}
