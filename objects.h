#pragma once
#include "error.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class CfType { String, Data, Dictionary, Opaque };

// Stand-in for a CoreFoundation object. Dictionary values are handles into
// the same ObjectTable; Opaque carries a raw word the binary passed where an
// object was expected.
struct CfObject {
  CfType type;
  std::string string;
  std::vector<uint8_t> data;
  std::map<std::string, uint64_t> dictionary;
  uint64_t raw;

  static CfObject make_string(const std::string &s);
  static CfObject make_data(const std::vector<uint8_t> &d);
  static CfObject make_dictionary();
  static CfObject make_opaque(uint64_t word);

  bool operator==(const CfObject &other) const;
  bool operator!=(const CfObject &other) const { return !(*this == other); }
};

const char *cf_type_name(CfType type);

// Append-only handle table. Handle n refers to the n-th interned object;
// handles are never reused within a run.
class ObjectTable {
public:
  uint64_t intern(const CfObject &obj);
  CfObject *resolve(uint64_t handle);
  const CfObject *resolve(uint64_t handle) const;
  bool valid(uint64_t handle) const;
  size_t size() const { return objects.size(); }

  uint64_t create_dictionary();
  EmuError get(uint64_t dict, const std::string &key, uint64_t *value) const;
  EmuError set(uint64_t dict, const std::string &key, uint64_t value);

private:
  std::vector<CfObject> objects;
};
