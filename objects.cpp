#include "objects.h"

CfObject CfObject::make_string(const std::string &s) {
  CfObject o{};
  o.type = CfType::String;
  o.string = s;
  return o;
}

CfObject CfObject::make_data(const std::vector<uint8_t> &d) {
  CfObject o{};
  o.type = CfType::Data;
  o.data = d;
  return o;
}

CfObject CfObject::make_dictionary() {
  CfObject o{};
  o.type = CfType::Dictionary;
  return o;
}

CfObject CfObject::make_opaque(uint64_t word) {
  CfObject o{};
  o.type = CfType::Opaque;
  o.raw = word;
  return o;
}

bool CfObject::operator==(const CfObject &other) const {
  if (type != other.type)
    return false;
  switch (type) {
  case CfType::String:
    return string == other.string;
  case CfType::Data:
    return data == other.data;
  case CfType::Dictionary:
    return dictionary == other.dictionary;
  case CfType::Opaque:
    return raw == other.raw;
  }
  return false;
}

const char *cf_type_name(CfType type) {
  switch (type) {
  case CfType::String:
    return "CFString";
  case CfType::Data:
    return "CFData";
  case CfType::Dictionary:
    return "CFDictionary";
  case CfType::Opaque:
    return "opaque";
  }
  return "unknown";
}

uint64_t ObjectTable::intern(const CfObject &obj) {
  objects.push_back(obj);
  return objects.size();
}

bool ObjectTable::valid(uint64_t handle) const {
  return handle >= 1 && handle <= objects.size();
}

CfObject *ObjectTable::resolve(uint64_t handle) {
  if (!valid(handle))
    return nullptr;
  return &objects[handle - 1];
}

const CfObject *ObjectTable::resolve(uint64_t handle) const {
  if (!valid(handle))
    return nullptr;
  return &objects[handle - 1];
}

uint64_t ObjectTable::create_dictionary() {
  return intern(CfObject::make_dictionary());
}

EmuError ObjectTable::get(uint64_t dict, const std::string &key,
                          uint64_t *value) const {
  const CfObject *d = resolve(dict);
  if (!d)
    return EmuError::InvalidHandle;
  if (d->type != CfType::Dictionary)
    return EmuError::WrongObjectType;
  auto it = d->dictionary.find(key);
  if (it == d->dictionary.end())
    return EmuError::KeyNotFound;
  *value = it->second;
  return EmuError::None;
}

EmuError ObjectTable::set(uint64_t dict, const std::string &key,
                          uint64_t value) {
  if (!valid(value))
    return EmuError::InvalidHandle;
  CfObject *d = resolve(dict);
  if (!d)
    return EmuError::InvalidHandle;
  if (d->type != CfType::Dictionary)
    return EmuError::WrongObjectType;
  d->dictionary[key] = value;
  return EmuError::None;
}
