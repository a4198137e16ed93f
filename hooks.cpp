#include "hooks.h"

bool HookTable::add(const std::string &name, std::unique_ptr<Hook> hook) {
  if (!hook || hooks.count(name))
    return false;
  hooks[name] = std::move(hook);
  return true;
}

bool HookTable::add(const std::string &name, size_t arity,
                    FunctionHook::Fn fn) {
  return add(name, std::make_unique<FunctionHook>(arity, std::move(fn)));
}

Hook *HookTable::find(const std::string &name) const {
  auto it = hooks.find(name);
  if (it == hooks.end())
    return nullptr;
  return it->second.get();
}

bool HookTable::resolve(const std::string &name, uint64_t *address) {
  auto it = by_name.find(name);
  if (it != by_name.end()) {
    *address = it->second;
    return true;
  }
  if (by_name.size() >= size)
    return false;
  uint64_t slot = base + by_name.size();
  by_name[name] = slot;
  by_address[slot] = name;
  *address = slot;
  return true;
}

bool HookTable::symbol_at(uint64_t address, std::string &name) const {
  auto it = by_address.find(address);
  if (it == by_address.end())
    return false;
  name = it->second;
  return true;
}

EmuError HookTable::invoke(const std::string &name, Sandbox &sandbox,
                           const std::vector<uint64_t> &args,
                           uint64_t *ret) const {
  Hook *hook = find(name);
  if (!hook)
    return EmuError::UnresolvedHook;
  if (args.size() != hook->arity())
    return EmuError::InvalidHookArity;
  *ret = hook->invoke(sandbox, args);
  return EmuError::None;
}
