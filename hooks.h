#pragma once
#include "error.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Sandbox;

// Harness-side stand-in for one imported symbol.
class Hook {
public:
  virtual ~Hook() = default;
  virtual size_t arity() const = 0;
  // Hooks report failures through Sandbox::emulator().fault() and return 0.
  virtual uint64_t invoke(Sandbox &sandbox,
                          const std::vector<uint64_t> &args) = 0;
};

class FunctionHook : public Hook {
public:
  using Fn = std::function<uint64_t(Sandbox &, const std::vector<uint64_t> &)>;

  FunctionHook(size_t arity, Fn fn) : argc(arity), fn(std::move(fn)) {}
  size_t arity() const override { return argc; }
  uint64_t invoke(Sandbox &sandbox,
                  const std::vector<uint64_t> &args) override {
    return fn(sandbox, args);
  }

private:
  size_t argc;
  Fn fn;
};

// Symbol name -> hook, plus the one-byte slot each bound symbol owns in the
// trampoline region. Slots are assigned in binding order and never move.
class HookTable {
public:
  HookTable(uint64_t base, uint64_t size) : base(base), size(size) {}

  bool add(const std::string &name, std::unique_ptr<Hook> hook);
  bool add(const std::string &name, size_t arity, FunctionHook::Fn fn);
  Hook *find(const std::string &name) const;
  size_t hook_count() const { return hooks.size(); }

  bool resolve(const std::string &name, uint64_t *address);
  bool symbol_at(uint64_t address, std::string &name) const;
  const std::map<uint64_t, std::string> &slots() const { return by_address; }

  EmuError invoke(const std::string &name, Sandbox &sandbox,
                  const std::vector<uint64_t> &args, uint64_t *ret) const;

private:
  uint64_t base;
  uint64_t size;
  std::map<std::string, std::unique_ptr<Hook>> hooks;
  std::map<std::string, uint64_t> by_name;
  std::map<uint64_t, std::string> by_address;
};
