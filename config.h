#pragma once

#include <cstdint>
#include <string>

struct NacEntryPoints {
  uint64_t nac_init;
  uint64_t nac_key_establishment;
  uint64_t nac_sign;
};

struct NacConfig {
  std::string binary_path;
  std::string fixtures_path;
  NacEntryPoints entries;
  bool trace_hooks;
};

// Offsets of the exported routines in the shipped x86_64 slice.
static const uint64_t DEFAULT_NAC_INIT = 0xB1DB0;
static const uint64_t DEFAULT_NAC_KEY_ESTABLISHMENT = 0xB1DD0;
static const uint64_t DEFAULT_NAC_SIGN = 0xB1DF0;

NacConfig default_config();

class ConfigLoader {
public:
  static ConfigLoader &instance();

  // Loads simple key-value config
  // format: entry:nac_sign=0xb1df0
  bool load_config(const std::string &path);
  bool parse_line(const std::string &line);
  const NacConfig &get_config() const { return config; }
  void reset();

private:
  ConfigLoader();
  NacConfig config;
};
