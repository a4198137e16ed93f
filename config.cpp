#include "config.h"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>

NacConfig default_config() {
  NacConfig cfg;
  cfg.entries = {DEFAULT_NAC_INIT, DEFAULT_NAC_KEY_ESTABLISHMENT,
                 DEFAULT_NAC_SIGN};
  cfg.trace_hooks = false;
  return cfg;
}

static bool parse_hex(const std::string &text, uint64_t *value) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  unsigned long long v = std::strtoull(text.c_str(), &end, 16);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  *value = v;
  return true;
}

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

ConfigLoader::ConfigLoader() : config(default_config()) {}

ConfigLoader &ConfigLoader::instance() {
  static ConfigLoader instance;
  return instance;
}

void ConfigLoader::reset() { config = default_config(); }

bool ConfigLoader::parse_line(const std::string &line) {
  size_t eq_pos = line.find('=');
  if (eq_pos == std::string::npos)
    return false;
  std::string key = trim(line.substr(0, eq_pos));
  std::string val = trim(line.substr(eq_pos + 1));

  if (key == "binary") {
    config.binary_path = val;
  } else if (key == "fixtures") {
    config.fixtures_path = val;
  } else if (key == "trace_hooks") {
    if (val != "0" && val != "1")
      return false;
    config.trace_hooks = val == "1";
  } else if (key.compare(0, 6, "entry:") == 0) {
    uint64_t addr = 0;
    if (!parse_hex(val, &addr))
      return false;
    std::string name = key.substr(6);
    if (name == "nac_init")
      config.entries.nac_init = addr;
    else if (name == "nac_key_establishment")
      config.entries.nac_key_establishment = addr;
    else if (name == "nac_sign")
      config.entries.nac_sign = addr;
    else
      return false;
  } else {
    return false;
  }
  return true;
}

bool ConfigLoader::load_config(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open())
    return false;

  std::string line;
  while (std::getline(f, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    if (!parse_line(line))
      std::cerr << "[!] Skipping config line: " << line << std::endl;
  }
  return true;
}
