#include "fixtures.h"
#include "util.h"
#include <fstream>

FixtureSet FixtureSet::builtin() {
  FixtureSet f;
  std::vector<uint8_t> bytes;

  // Obfuscated property names are the ones the binary asks for verbatim.
  f.set_iokit_string("4D1EDE05-38C7-4A6A-9CC6-4BCCA8B38C14:MLB",
                     "C02717410GUG3L3JA");
  Utils::decode_hex("1c1ac89b8e9a", bytes);
  f.set_iokit_data("4D1EDE05-38C7-4A6A-9CC6-4BCCA8B38C14:ROM", bytes);
  Utils::decode_hex("b1cc3d7a19cf7e40ad40d46bf4b0a8ec57b7b3d2", bytes);
  f.set_iokit_data("Fyp98tpgj", bytes);
  Utils::decode_hex("5e8e4c1c2e0e4b1b85ee0cbb3c9a3f7ea9dd2b6a", bytes);
  f.set_iokit_data("Gq3489ugfi", bytes);
  Utils::decode_hex("3c0754a1b2c4", bytes);
  f.set_iokit_data("IOMACAddress", bytes);
  f.set_iokit_string("IOPlatformSerialNumber", "C02TM2ZBHX87");
  f.set_iokit_string("IOPlatformUUID",
                     "0BD27F7E-43B6-5A6C-8E3F-2A7D9C4B1E60");
  Utils::decode_hex("4a1f30e5c8b27d6e91a0f2c3b4d5e6f708192a3b", bytes);
  f.set_iokit_data("abKPld1EcMni", bytes);
  f.set_iokit_data("board-id", std::vector<uint8_t>{
                                   'M', 'a', 'c', '-', '2', '7', 'A', 'D',
                                   '2', 'F', '9', '1', '8', 'A', 'E', '6',
                                   '8', 'F', '6', '1', 0});
  Utils::decode_hex("9e0c4d7a2b6f81c35da0e7b9f2146c8ad3b05e71", bytes);
  f.set_iokit_data("kbjfrfpoJU", bytes);
  Utils::decode_hex("d7b2a91e4c6f3058be1a92c7f40d6e8315a7c2b9", bytes);
  f.set_iokit_data("oycqAZloTNDm", bytes);
  f.set_iokit_data("product-name",
                   std::vector<uint8_t>{'M', 'a', 'c', 'm', 'i', 'n', 'i', '7',
                                        ',', '1', 0});
  f.set_root_disk_uuid("3D6E2A9C-71F4-4B8E-A05D-C9E1F27B8A43");
  return f;
}

const FixtureValue *FixtureSet::iokit(const std::string &name) const {
  auto it = iokit_props.find(name);
  if (it == iokit_props.end())
    return nullptr;
  return &it->second;
}

void FixtureSet::set_iokit_data(const std::string &name,
                                const std::vector<uint8_t> &d) {
  iokit_props[name] = {false, "", d};
}

void FixtureSet::set_iokit_string(const std::string &name,
                                  const std::string &s) {
  iokit_props[name] = {true, s, {}};
}

bool FixtureSet::parse_line(const std::string &line, std::string &error) {
  size_t eq_pos = line.find('=');
  if (eq_pos == std::string::npos) {
    error = "missing '=' in \"" + line + "\"";
    return false;
  }
  std::string key = line.substr(0, eq_pos);
  std::string val = line.substr(eq_pos + 1);

  if (key == "disk:root_uuid") {
    root_uuid = val;
    return true;
  }
  if (key.compare(0, 6, "iokit:") != 0 || key.size() == 6) {
    error = "unknown fixture key \"" + key + "\"";
    return false;
  }
  std::string prop = key.substr(6);
  if (val.compare(0, 7, "string:") == 0) {
    set_iokit_string(prop, val.substr(7));
    return true;
  }
  if (val.compare(0, 5, "data:") == 0) {
    std::vector<uint8_t> bytes;
    if (!Utils::decode_hex(val.substr(5), bytes)) {
      error = "bad hex for \"" + prop + "\"";
      return false;
    }
    set_iokit_data(prop, bytes);
    return true;
  }
  error = "value of \"" + prop + "\" must start with data: or string:";
  return false;
}

bool FixtureSet::load_file(const std::string &path, std::string &error) {
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "cannot open " + path;
    return false;
  }
  std::string line;
  int lineno = 0;
  while (std::getline(f, line)) {
    lineno++;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty() || line[0] == '#')
      continue;
    std::string err;
    if (!parse_line(line, err)) {
      error = path + ":" + std::to_string(lineno) + ": " + err;
      return false;
    }
  }
  return true;
}
