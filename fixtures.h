#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct FixtureValue {
  bool is_string;
  std::string string;
  std::vector<uint8_t> data;
};

// Fabricated hardware/OS identifiers answered to the binary's IOKit and
// DiskArbitration queries. Read-only once a run starts.
class FixtureSet {
public:
  static FixtureSet builtin();

  // Lines override built-in values:
  //   iokit:<property>=data:<hex>
  //   iokit:<property>=string:<text>
  //   disk:root_uuid=<uuid>
  bool load_file(const std::string &path, std::string &error);
  bool parse_line(const std::string &line, std::string &error);

  const FixtureValue *iokit(const std::string &name) const;
  void set_iokit_data(const std::string &name, const std::vector<uint8_t> &d);
  void set_iokit_string(const std::string &name, const std::string &s);
  const std::map<std::string, FixtureValue> &properties() const {
    return iokit_props;
  }

  const std::string &root_disk_uuid() const { return root_uuid; }
  void set_root_disk_uuid(const std::string &uuid) { root_uuid = uuid; }

private:
  std::map<std::string, FixtureValue> iokit_props;
  std::string root_uuid;
};
