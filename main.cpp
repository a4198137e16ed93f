#include "config.h"
#include "macho.h"
#include "sandbox.h"
#include "util.h"
#include "validation.h"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static constexpr const char *USAGE =
    "Usage:\n"
    "  nacsim info     <binary>\n"
    "  nacsim imports  <binary>\n"
    "  nacsim generate\n"
    "  nacsim generate --config <file> --cert <file> --session <file> "
    "[--request-out <file>] [--trace]\n";

static bool load_slice(const std::string &path, std::vector<uint8_t> &data,
                       std::vector<uint8_t> &slice) {
  if (!Utils::read_file(path, data)) {
    std::cerr << "[!] Cannot read " << path << std::endl;
    return false;
  }
  std::string error;
  if (!MachOParser::get_arch_slice(data, CPU_TYPE_X86_64, slice, error)) {
    std::cerr << "[!] " << error << std::endl;
    return false;
  }
  return true;
}

static int cmd_info(const std::string &path) {
  std::vector<uint8_t> data;
  std::vector<uint8_t> slice;
  if (!Utils::read_file(path, data)) {
    std::cerr << "[!] Cannot read " << path << std::endl;
    return 1;
  }
  std::string error;
  std::cout << "[+] " << path << " (" << Utils::format_size(data.size())
            << ")" << std::endl;
  if (MachOParser::is_fat(data)) {
    std::vector<FatSlice> slices;
    if (!MachOParser::get_fat_slices(data, slices, error)) {
      std::cerr << "[!] " << error << std::endl;
      return 1;
    }
    for (const auto &s : slices) {
      std::cout << "    " << std::left << std::setw(8)
                << MachOParser::cpu_name(s.cputype) << " offset "
                << Utils::hex(s.offset) << " size "
                << Utils::format_size(s.size) << std::endl;
    }
  }
  if (!MachOParser::get_arch_slice(data, CPU_TYPE_X86_64, slice, error)) {
    std::cerr << "[!] " << error << std::endl;
    return 1;
  }
  MachOImage image;
  if (!MachOParser::parse_image(slice, image, error)) {
    std::cerr << "[!] " << error << std::endl;
    return 1;
  }
  std::cout << "[+] x86_64 segments:" << std::endl;
  for (const auto &seg : image.segments) {
    std::cout << "    " << std::left << std::setw(16) << seg.name
              << Utils::hex(seg.vmaddr) << "-"
              << Utils::hex(seg.vmaddr + seg.vmsize) << " ("
              << seg.sections.size() << " sections)" << std::endl;
  }
  return 0;
}

static int cmd_imports(const std::string &path) {
  std::vector<uint8_t> data;
  std::vector<uint8_t> slice;
  if (!load_slice(path, data, slice))
    return 1;

  Sandbox sb(FixtureSet::builtin());
  if (!sb.setup(slice)) {
    std::cerr << "[!] " << sb.emulator().last_fault().message << std::endl;
    return 1;
  }
  size_t missing = 0;
  for (const auto &imp : sb.bound_imports()) {
    uint64_t target = 0;
    bool hooked = sb.hooks().find(imp.symbol) != nullptr;
    if (!hooked)
      missing++;
    if (!sb.hooks().resolve(imp.symbol, &target))
      continue;
    std::cout << "    " << Utils::hex(imp.address) << " -> "
              << Utils::hex(target) << "  " << std::left << std::setw(40)
              << imp.symbol << (hooked ? "" : " [no hook]") << std::endl;
  }
  std::cout << "[+] " << sb.bound_imports().size() << " slots, "
            << sb.hooks().slots().size() << " symbols, " << missing
            << " without hook" << std::endl;
  return 0;
}

static int cmd_generate(int argc, char *argv[]) {
  std::string config_path, cert_path, session_path, request_out;
  bool trace = false;
  for (int i = 2; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (arg == "--cert" && i + 1 < argc)
      cert_path = argv[++i];
    else if (arg == "--session" && i + 1 < argc)
      session_path = argv[++i];
    else if (arg == "--request-out" && i + 1 < argc)
      request_out = argv[++i];
    else if (arg == "--trace")
      trace = true;
    else {
      std::cout << USAGE;
      return 1;
    }
  }
  if (argc == 2) {
    ValidationResult result = generate_validation_data();
    if (!result.success)
      return 1;
    std::cout << result.data << std::endl;
    return 0;
  }
  if (config_path.empty() || cert_path.empty() || session_path.empty()) {
    std::cout << USAGE;
    return 1;
  }

  ConfigLoader &loader = ConfigLoader::instance();
  if (!loader.load_config(config_path)) {
    std::cerr << "[!] Cannot read config " << config_path << std::endl;
    return 1;
  }
  NacConfig config = loader.get_config();
  if (trace)
    config.trace_hooks = true;

  FileSessionBroker broker(cert_path, session_path, request_out);
  ValidationResult result = generate_validation_data(config, broker);
  if (!result.success)
    return 1;
  std::cout << result.data << std::endl;
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cout << USAGE;
    return 1;
  }

  std::string cmd = argv[1];
  if (cmd == "generate")
    return cmd_generate(argc, argv);
  if (argc != 3) {
    std::cout << USAGE;
    return 1;
  }
  if (cmd == "info")
    return cmd_info(argv[2]);
  if (cmd == "imports")
    return cmd_imports(argv[2]);
  std::cout << USAGE;
  return 1;
}
