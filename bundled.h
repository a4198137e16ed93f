#pragma once
#include <cstdint>
#include <vector>

// Inputs compiled into the library at build time: the universal binary and
// a captured validation-session replay. Empty when the build was configured
// without them.
struct BundledAssets {
  std::vector<uint8_t> binary;
  std::vector<uint8_t> certificate;
  std::vector<uint8_t> session_info;

  static BundledAssets compiled_in();
};
