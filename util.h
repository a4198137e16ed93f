#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class Utils {
public:
  static std::string base64_encode(const std::vector<uint8_t> &data);
  // Standard alphabet with '=' padding; whitespace is skipped.
  static bool base64_decode(const std::string &text, std::vector<uint8_t> &out);
  static std::string encode_hex(const std::vector<uint8_t> &data);
  static bool decode_hex(const std::string &text, std::vector<uint8_t> &out);
  static bool read_file(const std::string &path, std::vector<uint8_t> &out);
  static bool write_file(const std::string &path,
                         const std::vector<uint8_t> &data);
  static std::string format_size(size_t bytes);
  static std::string hex(uint64_t value);
};
