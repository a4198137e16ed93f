#include "util.h"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

static const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int base64_value(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string Utils::base64_encode(const std::vector<uint8_t> &data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    out.push_back(BASE64_ALPHABET[(v >> 18) & 0x3F]);
    out.push_back(BASE64_ALPHABET[(v >> 12) & 0x3F]);
    out.push_back(BASE64_ALPHABET[(v >> 6) & 0x3F]);
    out.push_back(BASE64_ALPHABET[v & 0x3F]);
  }
  size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t v = data[i] << 16;
    out.push_back(BASE64_ALPHABET[(v >> 18) & 0x3F]);
    out.push_back(BASE64_ALPHABET[(v >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    uint32_t v = (data[i] << 16) | (data[i + 1] << 8);
    out.push_back(BASE64_ALPHABET[(v >> 18) & 0x3F]);
    out.push_back(BASE64_ALPHABET[(v >> 12) & 0x3F]);
    out.push_back(BASE64_ALPHABET[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

bool Utils::base64_decode(const std::string &text, std::vector<uint8_t> &out) {
  out.clear();
  uint32_t acc = 0;
  int bits = 0;
  size_t padding = 0;
  size_t symbols = 0;
  for (char c : text) {
    if (std::isspace((unsigned char)c))
      continue;
    if (c == '=') {
      padding++;
      symbols++;
      continue;
    }
    // data after padding
    if (padding)
      return false;
    int v = base64_value(c);
    if (v < 0)
      return false;
    symbols++;
    acc = (acc << 6) | (uint32_t)v;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back((uint8_t)((acc >> bits) & 0xFF));
    }
  }
  return symbols % 4 == 0 && padding <= 2;
}

std::string Utils::encode_hex(const std::vector<uint8_t> &data) {
  std::ostringstream ss;
  for (uint8_t b : data)
    ss << std::hex << std::setw(2) << std::setfill('0') << (int)b;
  return ss.str();
}

bool Utils::decode_hex(const std::string &text, std::vector<uint8_t> &out) {
  out.clear();
  std::string digits;
  for (char c : text) {
    if (!std::isspace((unsigned char)c))
      digits.push_back(c);
  }
  if (digits.size() % 2)
    return false;
  for (size_t i = 0; i < digits.size(); i += 2) {
    int hi = hex_value(digits[i]);
    int lo = hex_value(digits[i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return true;
}

bool Utils::read_file(const std::string &path, std::vector<uint8_t> &out) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open())
    return false;
  out.assign(std::istreambuf_iterator<char>(f),
             std::istreambuf_iterator<char>());
  return !f.bad();
}

bool Utils::write_file(const std::string &path,
                       const std::vector<uint8_t> &data) {
  std::ofstream f(path, std::ios::binary);
  if (!f.is_open())
    return false;
  f.write(reinterpret_cast<const char *>(data.data()), data.size());
  return f.good();
}

std::string Utils::format_size(size_t bytes) {
  const char *u[] = {"B", "KB", "MB", "GB"};
  int i = 0;
  double s = bytes;
  while (s >= 1024 && i < 3) {
    s /= 1024;
    i++;
  }
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(i ? 2 : 0) << s << u[i];
  return ss.str();
}

std::string Utils::hex(uint64_t value) {
  std::ostringstream ss;
  ss << "0x" << std::hex << value;
  return ss.str();
}
