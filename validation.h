#pragma once
#include "bundled.h"
#include "config.h"
#include "error.h"
#include "fixtures.h"
#include <cstdint>
#include <string>
#include <vector>

// The identity service's validation-session endpoints.
class SessionBroker {
public:
  virtual ~SessionBroker() = default;
  virtual bool fetch_certificate(std::vector<uint8_t> &cert,
                                 std::string &error) = 0;
  virtual bool exchange(const std::vector<uint8_t> &request,
                        std::vector<uint8_t> &session_info,
                        std::string &error) = 0;
};

// Replays a certificate and session info held in memory.
class ReplaySessionBroker : public SessionBroker {
public:
  ReplaySessionBroker(const std::vector<uint8_t> &cert,
                      const std::vector<uint8_t> &session_info);

  bool fetch_certificate(std::vector<uint8_t> &cert,
                         std::string &error) override;
  bool exchange(const std::vector<uint8_t> &request,
                std::vector<uint8_t> &session_info,
                std::string &error) override;

private:
  std::vector<uint8_t> cert;
  std::vector<uint8_t> session;
};

// Replays a certificate and session info captured to disk. The request the
// binary produced is written to request_out when that path is set.
class FileSessionBroker : public SessionBroker {
public:
  FileSessionBroker(const std::string &cert_path,
                    const std::string &session_path,
                    const std::string &request_out = "");

  bool fetch_certificate(std::vector<uint8_t> &cert,
                         std::string &error) override;
  bool exchange(const std::vector<uint8_t> &request,
                std::vector<uint8_t> &session_info,
                std::string &error) override;

private:
  std::string cert_path;
  std::string session_path;
  std::string request_out;
};

struct ValidationResult {
  std::string data; // base64
  bool success;
  EmuError error;
  std::string error_message;
};

// Runs nac_init, the session exchange, nac_key_establishment and nac_sign
// against a fresh Sandbox on every generate().
class ValidationDriver {
public:
  static constexpr uint64_t MAX_BLOB_SIZE = 0x100000;

  ValidationDriver(const std::vector<uint8_t> &binary,
                   const FixtureSet &fixtures, const NacEntryPoints &entries,
                   SessionBroker &broker);

  void set_trace(bool enabled) { trace = enabled; }
  ValidationResult generate();

private:
  const std::vector<uint8_t> &binary;
  FixtureSet fixtures;
  NacEntryPoints entries;
  SessionBroker &broker;
  bool trace;
};

// Runs the compiled-in binary against the built-in fixtures and the
// compiled-in session replay. Reads nothing at runtime.
ValidationResult generate_validation_data();
ValidationResult generate_validation_data(const BundledAssets &assets);

// Development entry point for the CLI: binary, fixture overrides and entry
// points come from configuration, the session from the given broker.
ValidationResult generate_validation_data(const NacConfig &config,
                                          SessionBroker &broker);
