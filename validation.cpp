#include "validation.h"
#include "macho.h"
#include "sandbox.h"
#include "util.h"
#include <iostream>

static ValidationResult fail(EmuError err, const std::string &message) {
  std::cerr << "[!] " << emu_error_name(err) << ": " << message << std::endl;
  return {"", false, err, message};
}

static ValidationResult fail(const CallResult &r) {
  return fail(r.error, r.error_message);
}

static ValidationResult fail(Sandbox &sb) {
  const EmuFault &f = sb.emulator().last_fault();
  return fail(f.error, f.message);
}

// Routines report status as a 32-bit int in eax.
static bool check_status(const char *routine, const CallResult &r,
                         ValidationResult &out) {
  if (!r.success) {
    out = fail(r);
    return false;
  }
  int64_t status = (int32_t)(uint32_t)r.return_value;
  if (status != 0) {
    out = fail(EmuError::CallFailed,
               std::string(routine) + " returned " + std::to_string(status));
    return false;
  }
  return true;
}

static bool copy_in(Sandbox &sb, const std::vector<uint8_t> &bytes,
                    uint64_t *addr) {
  *addr = sb.emulator().allocate(bytes.size());
  return sb.emulator().write_memory(*addr, bytes);
}

ReplaySessionBroker::ReplaySessionBroker(
    const std::vector<uint8_t> &cert, const std::vector<uint8_t> &session_info)
    : cert(cert), session(session_info) {}

bool ReplaySessionBroker::fetch_certificate(std::vector<uint8_t> &out,
                                            std::string &error) {
  if (cert.empty()) {
    error = "no certificate bundled";
    return false;
  }
  out = cert;
  return true;
}

bool ReplaySessionBroker::exchange(const std::vector<uint8_t> &request,
                                   std::vector<uint8_t> &session_info,
                                   std::string &error) {
  (void)request;
  if (session.empty()) {
    error = "no session info bundled";
    return false;
  }
  session_info = session;
  return true;
}

FileSessionBroker::FileSessionBroker(const std::string &cert_path,
                                     const std::string &session_path,
                                     const std::string &request_out)
    : cert_path(cert_path), session_path(session_path),
      request_out(request_out) {}

bool FileSessionBroker::fetch_certificate(std::vector<uint8_t> &cert,
                                          std::string &error) {
  if (!Utils::read_file(cert_path, cert)) {
    error = "cannot read " + cert_path;
    return false;
  }
  return true;
}

bool FileSessionBroker::exchange(const std::vector<uint8_t> &request,
                                 std::vector<uint8_t> &session_info,
                                 std::string &error) {
  if (!request_out.empty() && !Utils::write_file(request_out, request)) {
    error = "cannot write " + request_out;
    return false;
  }
  if (!Utils::read_file(session_path, session_info)) {
    error = "cannot read " + session_path;
    return false;
  }
  return true;
}

ValidationDriver::ValidationDriver(const std::vector<uint8_t> &binary,
                                   const FixtureSet &fixtures,
                                   const NacEntryPoints &entries,
                                   SessionBroker &broker)
    : binary(binary), fixtures(fixtures), entries(entries), broker(broker),
      trace(false) {}

ValidationResult ValidationDriver::generate() {
  std::string error;
  std::vector<uint8_t> slice;
  if (!MachOParser::get_arch_slice(binary, CPU_TYPE_X86_64, slice, error))
    return fail(EmuError::FormatError, error);

  Sandbox sb(fixtures);
  sb.set_trace(trace);
  if (!sb.setup(slice))
    return fail(sb);
  std::cerr << "[+] Mapped " << Utils::format_size(slice.size())
            << " x86_64 slice, " << sb.bound_imports().size()
            << " import slots bound" << std::endl;

  std::vector<uint8_t> cert;
  if (!broker.fetch_certificate(cert, error))
    return fail(EmuError::CallFailed, "fetching certificate: " + error);

  Emulator &emu = sb.emulator();
  uint64_t cert_addr = 0;
  if (!copy_in(sb, cert, &cert_addr))
    return fail(sb);
  uint64_t ctx_out = emu.allocate(8);
  uint64_t request_out = emu.allocate(8);
  uint64_t request_len_out = emu.allocate(8);

  ValidationResult out;
  CallResult r = sb.call(entries.nac_init, {cert_addr, cert.size(), ctx_out,
                                            request_out, request_len_out});
  if (!check_status("nac_init", r, out))
    return out;

  uint64_t ctx = 0;
  uint64_t request_addr = 0;
  uint64_t request_len = 0;
  if (!emu.read_u64(ctx_out, &ctx) || !emu.read_u64(request_out, &request_addr) ||
      !emu.read_u64(request_len_out, &request_len))
    return fail(sb);
  if (request_len > MAX_BLOB_SIZE)
    return fail(EmuError::BufferOverflow,
                "session request of " + std::to_string(request_len) + " bytes");
  std::vector<uint8_t> request;
  if (!emu.read_memory(request_addr, request_len, request))
    return fail(sb);
  std::cerr << "[+] nac_init ok, session request "
            << Utils::format_size(request.size()) << std::endl;

  std::vector<uint8_t> session_info;
  if (!broker.exchange(request, session_info, error))
    return fail(EmuError::CallFailed, "session exchange: " + error);

  uint64_t info_addr = 0;
  if (!copy_in(sb, session_info, &info_addr))
    return fail(sb);
  r = sb.call(entries.nac_key_establishment,
              {ctx, info_addr, session_info.size()});
  if (!check_status("nac_key_establishment", r, out))
    return out;

  uint64_t blob_out = emu.allocate(8);
  uint64_t blob_len_out = emu.allocate(8);
  r = sb.call(entries.nac_sign, {ctx, 0, 0, blob_out, blob_len_out});
  if (!check_status("nac_sign", r, out))
    return out;

  uint64_t blob_addr = 0;
  uint64_t blob_len = 0;
  if (!emu.read_u64(blob_out, &blob_addr) ||
      !emu.read_u64(blob_len_out, &blob_len))
    return fail(sb);
  if (blob_len > MAX_BLOB_SIZE)
    return fail(EmuError::BufferOverflow,
                "validation data of " + std::to_string(blob_len) + " bytes");
  std::vector<uint8_t> blob;
  if (!emu.read_memory(blob_addr, blob_len, blob))
    return fail(sb);
  std::cerr << "[+] nac_sign ok, " << Utils::format_size(blob.size())
            << " of validation data" << std::endl;

  return {Utils::base64_encode(blob), true, EmuError::None, ""};
}

ValidationResult generate_validation_data(const NacConfig &config,
                                          SessionBroker &broker) {
  std::vector<uint8_t> binary;
  if (config.binary_path.empty())
    return fail(EmuError::FormatError, "no binary configured");
  if (!Utils::read_file(config.binary_path, binary))
    return fail(EmuError::FormatError, "cannot read " + config.binary_path);

  FixtureSet fixtures = FixtureSet::builtin();
  std::string error;
  if (!config.fixtures_path.empty() &&
      !fixtures.load_file(config.fixtures_path, error))
    return fail(EmuError::FormatError, error);

  ValidationDriver driver(binary, fixtures, config.entries, broker);
  driver.set_trace(config.trace_hooks);
  return driver.generate();
}

ValidationResult generate_validation_data() {
  return generate_validation_data(BundledAssets::compiled_in());
}

ValidationResult generate_validation_data(const BundledAssets &assets) {
  if (assets.binary.empty())
    return fail(EmuError::FormatError, "no binary bundled");
  ReplaySessionBroker broker(assets.certificate, assets.session_info);
  ValidationDriver driver(assets.binary, FixtureSet::builtin(),
                          default_config().entries, broker);
  return driver.generate();
}
