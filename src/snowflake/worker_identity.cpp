#include "idforge/snowflake/worker_identity.h"

#include "idforge/core/sha256.h"
#include "idforge/core/time.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netpacket/packet.h>
#include <sys/socket.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <array>
#include <charconv>
#include <cstdio>
#include <cstdlib>

namespace idforge::snowflake {

namespace {

// RAII holders for the raw handles the probes use.
struct IfaddrsDeleter {
  void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

class SocketHandle {
 public:
  explicit SocketHandle(int fd) : fd_(fd) {}
  ~SocketHandle() {
    if (fd_ >= 0) {
      close(fd_);
    }
  }

  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;
  SocketHandle(SocketHandle&&) = delete;
  SocketHandle& operator=(SocketHandle&&) = delete;

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }

 private:
  int fd_;
};

std::string probe_hostname() {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
    return {};
  }
  return std::string{buffer.data()};
}

std::string probe_mac_address() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    return {};
  }
  const std::unique_ptr<ifaddrs, IfaddrsDeleter> list(raw);

  for (const ifaddrs* it = list.get(); it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_PACKET) {
      continue;
    }
    if ((it->ifa_flags & IFF_LOOPBACK) != 0 || (it->ifa_flags & IFF_UP) == 0) {
      continue;
    }

    const auto* link = reinterpret_cast<const sockaddr_ll*>(it->ifa_addr);
    if (link->sll_halen == 0) {
      continue;
    }

    std::string mac;
    for (unsigned i = 0; i < link->sll_halen; ++i) {
      std::array<char, 4> octet{};
      std::snprintf(octet.data(), octet.size(), "%02x", static_cast<unsigned>(link->sll_addr[i]));
      if (i > 0) {
        mac.push_back(':');
      }
      mac += octet.data();
    }
    return mac;
  }
  return {};
}

// Connecting a UDP socket selects the outbound route without sending a packet.
std::string probe_local_ip() {
  const SocketHandle sock(socket(AF_INET, SOCK_DGRAM, 0));
  if (!sock.valid()) {
    return {};
  }

  sockaddr_in remote{};
  remote.sin_family = AF_INET;
  remote.sin_port = htons(80);
  if (inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr) != 1) {
    return {};
  }
  if (connect(sock.get(), reinterpret_cast<const sockaddr*>(&remote), sizeof(remote)) != 0) {
    return {};
  }

  sockaddr_in local{};
  socklen_t local_len = sizeof(local);
  if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &local_len) != 0) {
    return {};
  }

  std::array<char, INET_ADDRSTRLEN> text{};
  if (inet_ntop(AF_INET, &local.sin_addr, text.data(), text.size()) == nullptr) {
    return {};
  }
  return std::string{text.data()};
}

std::string probe_platform() {
  utsname info{};
  if (uname(&info) != 0) {
    return {};
  }
  std::string platform;
  for (const char* p = info.sysname; *p != '\0'; ++p) {
    const char ch = *p;
    platform.push_back(ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch);
  }
  platform += info.machine;
  return platform;
}

}  // namespace

std::string_view to_string(const IdSource source) {
  switch (source) {
    case IdSource::kExplicit:
      return "explicit";
    case IdSource::kEnvironment:
      return "environment";
    case IdSource::kMachine:
      return "machine";
  }
  return "unknown";
}

EnvLookup process_env() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string{value};
  };
}

core::Result<std::int64_t, core::ConfigError> parse_id_value(
    const std::string_view name, const std::optional<std::string>& raw, const std::int64_t max_id,
    const core::ConfigErrorCode out_of_range_code) {
  using ParseResult = core::Result<std::int64_t, core::ConfigError>;
  using core::ConfigError;
  using core::ConfigErrorCode;

  if (!raw.has_value() || raw->empty()) {
    return ParseResult::err(ConfigError{ConfigErrorCode::kNotSet, std::string{name} + " is not set"});
  }

  const std::string& text = raw.value();
  std::string_view digits{text};
  if (digits.front() == '+') {
    digits.remove_prefix(1);
    if (!digits.empty() && digits.front() == '-') {
      digits = {};
    }
  }

  std::int64_t value = 0;
  const char* last = digits.data() + digits.size();
  const auto [end, ec] = std::from_chars(digits.data(), last, value);
  if (digits.empty() || ec != std::errc{} || end != last) {
    return ParseResult::err(ConfigError{ConfigErrorCode::kInvalidFormat,
                                        std::string{name} + " is not a decimal integer: '" +
                                            text + "'"});
  }

  if (value < 0 || value > max_id) {
    return ParseResult::err(ConfigError{out_of_range_code, std::string{name} + " is outside [0, " +
                                                               std::to_string(max_id) +
                                                               "]: " + std::to_string(value)});
  }
  return ParseResult::ok(value);
}

core::Result<std::int64_t, core::ConfigError> worker_id_from_env(const EnvLookup& env) {
  return parse_id_value(kWorkerIdEnvVar, env(kWorkerIdEnvVar), kMaxWorkerId,
                        core::ConfigErrorCode::kWorkerIdOutOfRange);
}

core::Result<std::int64_t, core::ConfigError> datacenter_id_from_env(const EnvLookup& env) {
  return parse_id_value(kDatacenterIdEnvVar, env(kDatacenterIdEnvVar), kMaxDatacenterId,
                        core::ConfigErrorCode::kDatacenterIdOutOfRange);
}

std::string MachineFingerprint::to_string() const {
  return hostname + mac_address + local_ip + platform + process_id;
}

MachineFingerprint collect_machine_fingerprint() {
  MachineFingerprint fingerprint;
  fingerprint.hostname = probe_hostname();
  fingerprint.mac_address = probe_mac_address();
  fingerprint.local_ip = probe_local_ip();
  fingerprint.platform = probe_platform();
  fingerprint.process_id = std::to_string(getpid());
  return fingerprint;
}

std::int64_t derive_machine_id(const std::string_view fingerprint, const std::string_view suffix) {
  std::string material{fingerprint};
  if (material.empty()) {
    material = std::to_string(core::to_unix_nanos(core::now_utc()));
  }
  material += suffix;

  const core::Sha256Digest digest = core::sha256_digest(material);
  return static_cast<std::int64_t>(digest[0] & 0x1Fu);
}

std::int64_t machine_worker_id(const MachineFingerprint& fingerprint) {
  return derive_machine_id(fingerprint.to_string(), kWorkerSuffix);
}

std::int64_t machine_datacenter_id(const MachineFingerprint& fingerprint) {
  return derive_machine_id(fingerprint.to_string(), kDatacenterSuffix);
}

WorkerIdentity machine_worker_identity(const MachineFingerprint& fingerprint) {
  return WorkerIdentity{machine_worker_id(fingerprint), machine_datacenter_id(fingerprint),
                        IdSource::kMachine, IdSource::kMachine};
}

namespace {

// resolve_one applies the override / environment / machine order for a single id.
core::Status<core::ConfigError> resolve_one(
    const std::optional<std::int64_t>& override_value,
    const core::Result<std::int64_t, core::ConfigError>& from_env, const std::int64_t machine_value,
    std::int64_t& id, IdSource& source) {
  if (override_value.has_value()) {
    id = override_value.value();
    source = IdSource::kExplicit;
  } else if (from_env.has_value()) {
    id = from_env.value();
    source = IdSource::kEnvironment;
  } else if (from_env.error().code == core::ConfigErrorCode::kNotSet) {
    id = machine_value;
    source = IdSource::kMachine;
  } else {
    return core::Status<core::ConfigError>::err(from_env.error());
  }
  return core::ok_status<core::ConfigError>();
}

}  // namespace

core::Result<WorkerIdentity, core::ConfigError> resolve_worker_identity(
    const EnvLookup& env, const MachineFingerprint& fingerprint,
    const WorkerIdentityOverrides& overrides) {
  using ResolveResult = core::Result<WorkerIdentity, core::ConfigError>;

  WorkerIdentity identity;

  const auto worker = resolve_one(overrides.worker_id, worker_id_from_env(env),
                                  machine_worker_id(fingerprint), identity.worker_id,
                                  identity.worker_source);
  if (!worker.has_value()) {
    return ResolveResult::err(worker.error());
  }

  const auto datacenter = resolve_one(overrides.datacenter_id, datacenter_id_from_env(env),
                                      machine_datacenter_id(fingerprint), identity.datacenter_id,
                                      identity.datacenter_source);
  if (!datacenter.has_value()) {
    return ResolveResult::err(datacenter.error());
  }

  return ResolveResult::ok(identity);
}

core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> create_from_env(
    core::IClock& clock, const EnvLookup& env) {
  using CreateResult = core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError>;

  const auto identity = resolve_worker_identity(env, collect_machine_fingerprint());
  if (!identity.has_value()) {
    return CreateResult::err(identity.error());
  }
  return SnowflakeGenerator::create(identity.value().worker_id, identity.value().datacenter_id,
                                    clock);
}

core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> create_with_machine_identity(
    core::IClock& clock) {
  const WorkerIdentity identity = machine_worker_identity(collect_machine_fingerprint());
  return SnowflakeGenerator::create(identity.worker_id, identity.datacenter_id, clock);
}

}  // namespace idforge::snowflake
