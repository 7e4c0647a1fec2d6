#include "idforge/snowflake/worker_identity.h"

#include <catch2/catch.hpp>

#include <map>
#include <optional>
#include <string>

using idforge::core::ConfigErrorCode;
using idforge::snowflake::derive_machine_id;
using idforge::snowflake::EnvLookup;
using idforge::snowflake::IdSource;
using idforge::snowflake::MachineFingerprint;
using idforge::snowflake::resolve_worker_identity;
using idforge::snowflake::WorkerIdentityOverrides;

namespace {

EnvLookup env_from(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    const auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

MachineFingerprint test_fingerprint() {
  return MachineFingerprint{"build-host", "02:42:ac:11:00:02", "10.0.0.8", "linuxx86_64", "4242"};
}

}  // namespace

TEST_CASE("worker_id_from_env parses and validates", "[worker_identity][config]") {
  SECTION("valid value") {
    const auto id = idforge::snowflake::worker_id_from_env(env_from({{"IDWORKER_WORKER_ID", "17"}}));
    REQUIRE(id.has_value());
    CHECK(id.value() == 17);
  }

  SECTION("unset and empty are kNotSet") {
    const auto unset = idforge::snowflake::worker_id_from_env(env_from({}));
    REQUIRE_FALSE(unset.has_value());
    CHECK(unset.error().code == ConfigErrorCode::kNotSet);

    const auto empty = idforge::snowflake::worker_id_from_env(env_from({{"IDWORKER_WORKER_ID", ""}}));
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == ConfigErrorCode::kNotSet);
  }

  SECTION("non-numeric is kInvalidFormat") {
    for (const char* raw : {"abc", "3x", " 3", "3.0"}) {
      const auto id =
          idforge::snowflake::worker_id_from_env(env_from({{"IDWORKER_WORKER_ID", raw}}));
      REQUIRE_FALSE(id.has_value());
      CHECK(id.error().code == ConfigErrorCode::kInvalidFormat);
    }
  }

  SECTION("a single leading plus sign is accepted") {
    const auto id = idforge::snowflake::worker_id_from_env(env_from({{"IDWORKER_WORKER_ID", "+5"}}));
    REQUIRE(id.has_value());
    CHECK(id.value() == 5);

    for (const char* raw : {"+", "++5", "+-5"}) {
      const auto bad =
          idforge::snowflake::worker_id_from_env(env_from({{"IDWORKER_WORKER_ID", raw}}));
      REQUIRE_FALSE(bad.has_value());
      CHECK(bad.error().code == ConfigErrorCode::kInvalidFormat);
    }
  }

  SECTION("out of range is kWorkerIdOutOfRange") {
    for (const char* raw : {"32", "-1"}) {
      const auto id =
          idforge::snowflake::worker_id_from_env(env_from({{"IDWORKER_WORKER_ID", raw}}));
      REQUIRE_FALSE(id.has_value());
      CHECK(id.error().code == ConfigErrorCode::kWorkerIdOutOfRange);
    }
  }
}

TEST_CASE("datacenter_id_from_env reads its own variable", "[worker_identity][config]") {
  const auto env = env_from({{"IDWORKER_WORKER_ID", "1"}, {"IDWORKER_DATACENTER_ID", "31"}});
  const auto id = idforge::snowflake::datacenter_id_from_env(env);
  REQUIRE(id.has_value());
  CHECK(id.value() == 31);

  const auto high =
      idforge::snowflake::datacenter_id_from_env(env_from({{"IDWORKER_DATACENTER_ID", "40"}}));
  REQUIRE_FALSE(high.has_value());
  CHECK(high.error().code == ConfigErrorCode::kDatacenterIdOutOfRange);
}

TEST_CASE("derive_machine_id keeps the low five bits of the first SHA-256 byte",
          "[worker_identity]") {
  // sha256("abc") starts with 0xba; 0xba & 0x1f == 26.
  CHECK(derive_machine_id("ab", "c") == 26);
  CHECK(derive_machine_id("abc", "") == 26);

  const auto fingerprint = test_fingerprint().to_string();
  CHECK(derive_machine_id(fingerprint, "_worker") == derive_machine_id(fingerprint, "_worker"));

  SECTION("results stay in [0, 31]") {
    for (int i = 0; i < 200; ++i) {
      const auto id = derive_machine_id("host-" + std::to_string(i), "_datacenter");
      CHECK(id >= 0);
      CHECK(id <= 31);
    }
  }

  SECTION("an empty fingerprint falls back to the clock") {
    const auto id = derive_machine_id("", "_worker");
    CHECK(id >= 0);
    CHECK(id <= 31);
  }
}

TEST_CASE("MachineFingerprint concatenates its fields in order", "[worker_identity]") {
  CHECK(test_fingerprint().to_string() == "build-host02:42:ac:11:00:0210.0.0.8linuxx86_644242");
}

TEST_CASE("collect_machine_fingerprint always knows the process id", "[worker_identity]") {
  const auto fingerprint = idforge::snowflake::collect_machine_fingerprint();
  CHECK_FALSE(fingerprint.process_id.empty());
  CHECK_FALSE(fingerprint.to_string().empty());
}

TEST_CASE("resolve_worker_identity prefers overrides, then env, then the machine",
          "[worker_identity][config]") {
  const auto fingerprint = test_fingerprint();
  const auto machine_worker = idforge::snowflake::machine_worker_id(fingerprint);
  const auto machine_datacenter = idforge::snowflake::machine_datacenter_id(fingerprint);

  SECTION("environment values") {
    const auto identity = resolve_worker_identity(
        env_from({{"IDWORKER_WORKER_ID", "3"}, {"IDWORKER_DATACENTER_ID", "7"}}), fingerprint);
    REQUIRE(identity.has_value());
    CHECK(identity.value().worker_id == 3);
    CHECK(identity.value().datacenter_id == 7);
    CHECK(identity.value().worker_source == IdSource::kEnvironment);
    CHECK(identity.value().datacenter_source == IdSource::kEnvironment);
  }

  SECTION("unset variables fall back per id") {
    const auto identity =
        resolve_worker_identity(env_from({{"IDWORKER_WORKER_ID", "3"}}), fingerprint);
    REQUIRE(identity.has_value());
    CHECK(identity.value().worker_id == 3);
    CHECK(identity.value().worker_source == IdSource::kEnvironment);
    CHECK(identity.value().datacenter_id == machine_datacenter);
    CHECK(identity.value().datacenter_source == IdSource::kMachine);
  }

  SECTION("nothing set uses the machine for both") {
    const auto identity = resolve_worker_identity(env_from({}), fingerprint);
    REQUIRE(identity.has_value());
    CHECK(identity.value().worker_id == machine_worker);
    CHECK(identity.value().datacenter_id == machine_datacenter);
    CHECK(identity.value().worker_source == IdSource::kMachine);
  }

  SECTION("a set but invalid variable stops resolution") {
    const auto identity =
        resolve_worker_identity(env_from({{"IDWORKER_DATACENTER_ID", "nope"}}), fingerprint);
    REQUIRE_FALSE(identity.has_value());
    CHECK(identity.error().code == ConfigErrorCode::kInvalidFormat);
  }

  SECTION("overrides win even over an invalid variable") {
    const auto identity = resolve_worker_identity(
        env_from({{"IDWORKER_WORKER_ID", "99"}, {"IDWORKER_DATACENTER_ID", "5"}}), fingerprint,
        WorkerIdentityOverrides{12, std::nullopt});
    REQUIRE(identity.has_value());
    CHECK(identity.value().worker_id == 12);
    CHECK(identity.value().worker_source == IdSource::kExplicit);
    CHECK(identity.value().datacenter_id == 5);
    CHECK(identity.value().datacenter_source == IdSource::kEnvironment);
  }
}

TEST_CASE("machine_worker_identity ignores the environment", "[worker_identity]") {
  const auto fingerprint = test_fingerprint();
  const auto identity = idforge::snowflake::machine_worker_identity(fingerprint);
  CHECK(identity.worker_id == idforge::snowflake::machine_worker_id(fingerprint));
  CHECK(identity.datacenter_id == idforge::snowflake::machine_datacenter_id(fingerprint));
  CHECK(identity.worker_source == IdSource::kMachine);
  CHECK(identity.datacenter_source == IdSource::kMachine);
}

TEST_CASE("create_from_env resolves each id before building the generator",
          "[worker_identity][config]") {
  idforge::core::ManualClock clock(idforge::core::from_unix_millis(1'700'000'000'000));

  SECTION("valid environment values are used as given") {
    const auto created = idforge::snowflake::create_from_env(
        clock, env_from({{"IDWORKER_WORKER_ID", "3"}, {"IDWORKER_DATACENTER_ID", "7"}}));
    REQUIRE(created.has_value());
    CHECK(created.value()->worker_id() == 3);
    CHECK(created.value()->datacenter_id() == 7);
    CHECK(created.value()->next_id().has_value());
  }

  SECTION("unset variables fall back to machine-derived ids") {
    const auto created = idforge::snowflake::create_from_env(clock, env_from({}));
    REQUIRE(created.has_value());
    CHECK(created.value()->worker_id() >= 0);
    CHECK(created.value()->worker_id() <= idforge::snowflake::kMaxWorkerId);
    CHECK(created.value()->datacenter_id() >= 0);
    CHECK(created.value()->datacenter_id() <= idforge::snowflake::kMaxDatacenterId);
  }

  SECTION("an invalid variable is a configuration error") {
    const auto bad_format =
        idforge::snowflake::create_from_env(clock, env_from({{"IDWORKER_WORKER_ID", "three"}}));
    REQUIRE_FALSE(bad_format.has_value());
    CHECK(bad_format.error().code == ConfigErrorCode::kInvalidFormat);

    const auto out_of_range =
        idforge::snowflake::create_from_env(clock, env_from({{"IDWORKER_DATACENTER_ID", "32"}}));
    REQUIRE_FALSE(out_of_range.has_value());
    CHECK(out_of_range.error().code == ConfigErrorCode::kDatacenterIdOutOfRange);
  }
}

TEST_CASE("create_with_machine_identity always yields a valid generator", "[worker_identity]") {
  idforge::core::ManualClock clock(idforge::core::from_unix_millis(1'700'000'000'000));
  const auto created = idforge::snowflake::create_with_machine_identity(clock);
  REQUIRE(created.has_value());
  CHECK(created.value()->worker_id() >= 0);
  CHECK(created.value()->worker_id() <= idforge::snowflake::kMaxWorkerId);
  CHECK(created.value()->datacenter_id() <= idforge::snowflake::kMaxDatacenterId);
  CHECK(created.value()->next_id().has_value());
}

TEST_CASE("IdSource has stable names", "[worker_identity]") {
  CHECK(idforge::snowflake::to_string(IdSource::kExplicit) == "explicit");
  CHECK(idforge::snowflake::to_string(IdSource::kEnvironment) == "environment");
  CHECK(idforge::snowflake::to_string(IdSource::kMachine) == "machine");
}
