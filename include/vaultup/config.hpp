#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "enc/params.hpp"

namespace vaultup {

inline constexpr size_t MAX_CONCURRENCY = 32;

struct Config {
  std::string gateway = "https://g.api.mega.co.nz/";
  std::string sid;
  std::array<uint8_t, enc::KEY_SIZE> key{};
  bool have_key = false;

  size_t concurrency = 20;
  size_t mac_depth = 8;
  std::chrono::milliseconds mac_timeout{120000};
  int retries = 6;
  std::chrono::milliseconds backoff{250};
  std::chrono::milliseconds max_backoff{16000};
  long http_timeout_s = 120;
  bool verbose = false;
};

// VAULTUP_GATEWAY, VAULTUP_SID, VAULTUP_KEY (32 hex chars),
// VAULTUP_CONCURRENCY, VAULTUP_MAC_TIMEOUT (seconds), VAULTUP_RETRIES,
// VAULTUP_VERBOSE. Unset variables keep their defaults; malformed ones
// are E_ARGS.
int load_config_from_env(Config& cfg);

void wipe_config(Config& cfg);

}
