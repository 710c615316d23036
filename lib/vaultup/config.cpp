#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <openssl/crypto.h>

#include "vaultup/config.hpp"
#include "vaultup/errors.hpp"
#include "util.hpp"

namespace vaultup {

static bool parse_long(const char* s, long lo, long hi, long& out){
  if (!s || !*s) return false;
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (errno != 0 || *end != '\0' || v < lo || v > hi) return false;
  out = v;
  return true;
}

int load_config_from_env(Config& cfg){
  if (const char* s = std::getenv("VAULTUP_GATEWAY")){
    if (!*s){ std::fprintf(stderr, "[CFG] VAULTUP_GATEWAY is empty\n"); return E_ARGS; }
    cfg.gateway = s;
  }
  if (const char* s = std::getenv("VAULTUP_SID")) cfg.sid = s;

  if (const char* hex = std::getenv("VAULTUP_KEY")){
    if (std::strlen(hex) != 2 * enc::KEY_SIZE){
      std::fprintf(stderr, "[CFG] VAULTUP_KEY must be %zu hex chars\n", 2 * enc::KEY_SIZE);
      return E_ARGS;
    }
    if (util::hex_decode(hex, cfg.key.data(), cfg.key.size()) != 0){
      std::fprintf(stderr, "[CFG] VAULTUP_KEY invalid hex\n");
      OPENSSL_cleanse(cfg.key.data(), cfg.key.size());
      return E_ARGS;
    }
    cfg.have_key = true;
  }

  long v = 0;
  if (const char* s = std::getenv("VAULTUP_CONCURRENCY")){
    if (!parse_long(s, 1, 1000, v)){ std::fprintf(stderr, "[CFG] bad VAULTUP_CONCURRENCY '%s'\n", s); return E_ARGS; }
    if (v > (long)MAX_CONCURRENCY){
      std::fprintf(stderr, "[CFG] VAULTUP_CONCURRENCY %ld clamped to %zu\n", v, MAX_CONCURRENCY);
      v = (long)MAX_CONCURRENCY;
    }
    cfg.concurrency = (size_t)v;
  }
  if (const char* s = std::getenv("VAULTUP_MAC_TIMEOUT")){
    if (!parse_long(s, 1, 86400, v)){ std::fprintf(stderr, "[CFG] bad VAULTUP_MAC_TIMEOUT '%s'\n", s); return E_ARGS; }
    cfg.mac_timeout = std::chrono::seconds(v);
  }
  if (const char* s = std::getenv("VAULTUP_RETRIES")){
    if (!parse_long(s, 0, 100, v)){ std::fprintf(stderr, "[CFG] bad VAULTUP_RETRIES '%s'\n", s); return E_ARGS; }
    cfg.retries = (int)v;
  }
  if (const char* s = std::getenv("VAULTUP_VERBOSE")){
    cfg.verbose = (*s && std::strcmp(s, "0") != 0);
  }
  return 0;
}

void wipe_config(Config& cfg){
  OPENSSL_cleanse(cfg.key.data(), cfg.key.size());
  cfg.have_key = false;
}

}
