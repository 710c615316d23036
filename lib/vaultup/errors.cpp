#include "vaultup/errors.hpp"

namespace vaultup {

const char* strerror(int rc){
  switch (rc){
    case OK:              return "success";
    case E_EMPTY_SOURCE:  return "source is empty";
    case E_SOURCE_READ:   return "failed to read source";
    case E_ORDER:         return "chunk encrypted out of order";
    case E_KEY_FORMAT:    return "node key has invalid length";
    case E_ATTR_DECODE:   return "attribute block is not valid";
    case E_TRANSIENT:     return "transfer failed (retries exhausted)";
    case E_PERMANENT:     return "server rejected chunk";
    case E_MISSING_TOKEN: return "no upload token after last chunk";
    case E_MAC_TIMEOUT:   return "timed out waiting for MAC to drain";
    case E_MAC_MISMATCH:  return "file MAC does not match";
    case E_CRYPTO:        return "cipher failure";
    case E_ARGS:          return "invalid argument";
    case E_STATE:         return "operation not allowed in current state";
    case E_CANCELLED:     return "cancelled";
    case E_API:           return "API returned an error";
    case E_TIMEOUT:       return "timed out waiting for transfers";
    default:              return "unknown error";
  }
}

bool service_code_transient(long code){
  return code == -3 || code == -4 || code == -6 || code == -18;
}

const char* service_strerror(long code){
  switch (code){
    case -1:  return "EINTERNAL";
    case -2:  return "EARGS";
    case -3:  return "EAGAIN";
    case -4:  return "ERATELIMIT";
    case -5:  return "EFAILED";
    case -6:  return "ETOOMANY";
    case -7:  return "ERANGE";
    case -8:  return "EEXPIRED";
    case -9:  return "ENOENT";
    case -10: return "ECIRCULAR";
    case -11: return "EACCESS";
    case -12: return "EEXIST";
    case -13: return "EINCOMPLETE";
    case -14: return "EKEY";
    case -15: return "ESID";
    case -16: return "EBLOCKED";
    case -17: return "EOVERQUOTA";
    case -18: return "ETEMPUNAVAIL";
    default:  return "EUNKNOWN";
  }
}

}
