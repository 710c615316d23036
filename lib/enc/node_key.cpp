#include <cstring>
#include <openssl/crypto.h>

#include "enc/node_key.hpp"
#include "enc/crypto.hpp"
#include "vaultup/errors.hpp"

namespace enc {

using namespace vaultup;

int armor_file_key(const FileKey& fk, const uint8_t outer[KEY_SIZE], std::vector<uint8_t>& blob){
  // The FileKey is already in merged form; only the outer layer is added
  blob.assign(fk.begin(), fk.end());
  return aes_ecb_encrypt(outer, blob.data(), blob.size(), blob.data());
}

int armor_folder_key(const FolderKey& k, const uint8_t outer[KEY_SIZE], std::vector<uint8_t>& blob){
  blob.assign(k.begin(), k.end());
  return aes_ecb_encrypt(outer, blob.data(), blob.size(), blob.data());
}

int armor_node_key(const NodeKey& nk, const uint8_t outer[KEY_SIZE], std::vector<uint8_t>& blob){
  if (!nk.is_file){
    FolderKey k = nk.key;
    int rc = armor_folder_key(k, outer, blob);
    OPENSSL_cleanse(k.data(), k.size());
    return rc;
  }
  FileKey fk = merge_file_key(nk);
  int rc = armor_file_key(fk, outer, blob);
  OPENSSL_cleanse(fk.data(), fk.size());
  return rc;
}

int unarmor(const uint8_t* blob, size_t n, const uint8_t outer[KEY_SIZE], NodeKey& out){
  if (!blob || (n != FOLDER_KEY_SIZE && n != FILE_KEY_SIZE)) return E_KEY_FORMAT;

  uint8_t plain[FILE_KEY_SIZE];
  int rc = aes_ecb_decrypt(outer, blob, n, plain);
  if (rc != 0) return rc;

  if (n == FOLDER_KEY_SIZE){
    std::memcpy(out.key.data(), plain, KEY_SIZE);
    out.tail.fill(0);
    out.is_file = false;
  } else {
    for (size_t i = 0; i < KEY_SIZE; i++) out.key[i] = plain[i] ^ plain[KEY_SIZE + i];
    std::memcpy(out.tail.data(), plain + KEY_SIZE, KEY_SIZE);
    out.is_file = true;
  }
  OPENSSL_cleanse(plain, sizeof(plain));
  return 0;
}

FileKey merge_file_key(const NodeKey& nk){
  FileKey fk{};
  for (size_t i = 0; i < KEY_SIZE; i++){
    fk[i] = nk.key[i] ^ nk.tail[i];
    fk[KEY_SIZE + i] = nk.tail[i];
  }
  return fk;
}

int generate_folder_key(FolderKey& out){
  return fill_rand(out.data(), out.size());
}

void wipe_node_key(NodeKey& nk){
  OPENSSL_cleanse(nk.key.data(), nk.key.size());
  OPENSSL_cleanse(nk.tail.data(), nk.tail.size());
}

}
