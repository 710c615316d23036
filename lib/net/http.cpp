#include <cstdio>
#include <string>
#include <curl/curl.h>

#include "net/http.hpp"
#include "vaultup/errors.hpp"

namespace net {

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata){
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// Non-zero return makes curl abort the transfer with CURLE_ABORTED_BY_CALLBACK
static int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t){
  auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
  return (cancel && cancel->load()) ? 1 : 0;
}

int CurlHttp::post(const std::string& url, const char* content_type,
                   const uint8_t* body, size_t len,
                   HttpResponse& resp,
                   const std::atomic<bool>* cancel){
  if (cancel && cancel->load()) return vaultup::E_CANCELLED;

  CURL* curl = curl_easy_init();
  if (!curl) return vaultup::E_TRANSIENT;

  struct curl_slist* headers = nullptr;
  std::string ct = std::string("Content-Type: ") + (content_type ? content_type : "application/octet-stream");
  headers = curl_slist_append(headers, ct.c_str());

  resp.status = 0;
  resp.body.clear();

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(body));
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(len));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancel));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  int rc = 0;
  CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_ABORTED_BY_CALLBACK){
    rc = vaultup::E_CANCELLED;
  } else if (res != CURLE_OK){
    if (verbose_) std::fprintf(stderr, "[HTTP] POST %zu bytes failed: %s\n", len, curl_easy_strerror(res));
    rc = vaultup::E_TRANSIENT;
  } else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  }

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return rc;
}

}
