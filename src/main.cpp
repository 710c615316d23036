#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>
#include <sys/stat.h>
#include <curl/curl.h>

#include "util.hpp"
#include "net/api.hpp"
#include "net/http.hpp"
#include "up/coordinator.hpp"
#include "up/node.hpp"
#include "up/transport.hpp"
#include "vaultup/config.hpp"
#include "vaultup/errors.hpp"

static void usage(const char* argv0){
  std::fprintf(stderr,
    "Usage: %s --target=<handle> [--name=<n>] [--mtime=<unix>] [--label=0..7] [--fav]\n"
    "          [--fa=<refs>] [--thumb=<img>] [--preview=<img>] [--media-fa=<attr>]\n"
    "          [--replace=<handle>] [--mkdir=<name>] [-v] <file>\n"
    "Environment: VAULTUP_KEY (32 hex chars, required), VAULTUP_SID, VAULTUP_GATEWAY,\n"
    "             VAULTUP_CONCURRENCY, VAULTUP_MAC_TIMEOUT, VAULTUP_RETRIES, VAULTUP_VERBOSE\n",
    argv0);
}

// "--opt=value" or "--opt value"; advances i past what it consumed
static bool take_opt(int argc, char* argv[], int& i, const char* opt, std::string& out){
  size_t n = std::strlen(opt);
  if (std::strncmp(argv[i], opt, n) != 0) return false;
  if (argv[i][n] == '=') {
    out = argv[i] + n + 1;
    ++i;
    return true;
  }
  if (argv[i][n] == '\0' && i + 1 < argc) {
    out = argv[i + 1];
    i += 2;
    return true;
  }
  return false;
}

// Whole file into `out`; false with a message on failure
static bool read_image(const std::string& path, std::vector<uint8_t>& out){
  uint64_t size = 0;
  int fd = util::fs::open_source(path.c_str(), size);
  if (fd < 0) {
    std::fprintf(stderr, "Cannot open '%s': %s\n", path.c_str(), std::strerror(-fd));
    return false;
  }
  out.resize(size);
  ssize_t n = util::fs::full_pread(fd, out.data(), out.size(), 0);
  close(fd);
  if (n < 0 || static_cast<uint64_t>(n) != size) {
    std::fprintf(stderr, "Short read on '%s'\n", path.c_str());
    return false;
  }
  return true;
}

static int run(int argc, char* argv[], vaultup::Config& cfg){
  if (vaultup::load_config_from_env(cfg) != 0) return 1;

  std::string target, name, mtime, label, fa, thumb, preview, media_fa, replace, mkdir_name, path;
  bool fav = false;

  int i = 1;
  while (i < argc) {
    if (take_opt(argc, argv, i, "--target", target)) continue;
    if (take_opt(argc, argv, i, "--name", name)) continue;
    if (take_opt(argc, argv, i, "--mtime", mtime)) continue;
    if (take_opt(argc, argv, i, "--label", label)) continue;
    if (take_opt(argc, argv, i, "--fa", fa)) continue;
    if (take_opt(argc, argv, i, "--thumb", thumb)) continue;
    if (take_opt(argc, argv, i, "--preview", preview)) continue;
    if (take_opt(argc, argv, i, "--media-fa", media_fa)) continue;
    if (take_opt(argc, argv, i, "--replace", replace)) continue;
    if (take_opt(argc, argv, i, "--mkdir", mkdir_name)) continue;
    if (std::strcmp(argv[i], "--fav") == 0) { fav = true; ++i; continue; }
    if (std::strcmp(argv[i], "-v") == 0) { cfg.verbose = true; ++i; continue; }
    if (argv[i][0] == '-' || !path.empty()) {
      std::fprintf(stderr, "Unexpected argument '%s'\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
    path = util::rstrip_slash(util::expand_args(argv[i]));
    ++i;
  }

  if (target.empty()) {
    std::fprintf(stderr, "Missing --target\n");
    usage(argv[0]);
    return 1;
  }
  if (path.empty() && mkdir_name.empty()) {
    usage(argv[0]);
    return 1;
  }
  if (!cfg.have_key) {
    std::fprintf(stderr, "VAULTUP_KEY not set\n");
    return 1;
  }

  up::RetryPolicy policy;
  policy.retries = cfg.retries;
  policy.backoff = cfg.backoff;
  policy.max_backoff = cfg.max_backoff;

  net::CurlHttp http(cfg.http_timeout_s, cfg.verbose);
  net::ApiClient api(http, cfg.gateway, cfg.sid, policy, cfg.verbose);

  int rc = 0;
  if (!mkdir_name.empty()) {
    std::string folder;
    if ((rc = up::create_folder(api, target, mkdir_name, cfg.key.data(), folder)) != 0) {
      std::fprintf(stderr, "mkdir failed: %s\n", vaultup::strerror(rc));
      return 1;
    }
    std::printf("folder %s\n", folder.c_str());
    target = folder;
    if (path.empty()) return 0;
  }

  up::UploadRequest req;
  req.parent = target;
  req.fa = fa;
  req.media_fa = media_fa;
  if (!thumb.empty() && !read_image(util::expand_args(thumb), req.thumbnail)) return 1;
  if (!preview.empty() && !read_image(util::expand_args(preview), req.preview)) return 1;
  req.replace = replace;
  req.attrs.name = name.empty() ? util::base_name(path) : name;
  req.attrs.fav = fav;
  if (!label.empty()) {
    char* end = nullptr;
    long v = std::strtol(label.c_str(), &end, 10);
    if (*end != '\0' || v < 0 || v > 7) {
      std::fprintf(stderr, "Invalid --label '%s'\n", label.c_str());
      return 1;
    }
    req.attrs.label = static_cast<int>(v);
  }
  if (!mtime.empty()) {
    char* end = nullptr;
    long long v = std::strtoll(mtime.c_str(), &end, 10);
    if (*end != '\0') {
      std::fprintf(stderr, "Invalid --mtime '%s'\n", mtime.c_str());
      return 1;
    }
    req.attrs.mtime = v;
  } else {
    struct stat st{};
    if (stat(path.c_str(), &st) == 0) req.attrs.mtime = static_cast<int64_t>(st.st_mtime);
  }

  up::HttpChunkTransport transport(http, policy, cfg.verbose);

  up::CoordinatorOptions opts;
  opts.concurrency = cfg.concurrency;
  opts.mac_depth = cfg.mac_depth;
  opts.mac_timeout = cfg.mac_timeout;
  opts.verbose = cfg.verbose;

  up::UploadCoordinator coord(api, transport, cfg.key.data(), opts);
  coord.set_attribute_http(&http);
  if (cfg.verbose) {
    coord.set_progress([](const up::Progress& p){
      std::fprintf(stderr, "[UP] %llu/%llu chunks, %llu/%llu bytes\n",
                   (unsigned long long)p.chunks_done, (unsigned long long)p.chunks_total,
                   (unsigned long long)p.bytes_done, (unsigned long long)p.bytes_total);
    });
  }

  up::UploadResult res;
  rc = coord.upload_file(path, req, res);
  if (rc != 0) {
    std::fprintf(stderr, "upload failed: %s\n", vaultup::strerror(rc));
    return 1;
  }

  for (const auto& w : res.warnings) std::fprintf(stderr, "warning: %s\n", w.c_str());
  std::printf("handle %s\n", res.handle.c_str());
  std::printf("link   %s\n", up::make_link(res.handle, res.key).c_str());
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage(argv[0]);
    return 1;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::fprintf(stderr, "curl_global_init failed\n");
    return 1;
  }
  vaultup::Config cfg;
  int ret = run(argc, argv, cfg);
  vaultup::wipe_config(cfg);
  curl_global_cleanup();
  return ret;
}
