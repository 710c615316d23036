#include <cassert>
#include <chrono>
#include <cstdlib>
#include <string>
#include <nlohmann/json.hpp>

#include "net/api.hpp"
#include "vaultup/config.hpp"
#include "vaultup/errors.hpp"
#include "fakes.hpp"

using nlohmann::json;

static up::RetryPolicy quick(int retries){
  up::RetryPolicy p;
  p.retries = retries;
  p.backoff = std::chrono::milliseconds(1);
  p.max_backoff = std::chrono::milliseconds(2);
  return p;
}

static json body_of(const fakes::FakeHttp::Call& c){
  return json::parse(std::string(c.body.begin(), c.body.end()));
}

static void test_api(){
  // upload target
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){
      r = fakes::ok(R"([{"p":"https://ul.example/ul/xyz"}])");
      return 0;
    };
    net::ApiClient api(http, "https://g.api.example", "SID123", quick(2));
    std::string url;
    assert(api.request_upload_target(204800, url) == 0);
    assert(url == "https://ul.example/ul/xyz");

    const auto& c = http.calls[0];
    assert(c.url.rfind("https://g.api.example/cs?id=", 0) == 0);
    assert(c.url.find("&sid=SID123") != std::string::npos);
    assert(c.content_type == "application/json");
    json b = body_of(c);
    assert(b.is_array() && b.size() == 1);
    assert(b[0]["a"] == "u" && b[0]["s"] == 204800);

    // sequence ids advance
    assert(api.request_upload_target(1, url) == 0);
    assert(http.calls[1].url != http.calls[0].url);
  }

  // no session id, no sid parameter
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){ r = fakes::ok("[0]"); return 0; };
    net::ApiClient api(http, "https://g.api.example/", "", quick(0));
    assert(api.put_file_attr("h1", "0*abc") == 0);
    assert(http.calls[0].url.find("sid=") == std::string::npos);
    json b = body_of(http.calls[0]);
    assert(b[0]["a"] == "pfa" && b[0]["n"] == "h1" && b[0]["fa"] == "0*abc");
  }

  // attribute target
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){
      r = fakes::ok(R"([{"p":"https://fa.example/x9"}])");
      return 0;
    };
    net::ApiClient api(http, "https://g.api.example/", "s", quick(0));
    std::string url;
    assert(api.request_attr_target(1008, url) == 0);
    assert(url == "https://fa.example/x9");
    json b = body_of(http.calls[0]);
    assert(b[0]["a"] == "ufa" && b[0]["s"] == 1008);

    // commands without a name never leave the client
    json res;
    assert(api.call(json::array({1, 2}), res) == vaultup::E_ARGS);
    assert(api.call(json{{"s", 1}}, res) == vaultup::E_ARGS);
    assert(http.count() == 1);
  }

  // EAGAIN is retried, then succeeds
  {
    fakes::FakeHttp http;
    int n = 0;
    http.handler = [&](const fakes::FakeHttp::Call&, net::HttpResponse& r){
      r = fakes::ok(++n < 3 ? "-3" : R"([{"f":[{"h":"NEWH1234","t":0}]}])");
      return 0;
    };
    net::ApiClient api(http, "https://g.api.example/", "s", quick(4));
    std::string handle;
    assert(api.create_node("PARENT01", json{{"h", "tok"}, {"t", 0}}, handle) == 0);
    assert(handle == "NEWH1234");
    assert(http.count() == 3);
    assert(api.last_service_code() == 0);

    json b = body_of(http.calls[2]);
    assert(b[0]["a"] == "p" && b[0]["t"] == "PARENT01");
    assert(b[0]["n"].is_array() && b[0]["n"][0]["h"] == "tok");
  }

  // ENOENT is final
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){ r = fakes::ok("-9"); return 0; };
    net::ApiClient api(http, "https://g.api.example/", "s", quick(4));
    std::string url;
    assert(api.request_upload_target(10, url) == vaultup::E_API);
    assert(api.last_service_code() == -9);
    assert(http.count() == 1);
  }

  // per-command error inside the array
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){ r = fakes::ok("[-11]"); return 0; };
    net::ApiClient api(http, "https://g.api.example/", "s", quick(4));
    std::string handle;
    assert(api.create_node("P", json::object(), handle) == vaultup::E_API);
    assert(api.last_service_code() == -11);
  }

  // garbage and wrong shapes
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){ r = fakes::ok("<html>"); return 0; };
    net::ApiClient api(http, "https://g.api.example/", "s", quick(1));
    std::string url;
    assert(api.request_upload_target(10, url) == vaultup::E_API);

    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){ r = fakes::ok(R"([{"q":1}])"); return 0; };
    assert(api.request_upload_target(10, url) == vaultup::E_API);
  }

  // server errors exhaust retries
  {
    fakes::FakeHttp http;
    http.handler = [](const fakes::FakeHttp::Call&, net::HttpResponse& r){ r.status = 500; return 0; };
    net::ApiClient api(http, "https://g.api.example/", "s", quick(2));
    std::string url;
    assert(api.request_upload_target(10, url) == vaultup::E_TRANSIENT);
    assert(http.count() == 3);
  }
}

static void test_config(){
  unsetenv("VAULTUP_GATEWAY");
  unsetenv("VAULTUP_SID");
  unsetenv("VAULTUP_KEY");
  unsetenv("VAULTUP_CONCURRENCY");
  unsetenv("VAULTUP_MAC_TIMEOUT");
  unsetenv("VAULTUP_RETRIES");
  unsetenv("VAULTUP_VERBOSE");

  vaultup::Config d;
  assert(vaultup::load_config_from_env(d) == 0);
  assert(d.gateway == "https://g.api.mega.co.nz/");
  assert(d.concurrency == 20 && !d.have_key && d.retries == 6);

  setenv("VAULTUP_KEY", "000102030405060708090a0b0c0d0e0f", 1);
  setenv("VAULTUP_CONCURRENCY", "64", 1);
  setenv("VAULTUP_MAC_TIMEOUT", "5", 1);
  setenv("VAULTUP_VERBOSE", "1", 1);
  vaultup::Config c;
  assert(vaultup::load_config_from_env(c) == 0);
  assert(c.have_key && c.key[0] == 0x00 && c.key[15] == 0x0f);
  assert(c.concurrency == vaultup::MAX_CONCURRENCY);
  assert(c.mac_timeout == std::chrono::seconds(5));
  assert(c.verbose);

  vaultup::wipe_config(c);
  assert(!c.have_key && c.key[15] == 0);

  setenv("VAULTUP_KEY", "0011", 1);
  vaultup::Config e;
  assert(vaultup::load_config_from_env(e) == vaultup::E_ARGS);

  setenv("VAULTUP_KEY", "zz0102030405060708090a0b0c0d0e0f", 1);
  assert(vaultup::load_config_from_env(e) == vaultup::E_ARGS);
  unsetenv("VAULTUP_KEY");

  setenv("VAULTUP_CONCURRENCY", "0", 1);
  assert(vaultup::load_config_from_env(e) == vaultup::E_ARGS);
  setenv("VAULTUP_CONCURRENCY", "abc", 1);
  assert(vaultup::load_config_from_env(e) == vaultup::E_ARGS);
  unsetenv("VAULTUP_CONCURRENCY");
}

int main(){
  test_api();
  test_config();

  assert(vaultup::service_code_transient(-3));
  assert(vaultup::service_code_transient(-18));
  assert(!vaultup::service_code_transient(-9));
  assert(std::string(vaultup::service_strerror(-17)) == "EOVERQUOTA");
  assert(std::string(vaultup::strerror(vaultup::E_MISSING_TOKEN)).size() > 0);
  return 0;
}
