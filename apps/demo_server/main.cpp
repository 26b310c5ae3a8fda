#include <httplib.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <thread>

using namespace httplib;

// Local target for end-to-end runs of residue.
//   residue_demo_server [--port N] [--soft404]
// Every route honours ?lat=MS&jitter=MS&err=P for latency and error injection.

static double param_double(const Request& req, const char* key) {
  auto it = req.params.find(key);
  if (it == req.params.end()) return 0.0;
  char* end = nullptr;
  double v = std::strtod(it->second.c_str(), &end);
  return (end && *end == '\0') ? v : 0.0;
}

static bool maybe_delay_and_error(const Request& req, Response& res) {
  double lat_ms = param_double(req, "lat");
  double jit_ms = param_double(req, "jitter");
  double err    = param_double(req, "err");

  std::mt19937 gen((unsigned)std::random_device{}());
  if (lat_ms > 0 || jit_ms > 0) {
    std::normal_distribution<> nd(lat_ms, jit_ms);
    double wait = std::max(0.0, nd(gen));
    std::this_thread::sleep_for(std::chrono::milliseconds((int)wait));
  }
  if (err > 0.0) {
    std::uniform_real_distribution<> ud(0.0, 1.0);
    if (ud(gen) <= err) {
      res.status = 500;
      res.set_content("error injection", "text/plain");
      return true;
    }
  }
  return false;
}

static void planted(Server& svr, const std::string& path, const std::string& body, const char* type) {
  svr.Get(path, [body, type](const Request& req, Response& res) {
    if (maybe_delay_and_error(req, res)) return;
    res.status = 200;
    res.set_content(body, type);
  });
}

int main(int argc, char** argv) {
  int port = 8080;
  bool soft404 = false;
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--soft404") {
      soft404 = true;
    } else if (a == "--port" && i + 1 < argc) {
      port = std::atoi(argv[++i]);
    } else {
      std::fprintf(stderr, "Usage: residue_demo_server [--port N] [--soft404]\n");
      return 2;
    }
  }

  Server svr;

  svr.Get("/healthz", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/", [](const Request& req, Response& res) {
    if (maybe_delay_and_error(req, res)) return;
    res.status = 200;
    res.set_content("<!doctype html><html><body><h1>Residue Demo</h1>"
                    "<p><a href=\"/app/login.php\">login</a></p></body></html>", "text/html");
  });

  svr.Get("/app/login.php", [](const Request& req, Response& res) {
    if (maybe_delay_and_error(req, res)) return;
    res.status = 200;
    res.set_content("<!doctype html><html><body><form method=\"POST\">"
                    "<input name=\"user\"><input name=\"pass\" type=\"password\">"
                    "</form></body></html>", "text/html");
  });

  // Planted leftovers
  planted(svr, "/.env",
          "APP_ENV=production\nDB_HOST=10.0.0.5\nDB_USER=app\nDB_PASSWORD=hunter2\n",
          "text/plain");
  planted(svr, "/.git/config",
          "[core]\n\trepositoryformatversion = 0\n\tbare = false\n"
          "[remote \"origin\"]\n\turl = git@internal.example:web/site.git\n",
          "text/plain");
  planted(svr, "/index.php.bak",
          "<?php\n$db = new PDO('mysql:host=localhost;dbname=site', 'root', 'toor');\n",
          "application/octet-stream");
  planted(svr, "/app/login.php.bak",
          "<?php\nif ($_POST['pass'] === 'letmein') { session_start(); }\n",
          "application/octet-stream");
  planted(svr, "/backup.zip",
          std::string("PK\x03\x04", 4) + std::string(2048, '\x11'),
          "application/zip");

  // Large dump to exercise the large-file threshold
  svr.Get("/dump.sql", [](const Request& req, Response& res) {
    if (maybe_delay_and_error(req, res)) return;
    res.status = 200;
    res.set_content(std::string(12 * 1024 * 1024, 'x'), "application/sql");
  });

  // Forbidden but present
  svr.Get("/.htpasswd", [](const Request& req, Response& res) {
    if (maybe_delay_and_error(req, res)) return;
    res.status = 403;
    res.set_content("<html><body><h1>Forbidden</h1></body></html>", "text/html");
  });

  // Unknown paths: real 404, or a 200 page whose body varies per request
  svr.set_error_handler([soft404](const Request& req, Response& res) {
    if (res.status != 404) return;
    if (soft404) {
      res.status = 200;
      std::string html = "<!doctype html><html><body><h1>Page not available</h1>"
                         "<p>The page " + req.path + " could not be found.</p></body></html>";
      res.set_content(html, "text/html");
      return;
    }
    res.set_content("<html><body><h1>404 Not Found</h1></body></html>", "text/html");
  });

  std::cout << "Attempting to bind to http://127.0.0.1:" << port << (soft404 ? " (soft 404)" : "") << "\n";
  if (!svr.bind_to_port("127.0.0.1", port)) {
    std::fprintf(stderr, "ERROR: failed to bind 127.0.0.1:%d\n", port);
    return 1;
  }
  std::cout << "Listening for requests...\n";
  svr.listen_after_bind();
  return 0;
}
