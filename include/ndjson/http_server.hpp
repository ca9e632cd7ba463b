#pragma once
#include <string>

#include "ndjson/codec.hpp"

namespace nj {

// Tiny wrapper around cpp-httplib; serves `/` index of the NDJSON files under
// data_root and `/download/<name>?format=record|list|list-header` as a
// chunked attachment re-encoded through `codec`.
class HttpServer {
public:
  struct Config {
    std::string data_root   = "data";
    std::string index_title = "NDJSON downloads";
    std::string host        = "0.0.0.0";
    int port = 8080;
    Codec codec = Codec().with_chunk_size(64);
  };

  explicit HttpServer(Config cfg);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind only; returns false on bind error (reason in err_out).
  bool start(std::string* err_out = nullptr);

  // Blocking run; binds if needed, returns when the server stops.
  int run();

  // Stop if running.
  void stop();

  bool is_running() const;

private:
  struct Impl;
  Impl* p_;
};

}
