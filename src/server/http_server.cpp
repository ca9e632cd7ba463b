#include "ndjson/http_server.hpp"
#include "ndjson/errors.hpp"
#include "ndjson/path_utils.hpp"
#include "ndjson/record_encoder.hpp"
#include <httplib.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace nj {

static HeaderOption header_option_for(Format f) {
  return f == Format::ListWithHeader ? HeaderOption::offset(0) : HeaderOption::none();
}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  bool bound{false};

  explicit Impl(Config c) : cfg(std::move(c)) {}

  std::vector<std::string> files() const {
    std::vector<std::string> out;
    std::error_code ec;
    std::filesystem::path root(cfg.data_root);
    if (!std::filesystem::is_directory(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (d.is_regular_file() && has_ndjson_extension(d.path().string())) {
        out.push_back(d.path().filename().string());
      }
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  std::string index_html() const {
    auto items = files();
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += cfg.index_title + "</title></head><body><h1>" + cfg.index_title + "</h1><ul>";
    for (auto& f : items) {
      html += "<li><a href=\"/download/" + f + "\">" + f + "</a>"
              " (<a href=\"/download/" + f + "?format=list-header\">list-header</a>)</li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Reads a query parameter naming a format; false if it names none.
  static bool format_param(const httplib::Request& req, const char* key, Format* out) {
    if (!req.has_param(key)) return true;
    auto f = format_from_name(req.get_param_value(key));
    if (!f) return false;
    *out = *f;
    return true;
  }

  void download(const httplib::Request& req, httplib::Response& res) const {
    const std::string name = req.matches[1].str();
    std::filesystem::path file;
    if (!has_ndjson_extension(name) || !resolve_under(cfg.data_root, name, &file)) {
      res.status = 404;
      return;
    }

    Format from = Format::Record;
    Format to = Format::Record;
    if (!format_param(req, "from", &from) || !format_param(req, "format", &to)) {
      res.status = 400;
      res.set_content("format must be one of record, list, list-header\n", "text/plain; charset=utf-8");
      return;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    const auto mtime = std::filesystem::last_write_time(file, ec).time_since_epoch().count();
    const std::string etag = "\"" + hex_hash_prefix(name + "|" + std::string(format_name(from)) + "|" +
                                                    std::string(format_name(to)) + "|" +
                                                    std::to_string(size) + "|" + std::to_string(mtime), 16) + "\"";
    if (req.get_header_value("If-None-Match") == etag) {
      res.status = 304;
      return;
    }

    // Resolve everything that can fail before the first byte goes out.
    std::shared_ptr<ChunkStream> chunks;
    HeaderLines headers;
    try {
      headers = attachment_headers(name);
      RecordReaderPtr records = cfg.codec.read(file.string(), from, header_option_for(from));
      chunks = std::make_shared<ChunkStream>(cfg.codec.chunk(std::move(records), to, header_option_for(to)));
    } catch (const Error& e) {
      std::cerr << "[serve] " << name << ": " << e.what() << "\n";
      res.status = 422;
      res.set_content(std::string(e.what()) + "\n", "text/plain; charset=utf-8");
      return;
    }

    res.set_header("ETag", etag);
    std::string content_type = "application/x-ndjson";
    for (auto& h : headers) {
      if (h.first == "content-type") content_type = h.second;
      else res.set_header(h.first, h.second);
    }

    res.set_chunked_content_provider(content_type, [chunks, name](size_t, httplib::DataSink& sink) {
      std::string chunk;
      try {
        if (!chunks->read_next(chunk)) {
          sink.done();
          return true;
        }
      } catch (const RecordError& e) {
        std::cerr << "[serve] " << name << ": offset " << e.offset() << ": " << e.what() << "\n";
        return false;
      } catch (const Error& e) {
        std::cerr << "[serve] " << name << ": " << e.what() << "\n";
        return false;
      }
      return sink.write(chunk.data(), chunk.size());
    });
  }

  void routes() {
    // Index
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get(R"(/download/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
      download(req, res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start(std::string* err_out) {
  if (p_->bound) return true;
  p_->bound = p_->svr.bind_to_port(p_->cfg.host.c_str(), p_->cfg.port);
  if (!p_->bound && err_out) {
    *err_out = "cannot bind " + p_->cfg.host + ":" + std::to_string(p_->cfg.port);
  }
  return p_->bound;
}

int HttpServer::run() {
  std::string err;
  if (!start(&err)) {
    std::cerr << "[serve] " << err << "\n";
    return -1;
  }
  std::cerr << "[serve] listening on " << p_->cfg.host << ":" << p_->cfg.port
            << " (data root " << p_->cfg.data_root << ")\n";
  p_->svr.listen_after_bind();
  return 0;
}

void HttpServer::stop() { p_->svr.stop(); }

bool HttpServer::is_running() const { return p_->svr.is_running(); }

}
