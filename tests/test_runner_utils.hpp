#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "media_fetcher.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace media_sync::test {

inline std::filesystem::path make_scratch_dir(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / ("media_sync_" + name);
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root);
  return root;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::string hash_of(const std::string& content) {
  return hex_from_digest(sha1_bytes(content));
}

template<typename Exception, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch(const Exception&) {
    return true;
  }
  return false;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(Logger& logger) {
    auto handle = logger.add_listener(
      [this](const std::string& channel,
             spdlog::level::level_enum,
             const std::string& message) {
        lines_.emplace_back(channel + ": " + message);
        return false;
      });
    attachments_.push_back({&logger, handle});
  }

  void detach_all() {
    for(auto& attachment : attachments_) {
      attachment.logger->remove_listener(attachment.handle);
    }
    attachments_.clear();
  }

  void clear() { lines_.clear(); }

  const std::vector<std::string>& snapshot() const { return lines_; }

  std::size_t count_prefix(const std::string& prefix) const {
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.rfind(prefix, 0) == 0; }));
  }

  bool contains(const std::string& needle) const {
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    Logger* logger = nullptr;
    LogListenerHandle handle = 0;
  };

  std::vector<std::string> lines_;
  std::vector<Attachment> attachments_;
};

// In-memory remote: serves a fixed index and media bodies keyed by URL.
class ScriptedFetcher : public MediaFetcher {
public:
  std::string index_bytes;
  std::map<std::string, std::string> media;
  bool advertise_length = true;
  std::size_t piece_size = 7;
  std::string fail_url;
  std::string cut_off_url; // delivers one piece of the body, then fails

  std::vector<std::string> index_requests;
  std::vector<std::string> media_requests;

  std::string fetch_index(const std::string& url) override {
    index_requests.push_back(url);
    if(url == fail_url) throw TransportError("scripted failure for " + url);
    return index_bytes;
  }

  void fetch_media(const std::string& url,
                   const StartHandler& on_start,
                   const DataHandler& on_data) override {
    media_requests.push_back(url);
    if(url == fail_url) throw TransportError("scripted failure for " + url);
    auto it = media.find(url);
    if(it == media.end()) throw TransportError("GET " + url + " failed: HTTP 404 Not Found");
    const std::string& body = it->second;
    if(on_start) {
      on_start(advertise_length ? std::optional<uint64_t>(body.size()) : std::nullopt);
    }
    for(std::size_t offset = 0; offset < body.size(); offset += piece_size) {
      auto n = std::min(piece_size, body.size() - offset);
      on_data(body.data() + offset, n);
      if(url == cut_off_url) throw TransportError("connection reset while reading " + url);
    }
  }
};

// Accepts connections one at a time on 127.0.0.1 and answers each with the
// raw bytes returned by the router for its request line.
class LoopbackHttpServer {
public:
  struct Reply {
    std::string raw;
    bool hang = false; // hold the connection open without answering
  };
  using Router = std::function<Reply(const std::string& request_line)>;

  explicit LoopbackHttpServer(Router router)
    : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
      router_(std::move(router)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this](){ serve(); });
  }

  ~LoopbackHttpServer() {
    stopping_ = true;
    // Wake the blocking accept.
    asio::io_context wake_io;
    asio::ip::tcp::socket wake(wake_io);
    std::error_code ec;
    wake.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_), ec);
    if(thread_.joinable()) thread_.join();
  }

  unsigned short port() const { return port_; }

  std::string base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + "/";
  }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  static std::string response(int status,
                              const std::string& reason,
                              const std::string& body,
                              const std::vector<std::string>& headers = {},
                              bool content_length = true) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    for(const auto& header : headers) out += header + "\r\n";
    if(content_length) out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    return out + body;
  }

  static std::string chunked_response(const std::vector<std::string>& pieces) {
    std::string out = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n";
    char size_buf[32];
    for(const auto& piece : pieces) {
      std::snprintf(size_buf, sizeof(size_buf), "%zx\r\n", piece.size());
      out += size_buf + piece + "\r\n";
    }
    return out + "0\r\n\r\n";
  }

private:
  void serve() {
    while(!stopping_) {
      asio::ip::tcp::socket socket(io_);
      std::error_code ec;
      acceptor_.accept(socket, ec);
      if(ec || stopping_) break;

      asio::streambuf buf;
      asio::read_until(socket, buf, "\r\n\r\n", ec);
      if(ec) continue;
      std::istream is(&buf);
      std::string line;
      std::getline(is, line);
      if(!line.empty() && line.back() == '\r') line.pop_back();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(line);
      }

      Reply reply = router_(line);
      if(reply.hang) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while(!stopping_ && std::chrono::steady_clock::now() < deadline) {
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        continue;
      }
      asio::write(socket, asio::buffer(reply.raw), ec);
      socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      socket.close(ec);
    }
  }

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  Router router_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
};

// Shared runner loop: dots for passes, captured logs for failures.
template<typename Context, typename TestCase>
int run_test_cases(const char* suite,
                   const std::vector<TestCase>& tests,
                   Context& ctx,
                   LogCapture& logs,
                   bool suppress_logs) {
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

inline bool verbose_requested(int argc, char** argv) {
  bool verbose = (std::getenv("MEDIA_SYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }
  return verbose;
}

inline bool logs_requested(bool verbose) {
  return (std::getenv("MEDIA_SYNC_TEST_LOGS") != nullptr) || verbose;
}

} // namespace media_sync::test
