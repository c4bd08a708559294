#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

std::string format_byte_size(uint64_t bytes);

// "[####____]  45.0% 1.2M/2.6M" when the total is known, "1.2M" otherwise.
std::string format_download_meter(uint64_t downloaded,
                                  std::optional<uint64_t> total,
                                  std::size_t width);

// Single-line meter redrawn in place with '\r'.
class DownloadMeter {
public:
  DownloadMeter(std::ostream& out, std::string label, std::size_t width, bool enabled);
  ~DownloadMeter();

  void start(std::optional<uint64_t> total);
  void advance(std::size_t bytes);
  void finish();

  uint64_t downloaded() const { return downloaded_; }

private:
  void draw(bool force);

  std::ostream& out_;
  std::string label_;
  std::size_t width_;
  bool enabled_;
  bool finished_ = false;
  std::optional<uint64_t> total_;
  uint64_t downloaded_ = 0;
  std::size_t line_width_ = 0;
  std::chrono::steady_clock::time_point last_draw_{};
};
