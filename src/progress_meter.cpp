#include "progress_meter.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
constexpr std::chrono::milliseconds kRedrawInterval{100};
}

std::string format_byte_size(uint64_t bytes) {
  static constexpr const char* suffixes[] = {"B", "K", "M", "G", "T"};
  constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
  double value = static_cast<double>(bytes);
  std::size_t idx = 0;
  while(idx + 1 < suffix_count && value >= 1024.0) {
    value /= 1024.0;
    ++idx;
  }
  if(idx == 0) return std::to_string(bytes) + suffixes[0];

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(value >= 100 ? 0 : 1) << value;
  return oss.str() + suffixes[idx];
}

std::string format_download_meter(uint64_t downloaded,
                                  std::optional<uint64_t> total,
                                  std::size_t width) {
  if(!total || *total == 0) {
    return format_byte_size(downloaded);
  }
  const std::size_t slots = std::max<std::size_t>(1, width);
  const double ratio = std::clamp(static_cast<double>(downloaded) / static_cast<double>(*total), 0.0, 1.0);
  const auto filled = static_cast<std::size_t>(ratio * static_cast<double>(slots));

  std::ostringstream oss;
  oss << '[' << std::string(filled, '#') << std::string(slots - filled, '_') << "] "
      << std::fixed << std::setprecision(1) << std::setw(5) << ratio * 100.0 << "% "
      << format_byte_size(downloaded) << '/' << format_byte_size(*total);
  return oss.str();
}

DownloadMeter::DownloadMeter(std::ostream& out, std::string label, std::size_t width, bool enabled)
  : out_(out), label_(std::move(label)), width_(width), enabled_(enabled) {}

DownloadMeter::~DownloadMeter() {
  finish();
}

void DownloadMeter::start(std::optional<uint64_t> total) {
  total_ = total;
  downloaded_ = 0;
  finished_ = false;
  draw(true);
}

void DownloadMeter::advance(std::size_t bytes) {
  downloaded_ += bytes;
  draw(false);
}

void DownloadMeter::finish() {
  if(finished_) return;
  finished_ = true;
  if(!enabled_ || line_width_ == 0) return;
  draw(true);
  out_ << "\n";
  out_.flush();
}

void DownloadMeter::draw(bool force) {
  if(!enabled_) return;
  auto now = std::chrono::steady_clock::now();
  if(!force && now - last_draw_ < kRedrawInterval) return;
  last_draw_ = now;

  std::string rendered = "\r" + label_ + " " + format_download_meter(downloaded_, total_, width_);
  out_ << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}
