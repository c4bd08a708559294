#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "http_client.hpp"

// Remote side of a sync run. Implementations throw TransportError.
class MediaFetcher {
public:
  using StartHandler = std::function<void(std::optional<uint64_t> expected_length)>;
  using DataHandler = std::function<void(const char* data, std::size_t size)>;

  virtual ~MediaFetcher() = default;

  virtual std::string fetch_index(const std::string& url) = 0;
  virtual void fetch_media(const std::string& url,
                           const StartHandler& on_start,
                           const DataHandler& on_data) = 0;
};

// Index via POST, media files via streamed GET.
class HttpMediaFetcher : public MediaFetcher {
public:
  explicit HttpMediaFetcher(std::chrono::seconds timeout, Logger* logger = nullptr);

  std::string fetch_index(const std::string& url) override;
  void fetch_media(const std::string& url,
                   const StartHandler& on_start,
                   const DataHandler& on_data) override;

private:
  HttpClient client_;
};
