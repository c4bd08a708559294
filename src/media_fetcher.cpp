#include "media_fetcher.hpp"

HttpMediaFetcher::HttpMediaFetcher(std::chrono::seconds timeout, Logger* logger)
  : client_(timeout, logger) {}

std::string HttpMediaFetcher::fetch_index(const std::string& url) {
  // Media servers expect POST here, matching the game client.
  return client_.post(url);
}

void HttpMediaFetcher::fetch_media(const std::string& url,
                                   const StartHandler& on_start,
                                   const DataHandler& on_data) {
  HttpResponseHandler handler;
  handler.on_start = on_start;
  handler.on_data = on_data;
  client_.request("GET", url, handler);
}
