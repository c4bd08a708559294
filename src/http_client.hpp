#pragma once
#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

class Logger;

struct HttpUrl {
    std::string scheme; // "http" or "https"
    std::string host;
    std::string port;
    std::string target; // path and query, always starts with '/'

    static HttpUrl parse(const std::string& url);
    std::string host_header() const;
    std::string to_string() const;
    std::string resolve(const std::string& location) const;
};

// Incremental decoder for Transfer-Encoding: chunked bodies.
class ChunkedBodyDecoder {
public:
    using DataSink = std::function<void(const char* data, std::size_t size)>;

    explicit ChunkedBodyDecoder(DataSink sink);

    // Returns true once the terminating chunk and trailers are consumed.
    bool feed(const char* data, std::size_t size);
    bool done() const { return state_ == State::Done; }

private:
    enum class State { SizeLine, Data, DataEnd, Trailer, Done };

    bool take_line(const char*& data, std::size_t& size, std::string& line);
    void begin_chunk(const std::string& line);

    DataSink sink_;
    State state_ = State::SizeLine;
    std::string line_;
    uint64_t remaining_ = 0;
};

struct HttpResponseHandler {
    std::function<void(std::optional<uint64_t> content_length)> on_start;
    std::function<void(const char* data, std::size_t size)> on_data;
};

// Blocking HTTP/1.1 client; each network step is bounded by the timeout.
class HttpClient {
public:
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(60),
                        Logger* logger = nullptr);
    ~HttpClient();

    // All of these throw TransportError.
    void request(const std::string& method,
                 const std::string& url,
                 const HttpResponseHandler& handler);
    std::string post(const std::string& url);
    std::string get(const std::string& url);

private:
    using tcp = asio::ip::tcp;

    struct Outcome {
        int status = 0;
        std::string location; // set for redirects only
    };

    Outcome perform(const std::string& method, const HttpUrl& url, const HttpResponseHandler& handler);

    template<typename Socket, typename Cancel>
    void connect(Socket& socket, const tcp::resolver::results_type& endpoints,
                 const HttpUrl& url, Cancel cancel);

    template<typename Stream, typename Cancel>
    Outcome exchange(Stream& stream, Cancel cancel, const std::string& method,
                     const HttpUrl& url, const HttpResponseHandler& handler);

    template<typename Cancel>
    void run_step(const char* step, const HttpUrl& url, Cancel cancel);

    asio::ssl::context& tls_context();

    asio::io_context io_;
    std::unique_ptr<asio::ssl::context> tls_context_;
    std::chrono::seconds timeout_;
    Logger* logger_ = nullptr;
};
