#include "http_client.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <unordered_map>

#include "errors.hpp"
#include "log.hpp"

namespace {

constexpr int kMaxRedirects = 5;
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kMaxChunkLine = 4096;
constexpr std::size_t kReadBufferSize = 16 * 1024;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string default_port(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

struct ResponseHead {
    int status = 0;
    std::string reason;
    std::unordered_map<std::string, std::string> headers; // lower-cased names
};

ResponseHead parse_response_head(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::getline(in, line);
    if(!line.empty() && line.back() == '\r') line.pop_back();

    if(line.rfind("HTTP/", 0) != 0) {
        throw TransportError("malformed HTTP status line: " + line);
    }
    auto sp = line.find(' ');
    if(sp == std::string::npos || line.size() < sp + 4) {
        throw TransportError("malformed HTTP status line: " + line);
    }
    ResponseHead head;
    const std::string code = line.substr(sp + 1, 3);
    if(!std::all_of(code.begin(), code.end(), [](unsigned char c){ return std::isdigit(c); })) {
        throw TransportError("malformed HTTP status code: " + line);
    }
    head.status = std::stoi(code);
    head.reason = trim_copy(line.substr(sp + 4));

    while(std::getline(in, line)) {
        if(!line.empty() && line.back() == '\r') line.pop_back();
        if(line.empty()) break;
        auto colon = line.find(':');
        if(colon == std::string::npos) continue;
        auto name = to_lower(trim_copy(line.substr(0, colon)));
        auto value = trim_copy(line.substr(colon + 1));
        auto existing = head.headers.find(name);
        if(existing != head.headers.end()) {
            existing->second += ", " + value;
        } else {
            head.headers.emplace(std::move(name), std::move(value));
        }
    }
    return head;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool is_end_of_stream(const std::error_code& ec) {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

} // namespace

// ---- HttpUrl ---------------------------------------------------------------

HttpUrl HttpUrl::parse(const std::string& url) {
    auto scheme_end = url.find("://");
    if(scheme_end == std::string::npos) {
        throw TransportError("unsupported URL (no scheme): " + url);
    }
    HttpUrl out;
    out.scheme = to_lower(url.substr(0, scheme_end));
    if(out.scheme != "http" && out.scheme != "https") {
        throw TransportError("unsupported URL scheme '" + out.scheme + "': " + url);
    }

    std::string rest = url.substr(scheme_end + 3);
    auto slash = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    auto fragment = out.target.find('#');
    if(fragment != std::string::npos) out.target.erase(fragment);
    if(out.target.empty() || out.target.front() != '/') out.target.insert(0, "/");

    auto at = authority.rfind('@');
    if(at != std::string::npos) authority.erase(0, at + 1);

    if(!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if(close == std::string::npos) throw TransportError("malformed IPv6 host in URL: " + url);
        out.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if(!after.empty() && after.front() == ':') out.port = after.substr(1);
    } else {
        auto colon = authority.rfind(':');
        if(colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            out.port = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }
    if(out.host.empty()) throw TransportError("URL has no host: " + url);
    if(out.port.empty()) out.port = default_port(out.scheme);
    if(!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c){ return std::isdigit(c); })) {
        throw TransportError("invalid port in URL: " + url);
    }
    return out;
}

std::string HttpUrl::host_header() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if(port == default_port(scheme)) return host_part;
    return host_part + ":" + port;
}

std::string HttpUrl::to_string() const {
    return scheme + "://" + host_header() + target;
}

std::string HttpUrl::resolve(const std::string& location) const {
    auto lowered = to_lower(location.substr(0, 8));
    if(lowered.rfind("http://", 0) == 0 || lowered.rfind("https://", 0) == 0) return location;
    if(location.rfind("//", 0) == 0) return scheme + ":" + location;
    if(!location.empty() && location.front() == '/') {
        return scheme + "://" + host_header() + location;
    }
    std::string base = target.substr(0, target.find('?'));
    base = base.substr(0, base.rfind('/') + 1);
    return scheme + "://" + host_header() + base + location;
}

// ---- ChunkedBodyDecoder ----------------------------------------------------

ChunkedBodyDecoder::ChunkedBodyDecoder(DataSink sink) : sink_(std::move(sink)) {}

bool ChunkedBodyDecoder::take_line(const char*& data, std::size_t& size, std::string& line) {
    while(size > 0) {
        char c = *data++;
        --size;
        if(c == '\n') {
            if(!line_.empty() && line_.back() == '\r') line_.pop_back();
            line.swap(line_);
            line_.clear();
            return true;
        }
        line_.push_back(c);
        if(line_.size() > kMaxChunkLine) {
            throw TransportError("chunked encoding line too long");
        }
    }
    return false;
}

void ChunkedBodyDecoder::begin_chunk(const std::string& line) {
    std::string size_text = trim_copy(line.substr(0, line.find(';')));
    if(size_text.empty() ||
       !std::all_of(size_text.begin(), size_text.end(), [](unsigned char c){ return std::isxdigit(c); }) ||
       size_text.size() > 15) {
        throw TransportError("malformed chunk size: " + line);
    }
    remaining_ = std::stoull(size_text, nullptr, 16);
    state_ = remaining_ == 0 ? State::Trailer : State::Data;
}

bool ChunkedBodyDecoder::feed(const char* data, std::size_t size) {
    std::string line;
    while(size > 0 && state_ != State::Done) {
        switch(state_) {
        case State::SizeLine:
            if(take_line(data, size, line)) begin_chunk(line);
            break;
        case State::Data: {
            auto n = static_cast<std::size_t>(std::min<uint64_t>(remaining_, size));
            if(sink_) sink_(data, n);
            data += n;
            size -= n;
            remaining_ -= n;
            if(remaining_ == 0) state_ = State::DataEnd;
            break;
        }
        case State::DataEnd:
            if(take_line(data, size, line)) {
                if(!line.empty()) throw TransportError("missing CRLF after chunk data");
                state_ = State::SizeLine;
            }
            break;
        case State::Trailer:
            if(take_line(data, size, line) && line.empty()) state_ = State::Done;
            break;
        case State::Done:
            break;
        }
    }
    return done();
}

// ---- HttpClient ------------------------------------------------------------

HttpClient::HttpClient(std::chrono::seconds timeout, Logger* logger)
    : timeout_(timeout.count() > 0 ? timeout : std::chrono::seconds(60)), logger_(logger) {}

HttpClient::~HttpClient() = default;

asio::ssl::context& HttpClient::tls_context() {
    if(!tls_context_) {
        tls_context_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
        tls_context_->set_default_verify_paths();
        tls_context_->set_verify_mode(asio::ssl::verify_peer);
    }
    return *tls_context_;
}

template<typename Cancel>
void HttpClient::run_step(const char* step, const HttpUrl& url, Cancel cancel) {
    io_.restart();
    io_.run_for(timeout_);
    if(!io_.stopped()) {
        cancel();
        io_.run();
        throw TransportError(fmt::format("timed out {} {} after {}s", step, url.host, timeout_.count()));
    }
}

template<typename Socket, typename Cancel>
void HttpClient::connect(Socket& socket, const tcp::resolver::results_type& endpoints,
                         const HttpUrl& url, Cancel cancel) {
    std::error_code ec;
    asio::async_connect(socket, endpoints,
        [&](std::error_code e, const tcp::endpoint&){ ec = e; });
    run_step("connecting to", url, cancel);
    if(ec) {
        throw TransportError("cannot connect to " + url.host + ":" + url.port + ": " + ec.message());
    }
}

template<typename Stream, typename Cancel>
HttpClient::Outcome HttpClient::exchange(Stream& stream, Cancel cancel, const std::string& method,
                                         const HttpUrl& url, const HttpResponseHandler& handler) {
    std::string request = method + " " + url.target + " HTTP/1.1\r\n"
                          "Host: " + url.host_header() + "\r\n"
                          "User-Agent: media_sync\r\n"
                          "Accept: */*\r\n"
                          "Accept-Encoding: identity\r\n"
                          "Connection: close\r\n";
    if(method == "POST") request += "Content-Length: 0\r\n";
    request += "\r\n";

    std::error_code ec;
    asio::async_write(stream, asio::buffer(request),
        [&](std::error_code e, std::size_t){ ec = e; });
    run_step("sending request to", url, cancel);
    if(ec) throw TransportError("cannot send request to " + url.host + ": " + ec.message());

    asio::streambuf head_buf(kMaxHeaderBytes);
    std::size_t head_len = 0;
    asio::async_read_until(stream, head_buf, "\r\n\r\n",
        [&](std::error_code e, std::size_t n){ ec = e; head_len = n; });
    run_step("waiting for response from", url, cancel);
    if(ec) throw TransportError("cannot read response from " + url.host + ": " + ec.message());

    auto head_begin = asio::buffers_begin(head_buf.data());
    std::string head_text(head_begin, head_begin + static_cast<std::ptrdiff_t>(head_len));
    head_buf.consume(head_len);
    ResponseHead head = parse_response_head(head_text);
    log_debug(logger_, "{} {} -> {} {}", method, url.to_string(), head.status, head.reason);

    if(is_redirect(head.status)) {
        auto location = head.headers.find("location");
        if(location != head.headers.end() && !location->second.empty()) {
            return Outcome{head.status, location->second};
        }
    }
    if(head.status < 200 || head.status >= 300) {
        throw TransportError(fmt::format("{} {} failed: HTTP {} {}",
                                         method, url.to_string(), head.status, head.reason));
    }

    bool chunked = false;
    auto te = head.headers.find("transfer-encoding");
    if(te != head.headers.end()) {
        chunked = to_lower(te->second).find("chunked") != std::string::npos;
    }
    std::optional<uint64_t> length;
    auto cl = head.headers.find("content-length");
    if(!chunked && cl != head.headers.end()) {
        const std::string& text = cl->second;
        if(text.empty() || text.size() > 19 ||
           !std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c); })) {
            throw TransportError("invalid Content-Length '" + text + "' from " + url.host);
        }
        length = std::stoull(text);
    }
    if(head.status == 204) length = 0;

    if(handler.on_start) handler.on_start(length);

    uint64_t delivered = 0;
    auto sink = [&](const char* data, std::size_t size){
        delivered += size;
        if(size > 0 && handler.on_data) handler.on_data(data, size);
    };
    ChunkedBodyDecoder decoder(sink);
    uint64_t received = 0;
    bool complete = length && *length == 0;

    auto consume = [&](const char* data, std::size_t size){
        if(chunked) {
            complete = decoder.feed(data, size);
        } else if(length) {
            auto n = static_cast<std::size_t>(std::min<uint64_t>(size, *length - received));
            sink(data, n);
            received += n;
            complete = received >= *length;
        } else {
            sink(data, size);
            received += size;
        }
    };

    if(head_buf.size() > 0 && !complete) {
        std::string rest(asio::buffers_begin(head_buf.data()), asio::buffers_end(head_buf.data()));
        head_buf.consume(rest.size());
        consume(rest.data(), rest.size());
    }

    std::array<char, kReadBufferSize> chunk{};
    while(!complete) {
        std::size_t n = 0;
        stream.async_read_some(asio::buffer(chunk),
            [&](std::error_code e, std::size_t len){ ec = e; n = len; });
        run_step("reading body from", url, cancel);
        if(n > 0) consume(chunk.data(), n);
        if(ec) {
            if(is_end_of_stream(ec)) break;
            throw TransportError("error reading body from " + url.host + ": " + ec.message());
        }
    }
    if(!complete && (chunked || length)) {
        throw TransportError("connection closed before the body of " + url.to_string() + " was complete");
    }
    log_debug(logger_, "{} {}: {} body bytes", method, url.to_string(), delivered);
    return Outcome{head.status, std::string()};
}

HttpClient::Outcome HttpClient::perform(const std::string& method, const HttpUrl& url,
                                        const HttpResponseHandler& handler) {
    tcp::resolver resolver(io_);
    tcp::resolver::results_type endpoints;
    std::error_code ec;
    resolver.async_resolve(url.host, url.port,
        [&](std::error_code e, tcp::resolver::results_type results){
            ec = e;
            endpoints = std::move(results);
        });
    run_step("resolving", url, [&]{ resolver.cancel(); });
    if(ec) throw TransportError("cannot resolve " + url.host + ": " + ec.message());

    if(url.scheme == "https") {
        asio::ssl::stream<tcp::socket> stream(io_, tls_context());
        auto cancel = [&]{
            std::error_code ignored;
            stream.lowest_layer().close(ignored);
        };
        connect(stream.lowest_layer(), endpoints, url, cancel);
        if(!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw TransportError("cannot set TLS server name for " + url.host);
        }
        stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        stream.async_handshake(asio::ssl::stream_base::client,
            [&](std::error_code e){ ec = e; });
        run_step("TLS handshake with", url, cancel);
        if(ec) throw TransportError("TLS handshake with " + url.host + " failed: " + ec.message());
        return exchange(stream, cancel, method, url, handler);
    }

    tcp::socket socket(io_);
    auto cancel = [&]{
        std::error_code ignored;
        socket.close(ignored);
    };
    connect(socket, endpoints, url, cancel);
    return exchange(socket, cancel, method, url, handler);
}

void HttpClient::request(const std::string& method,
                         const std::string& url,
                         const HttpResponseHandler& handler) {
    std::string current_url = url;
    std::string current_method = method;
    for(int hop = 0; hop <= kMaxRedirects; ++hop) {
        HttpUrl parsed = HttpUrl::parse(current_url);
        log_debug(logger_, "{} {}", current_method, parsed.to_string());
        Outcome outcome = perform(current_method, parsed, handler);
        if(outcome.location.empty()) return;
        if(outcome.status != 307 && outcome.status != 308) current_method = "GET";
        current_url = parsed.resolve(outcome.location);
        log_debug(logger_, "Redirected ({}) to {}", outcome.status, current_url);
    }
    throw TransportError("too many redirects fetching " + url);
}

std::string HttpClient::post(const std::string& url) {
    std::string body;
    HttpResponseHandler handler;
    handler.on_data = [&](const char* data, std::size_t size){ body.append(data, size); };
    request("POST", url, handler);
    return body;
}

std::string HttpClient::get(const std::string& url) {
    std::string body;
    HttpResponseHandler handler;
    handler.on_data = [&](const char* data, std::size_t size){ body.append(data, size); };
    request("GET", url, handler);
    return body;
}
