#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace plug_scan {

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers; // lower-cased names
    std::string body;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Parses a raw HTTP/1.x response (status line, headers, body; chunked bodies are de-chunked).
HttpResponse parse_http_response(const std::string& raw);

// One HTTP/1.0 request with "Connection: close"; the whole exchange is bounded by timeout.
// Throws HttpError on connect/send/receive/parse failure.
HttpResponse http_request(uint32_t addr, uint16_t port, const std::string& method, const std::string& path,
                          const HeaderList& headers, const std::string& body, std::chrono::milliseconds timeout);

std::string to_lower(std::string s);
std::string trim(const std::string& s);

}
