#include "HttpClient.h"
#include "Socket.h"
#include "../core/NetworkRange.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace plug_scan {

static const size_t MAX_RESPONSE_BYTES = 1024 * 1024;

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if(b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string dechunk(const std::string& body){
    std::string out; size_t pos = 0;
    while(pos < body.size()){
        size_t eol = body.find("\r\n", pos);
        if(eol == std::string::npos) throw HttpError("malformed chunked body");
        std::string size_line = body.substr(pos, eol - pos);
        size_t semi = size_line.find(';'); if(semi != std::string::npos) size_line.resize(semi);
        size_t n = 0;
        try { n = std::stoul(trim(size_line), nullptr, 16); } catch(const std::exception&) { throw HttpError("malformed chunk size"); }
        pos = eol + 2;
        if(n == 0) break;
        if(n > body.size() - pos) throw HttpError("truncated chunk");
        out.append(body, pos, n);
        pos += n + 2;
    }
    return out;
}

HttpResponse parse_http_response(const std::string& raw){
    size_t header_end = raw.find("\r\n\r\n");
    size_t sep = 4;
    if(header_end == std::string::npos){ header_end = raw.find("\n\n"); sep = 2; }
    if(header_end == std::string::npos) throw HttpError("incomplete HTTP response");

    std::istringstream hs(raw.substr(0, header_end));
    std::string line;
    if(!std::getline(hs, line)) throw HttpError("empty HTTP response");
    line = trim(line);
    if(line.rfind("HTTP/", 0) != 0) throw HttpError("not an HTTP response");
    HttpResponse resp;
    size_t sp = line.find(' ');
    if(sp == std::string::npos) throw HttpError("malformed status line");
    try { resp.status = std::stoi(line.substr(sp+1, 3)); } catch(const std::exception&) { throw HttpError("malformed status code"); }

    while(std::getline(hs, line)){
        size_t colon = line.find(':');
        if(colon == std::string::npos) continue;
        resp.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon+1));
    }
    resp.body = raw.substr(header_end + sep);
    auto te = resp.headers.find("transfer-encoding");
    if(te != resp.headers.end() && to_lower(te->second).find("chunked") != std::string::npos) resp.body = dechunk(resp.body);
    return resp;
}

HttpResponse http_request(uint32_t addr, uint16_t port, const std::string& method, const std::string& path,
                          const HeaderList& headers, const std::string& body, std::chrono::milliseconds timeout){
    auto deadline = Clock::now() + timeout;
    std::string host = ipv4_to_string(addr);
    SocketGuard sock;
    ConnectResult cr = connect_tcp(addr, port, deadline, sock);
    if(cr != ConnectResult::Connected) throw HttpError("connect " + host + ":" + std::to_string(port) + ": " + connect_result_name(cr));

    std::string req = method + " " + path + " HTTP/1.0\r\n";
    req += "Host: " + host + ":" + std::to_string(port) + "\r\n";
    req += "User-Agent: plug-scan\r\n";
    req += "Connection: close\r\n";
    for(const auto& h : headers) req += h.first + ": " + h.second + "\r\n";
    if(!body.empty() || method == "POST") req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "\r\n";
    req += body;
    if(!send_all(sock.get(), req, deadline)) throw HttpError("send to " + host + " failed or timed out");

    std::string raw;
    if(!recv_all(sock.get(), raw, MAX_RESPONSE_BYTES, deadline)) throw HttpError("no response from " + host + " before timeout");
    return parse_http_response(raw);
}

}
