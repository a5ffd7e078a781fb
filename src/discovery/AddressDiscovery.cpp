#include "AddressDiscovery.h"
#include <cctype>

namespace plug_scan {

bool parse_manual_ipv4(const std::string& text, uint32_t& out){
    uint32_t value = 0;
    size_t i = 0;
    for(int octet = 0; octet < 4; ++octet){
        if(octet > 0){
            if(i >= text.size() || text[i] != '.') return false;
            ++i;
        }
        size_t start = i;
        while(i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        if(i == start || i - start > 3) return false;
        int v = std::stoi(text.substr(start, i - start)); // decimal even with leading zeros
        if(v > 255) return false;
        value = (value << 8) | static_cast<uint32_t>(v);
    }
    if(i != text.size()) return false;
    out = value;
    return true;
}

std::vector<std::string> split_addresses(const std::string& text){
    std::vector<std::string> out;
    std::string cur;
    for(char c : text){
        if(c == ',' || c == ';' || c == ' ' || c == '\t' || c == '\n' || c == '\r'){
            if(!cur.empty()){ out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<Candidate> AddressDiscovery::discover(const DiscoveryRequest& request, ScanSession*){
    std::vector<Candidate> out;
    for(const auto& a : request.addresses){
        Candidate c;
        c.input = a;
        c.source = name();
        uint32_t addr = 0;
        if(parse_manual_ipv4(a, addr)){
            c.host = ipv4_to_string(addr);
            c.port = port_;
        } else {
            c.error = "Invalid IP address format";
        }
        out.push_back(std::move(c));
    }
    return out;
}

}
