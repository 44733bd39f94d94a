#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(std::string_view data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return out;
}

std::string sha256_hex(std::string_view data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string base64_encode(std::string_view data){
    if(data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if(written < 0) throw std::runtime_error("base64 encode failed");
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_decode(std::string_view encoded){
    if(encoded.empty()) return "";
    if(encoded.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    std::string out(3 * (encoded.size() / 4), '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(written < 0) throw std::invalid_argument("invalid base64 input");
    // EVP_DecodeBlock keeps the bytes produced by '=' padding.
    std::size_t padding = 0;
    if(encoded.back() == '=') ++padding;
    if(encoded.size() > 1 && encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string random_id(const std::string& prefix){
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    std::ostringstream oss;
    oss << prefix << "-" << std::nouppercase << std::hex << std::setfill('0')
        << std::setw(16) << hi << std::setw(16) << lo;
    return oss.str();
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp){
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms){
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::optional<HostPort> parse_host_port(const std::string& value){
    auto pos = value.rfind(':');
    if(pos == std::string::npos || pos == 0 || pos + 1 >= value.size()) return std::nullopt;
    HostPort out;
    out.host = value.substr(0, pos);
    try {
        int port = std::stoi(value.substr(pos + 1));
        if(port <= 0 || port > 65535) return std::nullopt;
        out.port = static_cast<uint16_t>(port);
    } catch(const std::exception&) {
        return std::nullopt;
    }
    return out;
}

std::vector<std::string> split_list(const std::string& value, char separator){
    std::vector<std::string> out;
    std::string current;
    std::istringstream iss(value);
    while(std::getline(iss, current, separator)){
        auto begin = current.find_first_not_of(" \t");
        if(begin == std::string::npos) continue;
        auto end = current.find_last_not_of(" \t");
        out.push_back(current.substr(begin, end - begin + 1));
    }
    return out;
}

std::string trim(std::string_view value){
    auto begin = value.find_first_not_of(" \t\r\n");
    if(begin == std::string_view::npos) return std::string();
    auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

bool is_valid_utf8(std::string_view data){
    std::size_t i = 0;
    while(i < data.size()){
        unsigned char c = static_cast<unsigned char>(data[i]);
        std::size_t extra = 0;
        if(c < 0x80) extra = 0;
        else if((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if((c & 0xF0) == 0xE0) extra = 2;
        else if((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;
        if(i + extra >= data.size() && extra > 0) return false;
        for(std::size_t k = 1; k <= extra; ++k){
            if((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

bool looks_like_text(std::string_view data, const std::string& mime_type){
    if(!is_valid_utf8(data)) return false;
    if(mime_type.rfind("text/", 0) == 0) return true;
    if(mime_type == "application/json") return true;
    if(!mime_type.empty()) return false;
    for(unsigned char c : data){
        if(c < 0x09) return false;
    }
    return true;
}
