#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(std::string_view data);
std::string sha256_hex(std::string_view data);

// Standard (padded) base64. decode throws std::invalid_argument on bad input.
std::string base64_encode(std::string_view data);
std::string base64_decode(std::string_view encoded);

// "<prefix>-<32 hex chars>"
std::string random_id(const std::string& prefix);

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);

struct HostPort {
  std::string host;
  uint16_t port = 0;
};

// Accepts "host:port"; returns nullopt for a missing or out of range port.
std::optional<HostPort> parse_host_port(const std::string& value);
std::vector<std::string> split_list(const std::string& value, char separator = ',');
std::string trim(std::string_view value);

bool is_valid_utf8(std::string_view data);

// Guess whether a payload can travel as raw JSON text (picks the inline encoding).
bool looks_like_text(std::string_view data, const std::string& mime_type);
