#pragma once
#include <stdexcept>
#include <string>

// Malformed or unroutable wire message. Caught at the connection boundary;
// the connection stays open.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& message)
    : std::runtime_error(message) {}
};

enum class ErrorKind {
  Protocol,
  UnreachableTarget,
  ChannelLost,
  DuplicatePairing,
  ChunkAssemblyTimeout
};

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::UnreachableTarget: return "unreachable-target";
    case ErrorKind::ChannelLost: return "channel-lost";
    case ErrorKind::DuplicatePairing: return "duplicate-pairing";
    case ErrorKind::ChunkAssemblyTimeout: return "chunk-assembly-timeout";
  }
  return "unknown";
}
