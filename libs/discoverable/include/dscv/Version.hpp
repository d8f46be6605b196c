#pragma once
#include <cstdint>

namespace dscv {

constexpr uint16_t DEFAULT_PORT = 1024;

constexpr int ACK_TIMEOUT_MS = 2000;
constexpr int DISCOVERY_TIMEOUT_MS = 5000;
constexpr int RESOLVE_TIMEOUT_MS = 5000;
constexpr int MAX_HANDSHAKE_ATTEMPTS = 5;
constexpr int STRENGTH_WINDOW = 5;
constexpr float DEAD_LINK_THRESHOLD = 5.0f;

} // namespace dscv
