#pragma once

/**
 * @file Constants.h
 * @brief Protocol constants and configuration defaults for CubeLink
 *
 * Wire-format values are fixed; everything under "Defaults" can be
 * overridden through Config (see P2PSettings).
 */

#include <cstddef>
#include <cstdint>

namespace CubeLink::constants {

// =============================================================================
// Wire format
// =============================================================================

/// Fixed plaintext chunk size; the final chunk of a file may be shorter
constexpr std::size_t CHUNK_SIZE = 1024 * 1024;  // 1 MiB

/// AEAD nonce carried in front of every sealed chunk
constexpr std::size_t CHUNK_NONCE_SIZE = 12;

/// AEAD authentication tag appended to the ciphertext
constexpr std::size_t CHUNK_TAG_SIZE = 16;

/// Symmetric chunk key length
constexpr std::size_t CHUNK_KEY_SIZE = 32;

/// Read buffer for whole-file hashing
constexpr std::size_t HASH_BUFFER_SIZE = 8192;

/// Access codes are exactly this many ASCII digits
constexpr std::size_t ACCESS_CODE_LENGTH = 6;

/// HKDF info label for the pairwise keys that wrap a room's chunk key
constexpr const char* KEY_WRAP_INFO = "CubeLink-Key-Wrap-v1";

constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

// =============================================================================
// Defaults
// =============================================================================

constexpr const char* DEFAULT_SIGNALING_URL = "wss://cube-signaling.fly.dev";

/// Room lifetime (seconds)
constexpr int64_t DEFAULT_ROOM_TTL_SEC = 24 * 60 * 60;

constexpr std::size_t DEFAULT_MAX_PEERS = 2;

/// Attempts at drawing an unused access code before giving up
constexpr int DEFAULT_CODE_MAX_ATTEMPTS = 64;

/// Receive loop fails after this long without an inbound chunk (ms)
constexpr int DEFAULT_IDLE_TIMEOUT_MS = 30000;

/// Send loop fails after being blocked on backpressure this long (ms)
constexpr int DEFAULT_SEND_TIMEOUT_MS = 30000;

constexpr std::size_t DEFAULT_WORKER_THREADS = 4;
constexpr std::size_t DEFAULT_LOG_MAX_SIZE_MB = 50;

/// Granularity at which blocked transport waits re-check cancellation (ms)
constexpr int CANCEL_POLL_INTERVAL_MS = 50;

/// In-memory channel high-water mark (frames queued before send() blocks)
constexpr std::size_t DEFAULT_CHANNEL_CAPACITY = 4;

} // namespace CubeLink::constants
