/**
 * @file security.h
 * @brief libsodium primitives used by ClipSync
 *
 * ClipSync does not encrypt traffic. libsodium provides:
 * - BLAKE2b content hashing for clipboard change detection
 * - A CSPRNG for device and message identifiers
 */

#ifndef CLIPSYNC_SECURITY_H
#define CLIPSYNC_SECURITY_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <array>

namespace clipsync {

// ============================================================================
// Constants
// ============================================================================

/// Size of BLAKE2b hash (default)
constexpr size_t HASH_SIZE = 32;

/// BLAKE2b hash
using Hash = std::array<Byte, HASH_SIZE>;

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize libsodium
 *
 * Safe to call more than once. Every other function here initializes
 * lazily, so calling this up front only surfaces a failure early.
 */
CLIPSYNC_API Result<void> security_init();

/// Check if libsodium was initialized
CLIPSYNC_API bool is_security_initialized();

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief Compute BLAKE2b hash
 * @param data Data to hash
 * @param length Number of bytes
 * @return Hash or error
 */
CLIPSYNC_API Result<Hash> hash(const Byte *data, size_t length);

/// Compute BLAKE2b hash of a byte vector
CLIPSYNC_API Result<Hash> hash(const Bytes &data);

/**
 * @brief Hash clipboard content for change detection
 *
 * The content kind is folded into the hash so that text and an image with
 * the same bytes never collide. Image dimensions are included.
 */
CLIPSYNC_API Result<Hash> hash_content(const ClipboardContent &content);

/// Lower-case hex rendering of a hash (for logging)
CLIPSYNC_API std::string hash_to_hex(const Hash &h);

// ============================================================================
// Random Number Generation
// ============================================================================

/// Fill a buffer with random bytes
CLIPSYNC_API void random_fill(Byte *out, size_t count);

/// Generate random bytes
CLIPSYNC_API Bytes random_bytes(size_t count);

/// Generate random 32-bit integer
CLIPSYNC_API uint32_t random_uint32();

} // namespace clipsync

#endif // CLIPSYNC_SECURITY_H
