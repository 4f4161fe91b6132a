/**
 * @file security.cpp
 * @brief libsodium wrapper implementation for ClipSync
 */

#include "clipsync/security.h"
#include "clipsync/log.h"
#include <atomic>
#include <iomanip>
#include <sodium.h>
#include <sstream>

namespace clipsync {

namespace {
std::atomic<bool> g_initialized{false};

constexpr Byte HASH_TAG_TEXT = 0x01;
constexpr Byte HASH_TAG_IMAGE = 0x02;
} // namespace

// ============================================================================
// Initialization
// ============================================================================

Result<void> security_init() {
  if (g_initialized.load()) {
    return Result<void>::ok();
  }

  // sodium_init() returns 1 when already initialized, which is fine
  if (sodium_init() < 0) {
    return Error(ErrorCode::SecurityError, "Failed to initialize libsodium");
  }

  g_initialized.store(true);
  return Result<void>::ok();
}

bool is_security_initialized() { return g_initialized.load(); }

// Auto-initialize on first crypto operation
static inline Result<void> ensure_initialized() {
  if (!g_initialized.load()) {
    auto result = security_init();
    if (result.is_error()) {
      return result;
    }
  }
  return Result<void>::ok();
}

// ============================================================================
// Hashing
// ============================================================================

Result<Hash> hash(const Byte *data, size_t length) {
  CLIPSYNC_TRY(ensure_initialized());

  Hash result;
  if (crypto_generichash(result.data(), HASH_SIZE, data, length, nullptr, 0) !=
      0) {
    return Error(ErrorCode::SecurityError, "Hashing failed");
  }

  return result;
}

Result<Hash> hash(const Bytes &data) { return hash(data.data(), data.size()); }

Result<Hash> hash_content(const ClipboardContent &content) {
  CLIPSYNC_TRY(ensure_initialized());

  crypto_generichash_state state;
  if (crypto_generichash_init(&state, nullptr, 0, HASH_SIZE) != 0) {
    return Error(ErrorCode::SecurityError, "Hash init failed");
  }

  bool ok = std::visit(
      Overloaded{
          [&state](const TextContent &text) {
            return crypto_generichash_update(&state, &HASH_TAG_TEXT, 1) == 0 &&
                   crypto_generichash_update(
                       &state, reinterpret_cast<const Byte *>(text.text.data()),
                       text.text.size()) == 0;
          },
          [&state](const ImageContent &image) {
            Byte dims[8];
            for (int i = 0; i < 4; ++i) {
              dims[i] = static_cast<Byte>((image.width >> (i * 8)) & 0xFF);
              dims[4 + i] = static_cast<Byte>((image.height >> (i * 8)) & 0xFF);
            }
            return crypto_generichash_update(&state, &HASH_TAG_IMAGE, 1) == 0 &&
                   crypto_generichash_update(&state, dims, sizeof(dims)) == 0 &&
                   crypto_generichash_update(&state, image.bytes.data(),
                                             image.bytes.size()) == 0;
          },
      },
      content);

  if (!ok) {
    return Error(ErrorCode::SecurityError, "Hash update failed");
  }

  Hash result;
  if (crypto_generichash_final(&state, result.data(), HASH_SIZE) != 0) {
    return Error(ErrorCode::SecurityError, "Hash final failed");
  }

  return result;
}

std::string hash_to_hex(const Hash &h) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (Byte b : h) {
    oss << std::setw(2) << static_cast<int>(b);
  }
  return oss.str();
}

// ============================================================================
// Random Number Generation
// ============================================================================

// randombytes_* stay usable without sodium_init(), so a failure here is
// reported but does not stop identifier generation
static void ensure_random_ready() {
  auto result = ensure_initialized();
  if (result.is_error()) {
    CLIPSYNC_LOG_WARN("security", result.error().to_string());
  }
}

void random_fill(Byte *out, size_t count) {
  ensure_random_ready();
  randombytes_buf(out, count);
}

Bytes random_bytes(size_t count) {
  Bytes result(count);
  random_fill(result.data(), count);
  return result;
}

uint32_t random_uint32() {
  ensure_random_ready();
  return randombytes_random();
}

} // namespace clipsync
