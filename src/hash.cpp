#include "arbiter/hash.hpp"

// BLAKE3 is the only hash primitive. It names things (temp paths, session
// ids, cache keys) and checks artifact cache integrity. Nothing here needs
// secrecy.

#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace arbiter {
namespace {

class Digest {
 public:
  Digest() { blake3_hasher_init(&hasher_); }

  Digest& feed(std::string_view bytes) {
    blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
    return *this;
  }

  std::string hex() {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::array<std::uint8_t, BLAKE3_OUT_LEN> raw{};
    blake3_hasher_finalize(&hasher_, raw.data(), raw.size());
    std::string out(raw.size() * 2, '0');
    for (std::size_t i = 0; i < raw.size(); ++i) {
      out[2 * i] = kDigits[raw[i] >> 4];
      out[2 * i + 1] = kDigits[raw[i] & 0xf];
    }
    return out;
  }

 private:
  blake3_hasher hasher_;
};

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  return HashRuntimeInfo{"blake3", blake3_version()};
}

std::string blake3_hex(std::string_view payload) { return Digest().feed(payload).hex(); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return Digest().feed(domain).feed(payload).hex();
}

}  // namespace arbiter
