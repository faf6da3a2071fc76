#include "common/IdGenerator.hpp"

#include "common/Errors.hpp"

#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace ddns::common {

namespace {
constexpr int kUuidBytes = 16;
}  // namespace

std::string IdGenerator::generate() {
  std::array<unsigned char, kUuidBytes> aBytes{};
  if (RAND_bytes(aBytes.data(), kUuidBytes) != 1) {
    throw InternalError("id_generation_failed", "Failed to generate random bytes for id");
  }

  // Version 4, variant 10xx
  aBytes[6] = static_cast<unsigned char>((aBytes[6] & 0x0F) | 0x40);
  aBytes[8] = static_cast<unsigned char>((aBytes[8] & 0x3F) | 0x80);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (int i = 0; i < kUuidBytes; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(aBytes[static_cast<size_t>(i)]);
  }
  return oss.str();
}

}  // namespace ddns::common
