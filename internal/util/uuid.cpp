#include "uuid.hpp"

#include <random>

namespace workflow::util {

namespace {

constexpr char        kHexDigits[] = "0123456789abcdef";
constexpr std::size_t kTextLength  = 36;

bool IsDash(std::size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    const uint64_t bits = rng();
    for (std::size_t j = 0; j < 8; ++j) id[i + j] = static_cast<uint8_t>(bits >> (j * 8));
  }

  // version 4, RFC4122 variant
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(kTextLength);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (IsDash(out.size())) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

std::optional<UUID> ParseUUID(std::string_view text) {
  if (text.size() != kTextLength) return std::nullopt;

  UUID        id{};
  std::size_t byte = 0;
  for (std::size_t pos = 0; pos < text.size();) {
    if (IsDash(pos)) {
      if (text[pos] != '-') return std::nullopt;
      ++pos;
      continue;
    }
    const int high = HexValue(text[pos]);
    const int low  = HexValue(text[pos + 1]);
    if (high < 0 || low < 0) return std::nullopt;
    id[byte++] = static_cast<uint8_t>((high << 4) | low);
    pos += 2;
  }
  return id;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace workflow::util
