#include <quill/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace quill::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> decode_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = decode_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{"0x"};
  out.resize(2 + (bytes.size() * 2));
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[2 + (2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[2 + (2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

std::string to_hex(const address_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

bool is_zero(const hash32_t& value) {
  return std::ranges::all_of(value, [](const uint8_t b) { return b == 0; });
}

bool is_zero(const address_t& value) {
  return std::ranges::all_of(value, [](const uint8_t b) { return b == 0; });
}

hash32_t to_word(const scope_mask_t& value) {
  auto word = hash32_t{};
  auto bytes = bytes_t{};
  bytes.reserve(word.size());
  boost::multiprecision::export_bits(value, std::back_inserter(bytes), 8);
  // export_bits drops leading zero bytes; right-align into the word.
  std::copy(std::begin(bytes), std::end(bytes),
            std::begin(word) + (word.size() - bytes.size()));
  return word;
}

scope_mask_t from_word(const hash32_t& word) {
  auto value = scope_mask_t{};
  boost::multiprecision::import_bits(value, std::begin(word), std::end(word),
                                     8);
  return value;
}

}  // namespace quill::schema
