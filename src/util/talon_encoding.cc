#include "talon_encoding.h"
#include <cctype>

namespace talon {

namespace {

int DecodeBase64Char(unsigned char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

bool Base64Decode(const std::string& encoded, std::vector<uint8_t>& out) {
  std::vector<uint8_t> decoded;
  decoded.reserve(encoded.size() * 3 / 4);

  uint32_t buffer = 0;
  int bits = 0;
  int padding = 0;

  for (char ch : encoded) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) continue;

    if (c == '=') {
      ++padding;
      if (padding > 2) return false;
      continue;
    }
    if (padding > 0) return false;  // data after padding

    int value = DecodeBase64Char(c);
    if (value < 0) return false;

    buffer = (buffer << 6) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      decoded.push_back(static_cast<uint8_t>((buffer >> bits) & 0xff));
    }
  }

  // Leftover bits must be the zero fill of the final group
  if (bits >= 6) return false;

  out.swap(decoded);
  return true;
}

bool ParseDataURI(const std::string& uri, std::string& mime_type, std::vector<uint8_t>& out) {
  static const std::string kScheme = "data:";
  if (uri.compare(0, kScheme.size(), kScheme) != 0) {
    return false;
  }

  size_t comma = uri.find(',', kScheme.size());
  if (comma == std::string::npos) {
    return false;
  }

  std::string header = uri.substr(kScheme.size(), comma - kScheme.size());
  std::string payload = uri.substr(comma + 1);

  bool is_base64 = false;
  static const std::string kBase64Suffix = ";base64";
  if (header.size() >= kBase64Suffix.size() &&
      header.compare(header.size() - kBase64Suffix.size(), kBase64Suffix.size(), kBase64Suffix) == 0) {
    is_base64 = true;
    header.erase(header.size() - kBase64Suffix.size());
  }

  size_t semicolon = header.find(';');
  mime_type = semicolon == std::string::npos ? header : header.substr(0, semicolon);

  if (is_base64) {
    return Base64Decode(payload, out);
  }

  std::vector<uint8_t> raw;
  raw.reserve(payload.size());
  for (size_t i = 0; i < payload.size(); i++) {
    if (payload[i] == '%' && i + 2 < payload.size()) {
      int hi = HexValue(payload[i + 1]);
      int lo = HexValue(payload[i + 2]);
      if (hi >= 0 && lo >= 0) {
        raw.push_back(static_cast<uint8_t>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    raw.push_back(static_cast<uint8_t>(payload[i]));
  }
  out.swap(raw);
  return true;
}

}  // namespace talon
