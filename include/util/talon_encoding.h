#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace talon {

// Decode standard (RFC 4648) base64. Whitespace is skipped; any other
// character outside the alphabet, or data after padding, fails the decode.
bool Base64Decode(const std::string& encoded, std::vector<uint8_t>& out);

// Split "data:<mime>[;base64],<payload>" into its mime type and decoded bytes.
// Payloads without ";base64" are taken verbatim (percent-escapes decoded).
bool ParseDataURI(const std::string& uri, std::string& mime_type, std::vector<uint8_t>& out);

}  // namespace talon
