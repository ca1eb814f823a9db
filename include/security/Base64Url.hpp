#pragma once

#include <string>
#include <vector>

namespace jwks::security::base64url {

/// Unpadded base64url (RFC 4648 §5) of raw bytes.
std::string encode(const std::string& sInput);
std::string encode(const std::vector<unsigned char>& vInput);

/// Decode base64url with or without '=' padding.
/// Throws common::ValidationError on characters outside the alphabet.
std::string decode(const std::string& sInput);
std::vector<unsigned char> decodeBytes(const std::string& sInput);

}  // namespace jwks::security::base64url
