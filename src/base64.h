#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tollgate {

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& data);

// Standard alphabet, padded or unpadded. Rejects whitespace and foreign characters.
bool base64_decode(const std::string& in, std::vector<uint8_t>& out);
bool base64_decode(const std::string& in, std::string& out);

}
