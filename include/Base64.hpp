#pragma once

#include <string>
#include <vector>

namespace faceAI {

// Decodes standard base64. A "data:...;base64," prefix is stripped and
// whitespace is skipped. Throws std::invalid_argument on malformed input.
std::vector<unsigned char> base64Decode(const std::string& input);

std::string base64Encode(const std::vector<unsigned char>& data);

} // namespace faceAI
