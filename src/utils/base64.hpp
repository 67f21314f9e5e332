//===----------------------------------------------------------------------===//
//                         runnerd
//
// utils/base64.hpp
//
// Standard base64 (RFC 4648) with padding
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace runnerd {

std::string Base64Encode(const std::string& bytes);

// Throws std::invalid_argument on malformed input
std::string Base64Decode(const std::string& text);

} // namespace runnerd
