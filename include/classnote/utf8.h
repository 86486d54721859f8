#pragma once

#include <cstddef>
#include <string>

namespace classnote {

// Text lengths are counted in code points so that thresholds behave the same
// for Latin and CJK transcripts. Invalid sequences count one unit per byte.

size_t utf8_length(const std::string & s);

// byte offset of the n-th code point (s.size() if n is past the end)
size_t utf8_offset(const std::string & s, size_t n);

// code points [first, first + count)
std::string utf8_substr(const std::string & s, size_t first, size_t count = std::string::npos);

std::string trim(const std::string & s);

} // namespace classnote
