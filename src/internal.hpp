#pragma once

#include "tivar/tivar.hpp"

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace tivar {
namespace internal {

inline std::uint16_t read_u16_le_from(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (static_cast<std::uint16_t>(p[1]) << 8));
}

inline void append_u16_le(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
}

inline bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) { out = 0; return true; }
    if (a > (std::numeric_limits<std::size_t>::max)() / b) return false;
    out = a * b;
    return true;
}

// Narrow a byte count to a 16-bit length field or fail with FieldOverflow.
inline std::uint16_t to_u16_length(std::size_t n, const char* what) {
    if (n > 0xFFFFu) {
        std::ostringstream oss;
        oss << what << " of " << n << " bytes exceeds the 16-bit length field";
        throw TiVarError(ErrorKind::FieldOverflow, oss.str());
    }
    return static_cast<std::uint16_t>(n);
}

inline std::string hex2(std::uint8_t v) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<unsigned>(v);
    return oss.str();
}

inline std::string hex4(std::uint16_t v) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << v;
    return oss.str();
}

// Matches the leading signature against the supported formats.
bool match_signature(const std::uint8_t* data, std::size_t size, FileFormat& out) noexcept;

// Real record codec, shared by the scalar, list, matrix and complex payloads.
Real decode_real(const std::uint8_t* p, std::size_t offset);
void append_real(std::vector<std::uint8_t>& out, const Real& r);

} // namespace internal
} // namespace tivar
