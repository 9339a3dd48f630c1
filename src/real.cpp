#include "internal.hpp"

#include <cmath>
#include <cstdlib>
#include <locale>
#include <sstream>

namespace tivar {

// ------------------------------
// Real helpers
// ------------------------------

static constexpr int kMinExponent = -128;
static constexpr int kMaxExponent = 127;
// Range the calculator itself produces and displays.
static constexpr int kMaxCalcExponent = 99;

Real Real::from_digits(bool negative, int exponent, const std::string& digits) {
    if (digits.size() > kMantissaDigits) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "mantissa has " + std::to_string(digits.size()) + " digits, at most 14 fit");
    }
    if (exponent < kMinExponent || exponent > kMaxExponent) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "exponent " + std::to_string(exponent) + " does not fit the exponent byte");
    }
    Real r;
    r.negative = negative;
    r.exponent = exponent;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        char c = digits[i];
        if (c < '0' || c > '9') {
            throw TiVarError(ErrorKind::MalformedDigit,
                             std::string("invalid mantissa digit '") + c + "'");
        }
        r.mantissa[i] = static_cast<std::uint8_t>(c - '0');
    }
    return r;
}

Real Real::from_double(double v) {
    if (!std::isfinite(v)) {
        throw TiVarError(ErrorKind::FieldOverflow, "non-finite value has no calculator representation");
    }
    Real r;
    if (v == 0.0) return r;

    // 14 significant digits: d.ddddddddddddde+XX
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::scientific;
    oss.precision(kMantissaDigits - 1);
    oss << std::fabs(v);
    const std::string s = oss.str();

    auto epos = s.find('e');
    if (epos == std::string::npos || epos < 2) {
        throw TiVarError(ErrorKind::MalformedDigit, "unexpected scientific form: " + s);
    }
    int exponent = std::atoi(s.c_str() + epos + 1);
    if (exponent < -kMaxCalcExponent || exponent > kMaxCalcExponent) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "exponent " + std::to_string(exponent) + " is outside the calculator range");
    }

    std::string digits;
    for (std::size_t i = 0; i < epos; ++i) {
        if (s[i] != '.') digits.push_back(s[i]);
    }
    return from_digits(v < 0.0, exponent, digits);
}

double Real::to_double() const {
    double m = 0.0;
    for (auto d : mantissa) m = m * 10.0 + static_cast<double>(d);
    int k = exponent - static_cast<int>(kMantissaDigits - 1);
    // Dividing by an exact power of ten keeps results like 3.14 correctly rounded.
    double out = k >= 0 ? m * std::pow(10.0, k) : m / std::pow(10.0, -k);
    return negative ? -out : out;
}

std::string Real::digits() const {
    std::string out;
    out.reserve(kMantissaDigits);
    for (auto d : mantissa) out.push_back(static_cast<char>('0' + d));
    return out;
}

bool Real::is_zero() const noexcept {
    for (auto d : mantissa) {
        if (d != 0) return false;
    }
    return true;
}

bool Real::operator==(const Real& o) const noexcept {
    return negative == o.negative && exponent == o.exponent &&
           mantissa == o.mantissa && flags == o.flags;
}

// ------------------------------
// Real record codec
// ------------------------------

namespace internal {

// [sign|flags:1][exponent+0x80:1][14 BCD digits:7]
Real decode_real(const std::uint8_t* p, std::size_t offset) {
    Real r;
    r.negative = (p[0] & 0x80u) != 0;
    r.flags = static_cast<std::uint8_t>(p[0] & 0x7Fu);
    r.exponent = static_cast<int>(p[1]) - 0x80;
    for (std::size_t i = 0; i < kMantissaDigits / 2; ++i) {
        std::uint8_t b = p[2 + i];
        std::uint8_t hi = static_cast<std::uint8_t>(b >> 4);
        std::uint8_t lo = static_cast<std::uint8_t>(b & 0x0Fu);
        if (hi > 9 || lo > 9) {
            std::ostringstream oss;
            oss << "mantissa byte " << hex2(b) << " at offset " << (offset + 2 + i)
                << " is not packed decimal";
            throw TiVarError(ErrorKind::MalformedDigit, oss.str());
        }
        r.mantissa[2 * i] = hi;
        r.mantissa[2 * i + 1] = lo;
    }
    return r;
}

void append_real(std::vector<std::uint8_t>& out, const Real& r) {
    if (r.exponent < kMinExponent || r.exponent > kMaxExponent) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "exponent " + std::to_string(r.exponent) + " does not fit the exponent byte");
    }
    if (r.flags & 0x80u) {
        throw TiVarError(ErrorKind::FieldOverflow, "real flags overlap the sign bit");
    }
    out.push_back(static_cast<std::uint8_t>(r.flags | (r.negative ? 0x80u : 0x00u)));
    out.push_back(static_cast<std::uint8_t>(r.exponent + 0x80));
    for (std::size_t i = 0; i < kMantissaDigits; i += 2) {
        std::uint8_t hi = r.mantissa[i];
        std::uint8_t lo = r.mantissa[i + 1];
        if (hi > 9 || lo > 9) {
            throw TiVarError(ErrorKind::FieldOverflow,
                             "mantissa digit out of range at position " + std::to_string(hi > 9 ? i : i + 1));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
}

} // namespace internal
} // namespace tivar
