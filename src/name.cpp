#include "internal.hpp"

#include <algorithm>

namespace tivar {

using internal::hex2;

// Token prefixes of the system variable names.
static constexpr std::uint8_t kMatrixToken   = 0x5C;
static constexpr std::uint8_t kListToken     = 0x5D;
static constexpr std::uint8_t kEquationToken = 0x5E;
static constexpr std::uint8_t kPictureToken  = 0x60;
static constexpr std::uint8_t kGdbToken      = 0x61;
static constexpr std::uint8_t kStringToken   = 0xAA;

static constexpr std::uint8_t kTheta = 0x5B;
static constexpr std::size_t kMaxUserListChars = 5;

static bool is_name_letter(std::uint8_t b) {
    return (b >= 'A' && b <= 'Z') || b == kTheta;
}

static bool is_name_char(std::uint8_t b) {
    return is_name_letter(b) || (b >= '0' && b <= '9');
}

static bool is_equation_index(std::uint8_t i) {
    return (i >= 0x10 && i <= 0x19)   // Y1..Y9, Y0
        || (i >= 0x20 && i <= 0x2B)   // X1T/Y1T..X6T/Y6T
        || (i >= 0x40 && i <= 0x45)   // r1..r6
        || (i >= 0x80 && i <= 0x82);  // u, v, w
}

[[noreturn]] static void invalid_name(const std::string& why) {
    throw TiVarError(ErrorKind::InvalidName, "invalid variable name: " + why);
}

// Length of the identifier at the start of a padded field. Throws InvalidName.
static std::size_t identifier_length(const std::uint8_t* f) {
    const std::uint8_t b0 = f[0];
    switch (b0) {
        case 0x00:
            invalid_name("empty name");
        case kMatrixToken:
        case kPictureToken:
        case kGdbToken:
        case kStringToken:
            if (f[1] > 9) invalid_name("index " + hex2(f[1]) + " after token " + hex2(b0));
            return 2;
        case kEquationToken:
            if (!is_equation_index(f[1])) invalid_name("equation index " + hex2(f[1]));
            return 2;
        case kListToken: {
            if (f[1] <= 5) return 2;
            std::size_t n = 0;
            while (n < kMaxUserListChars && f[1 + n] != 0) {
                std::uint8_t b = f[1 + n];
                if (n == 0 ? !is_name_letter(b) : !is_name_char(b)) {
                    invalid_name("byte " + hex2(b) + " in list name");
                }
                ++n;
            }
            return 1 + n;
        }
        case '!':
        case '#':
            return 1;
        default:
            break;
    }

    if (!is_name_letter(b0)) invalid_name("leading byte " + hex2(b0));
    std::size_t n = 1;
    while (n < kNameSize && f[n] != 0) {
        if (!is_name_char(f[n])) invalid_name("byte " + hex2(f[n]) + " at position " + std::to_string(n));
        ++n;
    }
    return n;
}

VarName decode_name(const std::uint8_t* field) {
    std::size_t n = identifier_length(field);
    for (std::size_t i = n; i < kNameSize; ++i) {
        if (field[i] != 0) {
            invalid_name("non-zero padding byte " + hex2(field[i]) + " at position " + std::to_string(i));
        }
    }
    return VarName::from_bytes(std::vector<std::uint8_t>(field, field + n));
}

std::array<std::uint8_t, kNameSize> encode_name(const VarName& name) {
    const auto& b = name.bytes();
    if (b.size() > kNameSize) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "name of " + std::to_string(b.size()) + " bytes exceeds the 8-byte field");
    }
    if (b.empty()) invalid_name("empty name");
    std::array<std::uint8_t, kNameSize> field{};
    std::copy(b.begin(), b.end(), field.begin());
    return field;
}

// ------------------------------
// VarName
// ------------------------------

VarName VarName::from_bytes(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() > kNameSize) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "name of " + std::to_string(bytes.size()) + " bytes exceeds the 8-byte field");
    }
    if (bytes.empty()) invalid_name("empty name");
    std::array<std::uint8_t, kNameSize> field{};
    std::copy(bytes.begin(), bytes.end(), field.begin());
    if (identifier_length(field.data()) != bytes.size()) {
        invalid_name("bytes past the identifier");
    }
    return VarName(bytes);
}

// Maps UTF-8 text to name bytes; only letters, digits and θ have a byte.
static std::vector<std::uint8_t> name_bytes_from_text(const std::string& text) {
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0xCE && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xB8) {
            out.push_back(kTheta);
            ++i;
            continue;
        }
        if (!is_name_char(c) || c == kTheta) invalid_name("character '" + std::string(1, text[i]) + "'");
        out.push_back(c);
    }
    return out;
}

VarName VarName::from_text(const std::string& text) {
    if (text == "!" || text == "#") {
        return from_bytes({static_cast<std::uint8_t>(text[0])});
    }
    return from_bytes(name_bytes_from_text(text));
}

VarName VarName::list(std::uint8_t index) {
    if (index > 5) invalid_name("list index " + std::to_string(index) + " (L1..L6 are 0..5)");
    return from_bytes({kListToken, index});
}

VarName VarName::matrix(std::uint8_t index) {
    if (index > 9) invalid_name("matrix index " + std::to_string(index));
    return from_bytes({kMatrixToken, index});
}

VarName VarName::string(std::uint8_t index) {
    if (index > 9) invalid_name("string index " + std::to_string(index));
    return from_bytes({kStringToken, index});
}

VarName VarName::user_list(const std::string& text) {
    std::vector<std::uint8_t> chars = name_bytes_from_text(text);
    if (chars.empty() || chars.size() > kMaxUserListChars) {
        invalid_name("list name '" + text + "' must have 1 to 5 characters");
    }
    std::vector<std::uint8_t> b;
    b.push_back(kListToken);
    b.insert(b.end(), chars.begin(), chars.end());
    return from_bytes(b);
}

static std::string digit_1_to_0(std::uint8_t index) {
    return std::to_string((index + 1) % 10);
}

static void append_plain(std::string& out, const std::uint8_t* p, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        if (p[i] == kTheta) out += "\xCE\xB8";
        else out.push_back(static_cast<char>(p[i]));
    }
}

std::string VarName::to_string() const {
    if (bytes_.empty()) return {};
    const std::uint8_t b0 = bytes_[0];
    const std::uint8_t i = bytes_.size() > 1 ? bytes_[1] : 0;
    std::string out;

    switch (b0) {
        case kMatrixToken:
            out = "[";
            out.push_back(static_cast<char>('A' + i));
            out += "]";
            return out;
        case kListToken:
            if (bytes_.size() == 2 && i <= 5) return "L" + std::to_string(i + 1);
            out = "\xCA\x9F"; // small capital L
            append_plain(out, bytes_.data() + 1, bytes_.size() - 1);
            return out;
        case kEquationToken:
            if (i >= 0x10 && i <= 0x19) return "Y" + digit_1_to_0(static_cast<std::uint8_t>(i - 0x10));
            if (i >= 0x20 && i <= 0x2B) {
                return std::string((i - 0x20) % 2 == 0 ? "X" : "Y") + std::to_string((i - 0x20) / 2 + 1) + "T";
            }
            if (i >= 0x40 && i <= 0x45) return "r" + std::to_string(i - 0x40 + 1);
            return std::string(1, static_cast<char>('u' + (i - 0x80)));
        case kPictureToken:
            return "Pic" + digit_1_to_0(i);
        case kGdbToken:
            return "GDB" + digit_1_to_0(i);
        case kStringToken:
            return "Str" + digit_1_to_0(i);
        default:
            append_plain(out, bytes_.data(), bytes_.size());
            return out;
    }
}

} // namespace tivar
