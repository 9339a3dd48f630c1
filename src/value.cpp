#include "internal.hpp"

#include <sstream>

namespace tivar {

TiVarError::TiVarError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind TiVarError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnknownFormat: return "UnknownFormat";
        case ErrorKind::TruncatedEntry: return "TruncatedEntry";
        case ErrorKind::TrailingLengthMismatch: return "TrailingLengthMismatch";
        case ErrorKind::LengthMismatch: return "LengthMismatch";
        case ErrorKind::MalformedDigit: return "MalformedDigit";
        case ErrorKind::InvalidName: return "InvalidName";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::FieldOverflow: return "FieldOverflow";
    }
    return "Unknown";
}

using internal::append_real;
using internal::append_u16_le;
using internal::checked_mul_size;
using internal::decode_real;
using internal::hex2;
using internal::read_u16_le_from;
using internal::to_u16_length;

// ------------------------------
// Type tags
// ------------------------------

bool is_known_tag(std::uint8_t tag) noexcept {
    switch (static_cast<TypeTag>(tag)) {
        case TypeTag::Real:
        case TypeTag::RealList:
        case TypeTag::Matrix:
        case TypeTag::Equation:
        case TypeTag::String:
        case TypeTag::Program:
        case TypeTag::ProtectedProgram:
        case TypeTag::Complex:
        case TypeTag::ComplexList:
        case TypeTag::AppVar:
        case TypeTag::Group:
        case TypeTag::App:
            return true;
    }
    return false;
}

std::string tag_name(std::uint8_t tag) {
    switch (static_cast<TypeTag>(tag)) {
        case TypeTag::Real: return "real";
        case TypeTag::RealList: return "real list";
        case TypeTag::Matrix: return "matrix";
        case TypeTag::Equation: return "equation";
        case TypeTag::String: return "string";
        case TypeTag::Program: return "program";
        case TypeTag::ProtectedProgram: return "protected program";
        case TypeTag::Complex: return "complex";
        case TypeTag::ComplexList: return "complex list";
        case TypeTag::AppVar: return "app variable";
        case TypeTag::Group: return "group";
        case TypeTag::App: return "application";
    }
    return "unknown " + hex2(tag);
}

static bool is_group_or_app_tag(TypeTag t) {
    return t == TypeTag::AppVar || t == TypeTag::Group || t == TypeTag::App;
}

static TypeTag program_tag(ProgramKind k) {
    switch (k) {
        case ProgramKind::Protected: return TypeTag::ProtectedProgram;
        case ProgramKind::Equation: return TypeTag::Equation;
        default: return TypeTag::Program;
    }
}

// ------------------------------
// CalculatorValue helpers
// ------------------------------

CalculatorValue CalculatorValue::make_real(const Real& r) {
    CalculatorValue v;
    v.v = r;
    return v;
}

CalculatorValue CalculatorValue::make_complex(const Complex& c) {
    CalculatorValue v;
    v.v = c;
    return v;
}

CalculatorValue CalculatorValue::make_real_list(const RealList& l) {
    CalculatorValue v;
    v.v = l;
    return v;
}

CalculatorValue CalculatorValue::make_complex_list(const ComplexList& l) {
    CalculatorValue v;
    v.v = l;
    return v;
}

CalculatorValue CalculatorValue::make_matrix(const Matrix& m) {
    CalculatorValue v;
    v.v = m;
    return v;
}

CalculatorValue CalculatorValue::make_string(const String& s) {
    CalculatorValue v;
    v.v = s;
    return v;
}

CalculatorValue CalculatorValue::make_program(const Program& p) {
    CalculatorValue v;
    v.v = p;
    return v;
}

CalculatorValue CalculatorValue::make_group_or_app(const GroupOrApp& g) {
    CalculatorValue v;
    v.v = g;
    return v;
}

CalculatorValue CalculatorValue::make_raw_opaque(const RawOpaque& o) {
    CalculatorValue v;
    v.v = o;
    return v;
}

std::uint8_t CalculatorValue::type_tag() const noexcept {
    if (std::holds_alternative<Real>(v)) return static_cast<std::uint8_t>(TypeTag::Real);
    if (std::holds_alternative<Complex>(v)) return static_cast<std::uint8_t>(TypeTag::Complex);
    if (std::holds_alternative<RealList>(v)) return static_cast<std::uint8_t>(TypeTag::RealList);
    if (std::holds_alternative<ComplexList>(v)) return static_cast<std::uint8_t>(TypeTag::ComplexList);
    if (std::holds_alternative<Matrix>(v)) return static_cast<std::uint8_t>(TypeTag::Matrix);
    if (std::holds_alternative<String>(v)) return static_cast<std::uint8_t>(TypeTag::String);
    if (std::holds_alternative<Program>(v)) {
        return static_cast<std::uint8_t>(program_tag(std::get<Program>(v).kind));
    }
    if (std::holds_alternative<GroupOrApp>(v)) {
        return static_cast<std::uint8_t>(std::get<GroupOrApp>(v).tag);
    }
    return std::get<RawOpaque>(v).tag;
}

template <typename T>
static const T& get_or_mismatch(const CalculatorValue& value, const char* wanted) {
    if (!std::holds_alternative<T>(value.v)) {
        throw TiVarError(ErrorKind::TypeMismatch,
                         std::string("value is a ") + tag_name(value.type_tag()) + ", not a " + wanted);
    }
    return std::get<T>(value.v);
}

const Real& CalculatorValue::as_real() const { return get_or_mismatch<Real>(*this, "real"); }
const Complex& CalculatorValue::as_complex() const { return get_or_mismatch<Complex>(*this, "complex"); }
const RealList& CalculatorValue::as_real_list() const { return get_or_mismatch<RealList>(*this, "real list"); }

const ComplexList& CalculatorValue::as_complex_list() const {
    return get_or_mismatch<ComplexList>(*this, "complex list");
}

const Matrix& CalculatorValue::as_matrix() const { return get_or_mismatch<Matrix>(*this, "matrix"); }
const String& CalculatorValue::as_string() const { return get_or_mismatch<String>(*this, "string"); }
const Program& CalculatorValue::as_program() const { return get_or_mismatch<Program>(*this, "program"); }

const std::vector<std::uint8_t>& CalculatorValue::as_program_bytes() const {
    return as_program().tokens;
}

const GroupOrApp& CalculatorValue::as_group_or_app() const {
    return get_or_mismatch<GroupOrApp>(*this, "group or application");
}

const RawOpaque& CalculatorValue::as_raw_opaque() const {
    return get_or_mismatch<RawOpaque>(*this, "raw opaque value");
}

const Real& Matrix::at(std::size_t r, std::size_t c) const {
    if (r >= rows || c >= cols || r * cols + c >= elements.size()) {
        std::ostringstream oss;
        oss << "matrix index (" << r << ", " << c << ") outside " << rows << "x" << cols;
        throw TiVarError(ErrorKind::LengthMismatch, oss.str());
    }
    return elements[r * cols + c];
}

// ------------------------------
// Value <-> bytes encoding
// ------------------------------

static void append_complex(std::vector<std::uint8_t>& out, const Complex& c) {
    append_real(out, c.re);
    append_real(out, c.im);
}

static Complex decode_complex(const std::uint8_t* p, std::size_t offset) {
    Complex c;
    c.re = decode_real(p, offset);
    c.im = decode_real(p + kRealSize, offset + kRealSize);
    return c;
}

std::vector<std::uint8_t> encode_value(const CalculatorValue& value) {
    const auto& v = value.v;
    std::vector<std::uint8_t> out;

    if (std::holds_alternative<Real>(v)) {
        out.reserve(kRealSize);
        append_real(out, std::get<Real>(v));
        return out;
    }

    if (std::holds_alternative<Complex>(v)) {
        out.reserve(kComplexSize);
        append_complex(out, std::get<Complex>(v));
        return out;
    }

    if (std::holds_alternative<RealList>(v)) {
        const auto& l = std::get<RealList>(v);
        append_u16_le(out, to_u16_length(l.elements.size(), "real list count"));
        for (const auto& r : l.elements) append_real(out, r);
        return out;
    }

    if (std::holds_alternative<ComplexList>(v)) {
        const auto& l = std::get<ComplexList>(v);
        append_u16_le(out, to_u16_length(l.elements.size(), "complex list count"));
        for (const auto& c : l.elements) append_complex(out, c);
        return out;
    }

    if (std::holds_alternative<Matrix>(v)) {
        const auto& m = std::get<Matrix>(v);
        if (m.rows > 0xFFu || m.cols > 0xFFu) {
            std::ostringstream oss;
            oss << "matrix dimensions " << m.rows << "x" << m.cols << " exceed the 1-byte fields";
            throw TiVarError(ErrorKind::FieldOverflow, oss.str());
        }
        if (m.elements.size() != m.rows * m.cols) {
            std::ostringstream oss;
            oss << "matrix " << m.rows << "x" << m.cols << " holds " << m.elements.size() << " elements";
            throw TiVarError(ErrorKind::LengthMismatch, oss.str());
        }
        out.push_back(static_cast<std::uint8_t>(m.rows));
        out.push_back(static_cast<std::uint8_t>(m.cols));
        for (const auto& r : m.elements) append_real(out, r);
        return out;
    }

    if (std::holds_alternative<String>(v)) {
        return std::get<String>(v).data;
    }

    if (std::holds_alternative<Program>(v)) {
        const auto& p = std::get<Program>(v);
        out.reserve(p.tokens.size() + 2);
        append_u16_le(out, to_u16_length(p.tokens.size(), "program token stream"));
        out.insert(out.end(), p.tokens.begin(), p.tokens.end());
        return out;
    }

    if (std::holds_alternative<GroupOrApp>(v)) {
        const auto& g = std::get<GroupOrApp>(v);
        if (!is_group_or_app_tag(g.tag)) {
            throw TiVarError(ErrorKind::TypeMismatch,
                             "tag " + hex2(static_cast<std::uint8_t>(g.tag)) + " is not a group or application");
        }
        return g.bytes;
    }

    const auto& o = std::get<RawOpaque>(v);
    if (is_known_tag(o.tag)) {
        // A known tag would decode to its typed variant, not back to RawOpaque.
        throw TiVarError(ErrorKind::TypeMismatch,
                         "raw opaque value uses the known tag " + hex2(o.tag) + " (" + tag_name(o.tag) + ")");
    }
    return o.bytes;
}

static void expect_size(std::size_t size, std::size_t expected, std::uint8_t tag) {
    if (size != expected) {
        std::ostringstream oss;
        oss << tag_name(tag) << " payload is " << size << " bytes, expected " << expected;
        throw TiVarError(ErrorKind::LengthMismatch, oss.str());
    }
}

// Reads the 16-bit count/length prefix and checks the rest of the payload is
// exactly `count * width` bytes.
static std::size_t read_counted(const std::uint8_t* data, std::size_t size,
                                std::size_t width, std::uint8_t tag) {
    if (size < 2) {
        throw TiVarError(ErrorKind::LengthMismatch,
                         tag_name(tag) + " payload is too short for its 2-byte length prefix");
    }
    std::size_t count = read_u16_le_from(data);
    std::size_t expected = 0;
    if (!checked_mul_size(count, width, expected) || expected != size - 2) {
        std::ostringstream oss;
        oss << tag_name(tag) << " declares " << count << " x " << width << " bytes but the payload holds "
            << (size - 2) << " after the prefix";
        throw TiVarError(ErrorKind::LengthMismatch, oss.str());
    }
    return count;
}

CalculatorValue decode_value(std::uint8_t tag, const std::uint8_t* data, std::size_t size) {
    const TypeTag t = static_cast<TypeTag>(tag);

    if (!is_known_tag(tag)) {
        RawOpaque o;
        o.tag = tag;
        o.bytes.assign(data, data + size);
        return CalculatorValue::make_raw_opaque(o);
    }

    if (t == TypeTag::Real) {
        expect_size(size, kRealSize, tag);
        return CalculatorValue::make_real(decode_real(data, 0));
    }

    if (t == TypeTag::Complex) {
        expect_size(size, kComplexSize, tag);
        return CalculatorValue::make_complex(decode_complex(data, 0));
    }

    if (t == TypeTag::RealList) {
        std::size_t n = read_counted(data, size, kRealSize, tag);
        RealList l;
        l.elements.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            std::size_t off = 2 + i * kRealSize;
            l.elements.push_back(decode_real(data + off, off));
        }
        return CalculatorValue::make_real_list(l);
    }

    if (t == TypeTag::ComplexList) {
        std::size_t n = read_counted(data, size, kComplexSize, tag);
        ComplexList l;
        l.elements.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            std::size_t off = 2 + i * kComplexSize;
            l.elements.push_back(decode_complex(data + off, off));
        }
        return CalculatorValue::make_complex_list(l);
    }

    if (t == TypeTag::Matrix) {
        if (size < 2) {
            throw TiVarError(ErrorKind::LengthMismatch, "matrix payload is too short for its dimensions");
        }
        Matrix m;
        m.rows = data[0];
        m.cols = data[1];
        std::size_t expected = m.rows * m.cols * kRealSize;
        if (expected != size - 2) {
            std::ostringstream oss;
            oss << "matrix " << m.rows << "x" << m.cols << " needs " << expected
                << " bytes of elements, payload holds " << (size - 2);
            throw TiVarError(ErrorKind::LengthMismatch, oss.str());
        }
        m.elements.reserve(m.rows * m.cols);
        for (std::size_t i = 0; i < m.rows * m.cols; ++i) {
            std::size_t off = 2 + i * kRealSize;
            m.elements.push_back(decode_real(data + off, off));
        }
        return CalculatorValue::make_matrix(m);
    }

    if (t == TypeTag::String) {
        String s;
        s.data.assign(data, data + size);
        return CalculatorValue::make_string(s);
    }

    if (t == TypeTag::Program || t == TypeTag::ProtectedProgram || t == TypeTag::Equation) {
        std::size_t n = read_counted(data, size, 1, tag);
        Program p;
        p.kind = t == TypeTag::Program ? ProgramKind::Program
               : t == TypeTag::ProtectedProgram ? ProgramKind::Protected
               : ProgramKind::Equation;
        p.tokens.assign(data + 2, data + 2 + n);
        return CalculatorValue::make_program(p);
    }

    GroupOrApp g;
    g.tag = t;
    g.bytes.assign(data, data + size);
    return CalculatorValue::make_group_or_app(g);
}

CalculatorValue decode_value(std::uint8_t tag, const std::vector<std::uint8_t>& payload) {
    return decode_value(tag, payload.data(), payload.size());
}

} // namespace tivar
