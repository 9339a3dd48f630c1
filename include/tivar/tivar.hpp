#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tivar {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    UnknownFormat,
    TruncatedEntry,
    TrailingLengthMismatch,
    LengthMismatch,
    MalformedDigit,
    InvalidName,
    ChecksumMismatch,
    TypeMismatch,
    FieldOverflow,
};

std::string to_string(ErrorKind k);

class TiVarError : public std::runtime_error {
public:
    TiVarError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Format constants
// ------------------------------

constexpr std::size_t kSignatureSize  = 11;
constexpr std::size_t kCommentSize    = 42;
constexpr std::size_t kHeaderSize     = kSignatureSize + kCommentSize + 2;
constexpr std::size_t kChecksumSize   = 2;
constexpr std::size_t kNameSize       = 8;
constexpr std::size_t kRealSize       = 9;
constexpr std::size_t kComplexSize    = 2 * kRealSize;
constexpr std::size_t kMantissaDigits = 14;

enum class FileFormat {
    TI83,     // "**TI83**": entries without version/flags bytes
    TI83Plus, // "**TI83F*": TI-83 Plus / TI-84 Plus family
};

std::string to_string(FileFormat f);
const std::array<std::uint8_t, kSignatureSize>& signature_bytes(FileFormat f);
bool has_entry_flags(FileFormat f) noexcept;

// Raw bytes of a serialized entry excluding its payload.
std::size_t entry_overhead(FileFormat f) noexcept;

enum class TypeTag : std::uint8_t {
    Real             = 0x00,
    RealList         = 0x01,
    Matrix           = 0x02,
    Equation         = 0x03,
    String           = 0x04,
    Program          = 0x05,
    ProtectedProgram = 0x06,
    Complex          = 0x0C,
    ComplexList      = 0x0D,
    AppVar           = 0x15,
    Group            = 0x17,
    App              = 0x24,
};

bool is_known_tag(std::uint8_t tag) noexcept;
std::string tag_name(std::uint8_t tag);

// ------------------------------
// Value model
// ------------------------------

// Calculator real: sign, decimal exponent and a 14-digit mantissa.
// The value is (-1)^negative * d0.d1d2...d13 * 10^exponent.
struct Real {
    bool negative{false};
    int exponent{0};
    std::array<std::uint8_t, kMantissaDigits> mantissa{}; // one decimal digit per element
    // Non-sign bits of the leading byte. 0x0C marks the parts of a complex number.
    std::uint8_t flags{0};

    // Digits are left-aligned and zero-filled, so "314" means 3.14.
    static Real from_digits(bool negative, int exponent, const std::string& digits);
    static Real from_double(double v);

    double to_double() const;
    std::string digits() const;
    bool is_zero() const noexcept;

    bool operator==(const Real& o) const noexcept;
    bool operator!=(const Real& o) const noexcept { return !(*this == o); }
};

constexpr std::uint8_t kComplexPartFlags = 0x0C;

struct Complex {
    Real re{};
    Real im{};

    bool operator==(const Complex& o) const noexcept { return re == o.re && im == o.im; }
    bool operator!=(const Complex& o) const noexcept { return !(*this == o); }
};

struct RealList {
    std::vector<Real> elements{};

    bool operator==(const RealList& o) const { return elements == o.elements; }
    bool operator!=(const RealList& o) const { return !(*this == o); }
};

struct ComplexList {
    std::vector<Complex> elements{};

    bool operator==(const ComplexList& o) const { return elements == o.elements; }
    bool operator!=(const ComplexList& o) const { return !(*this == o); }
};

struct Matrix {
    std::size_t rows{0};
    std::size_t cols{0};
    // Row-major, length = rows * cols.
    std::vector<Real> elements{};

    const Real& at(std::size_t r, std::size_t c) const;

    bool operator==(const Matrix& o) const {
        return rows == o.rows && cols == o.cols && elements == o.elements;
    }
    bool operator!=(const Matrix& o) const { return !(*this == o); }
};

// Bytes in the calculator character set, one byte per glyph.
struct String {
    std::vector<std::uint8_t> data{};

    bool operator==(const String& o) const { return data == o.data; }
    bool operator!=(const String& o) const { return !(*this == o); }
};

enum class ProgramKind {
    Program,
    Protected,
    Equation,
};

// Tokenized TI-Basic (or assembly) bytes. Never interpreted here.
struct Program {
    ProgramKind kind{ProgramKind::Program};
    std::vector<std::uint8_t> tokens{};

    bool operator==(const Program& o) const { return kind == o.kind && tokens == o.tokens; }
    bool operator!=(const Program& o) const { return !(*this == o); }
};

// App variables, groups and applications, kept as stored.
struct GroupOrApp {
    TypeTag tag{TypeTag::AppVar};
    std::vector<std::uint8_t> bytes{};

    bool operator==(const GroupOrApp& o) const { return tag == o.tag && bytes == o.bytes; }
    bool operator!=(const GroupOrApp& o) const { return !(*this == o); }
};

// Payload of a tag outside the known set.
struct RawOpaque {
    std::uint8_t tag{0xFF};
    std::vector<std::uint8_t> bytes{};

    bool operator==(const RawOpaque& o) const { return tag == o.tag && bytes == o.bytes; }
    bool operator!=(const RawOpaque& o) const { return !(*this == o); }
};

struct CalculatorValue {
    std::variant<
        Real,
        Complex,
        RealList,
        ComplexList,
        Matrix,
        String,
        Program,
        GroupOrApp,
        RawOpaque
    > v;

    // Convenience constructors
    static CalculatorValue make_real(const Real& r);
    static CalculatorValue make_complex(const Complex& c);
    static CalculatorValue make_real_list(const RealList& l);
    static CalculatorValue make_complex_list(const ComplexList& l);
    static CalculatorValue make_matrix(const Matrix& m);
    static CalculatorValue make_string(const String& s);
    static CalculatorValue make_program(const Program& p);
    static CalculatorValue make_group_or_app(const GroupOrApp& g);
    static CalculatorValue make_raw_opaque(const RawOpaque& o);

    // Tag the value is stored under.
    std::uint8_t type_tag() const noexcept;

    // Typed accessors; throw TypeMismatch when another variant is stored.
    const Real& as_real() const;
    const Complex& as_complex() const;
    const RealList& as_real_list() const;
    const ComplexList& as_complex_list() const;
    const Matrix& as_matrix() const;
    const String& as_string() const;
    const Program& as_program() const;
    const std::vector<std::uint8_t>& as_program_bytes() const;
    const GroupOrApp& as_group_or_app() const;
    const RawOpaque& as_raw_opaque() const;

    bool operator==(const CalculatorValue& o) const { return v == o.v; }
    bool operator!=(const CalculatorValue& o) const { return !(*this == o); }
};

// ------------------------------
// Names
// ------------------------------

class VarName {
public:
    VarName() = default;

    // Raw identifier bytes without padding. Throws InvalidName or FieldOverflow.
    static VarName from_bytes(const std::vector<std::uint8_t>& bytes);
    // Plain names: "PRGM", "A", "θ" is accepted as UTF-8.
    static VarName from_text(const std::string& text);

    static VarName list(std::uint8_t index);    // 0..5 -> L1..L6
    static VarName matrix(std::uint8_t index);  // 0..9 -> [A]..[J]
    static VarName string(std::uint8_t index);  // 0..9 -> Str1..Str9, Str0
    static VarName user_list(const std::string& text);

    const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }
    bool empty() const noexcept { return bytes_.empty(); }

    // Display form, e.g. "L1", "[A]", "Str1", "ʟABC".
    std::string to_string() const;

    bool operator==(const VarName& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const VarName& o) const { return !(*this == o); }

private:
    explicit VarName(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}
    std::vector<std::uint8_t> bytes_{};
};

// Decode a zero-padded name field of kNameSize bytes. Throws InvalidName.
VarName decode_name(const std::uint8_t* field);
// Pad a name to the fixed field width. Throws FieldOverflow or InvalidName.
std::array<std::uint8_t, kNameSize> encode_name(const VarName& name);

// ------------------------------
// Entries and files
// ------------------------------

constexpr std::uint8_t kArchivedFlag = 0x80;

struct VariableEntry {
    VarName name{};
    std::uint8_t version{0};
    std::uint8_t flags{0};
    CalculatorValue value{};

    std::uint8_t type_tag() const noexcept { return value.type_tag(); }
    bool archived() const noexcept { return (flags & kArchivedFlag) != 0; }

    bool operator==(const VariableEntry& o) const {
        return name == o.name && version == o.version && flags == o.flags && value == o.value;
    }
    bool operator!=(const VariableEntry& o) const { return !(*this == o); }
};

// Fixed-width comment; either zero-terminated or right-padded with spaces.
class Comment {
public:
    using Raw = std::array<std::uint8_t, kCommentSize>;

    Comment() = default;

    static Comment from_text(const std::string& text, bool zero_terminated = true);
    static Comment from_raw(const Raw& raw);

    const Raw& raw() const noexcept { return raw_; }

    // Bytes before the first NUL. Without a NUL, `trim` strips the space padding.
    std::string text(bool trim = true) const;
    std::size_t length() const noexcept;
    bool is_zero_terminated() const noexcept;

    Comment zero_terminated() const;
    Comment padded() const;

    bool operator==(const Comment& o) const noexcept { return raw_ == o.raw_; }
    bool operator!=(const Comment& o) const noexcept { return !(*this == o); }

private:
    std::size_t trailing_spaces() const noexcept;
    Raw raw_{};
};

struct CalculatorFile {
    FileFormat format{FileFormat::TI83Plus};
    Comment comment{};
    std::vector<VariableEntry> entries{};

    // Derived from the entries; never stored.
    std::uint16_t data_length() const;
    std::uint16_t checksum() const;
    std::size_t encoded_size() const;

    const VariableEntry* find(const VarName& name) const noexcept;

    bool operator==(const CalculatorFile& o) const {
        return format == o.format && comment == o.comment && entries == o.entries;
    }
    bool operator!=(const CalculatorFile& o) const { return !(*this == o); }
};

// ------------------------------
// Options
// ------------------------------

enum class ReadMode {
    Error, // fail on malformed data
    Fix,   // repair where the intent is clear and continue
};

struct DecodeOptions {
    ReadMode signature{ReadMode::Error};   // Fix: unknown signature read as TI83Plus
    ReadMode data_length{ReadMode::Error}; // Fix: region length taken from buffer size
    ReadMode checksum{ReadMode::Error};    // Fix: accept a mismatching checksum
};

// ------------------------------
// Checksum
// ------------------------------

std::uint16_t compute_checksum(const std::uint8_t* data, std::size_t size) noexcept;
std::uint16_t compute_checksum(const std::vector<std::uint8_t>& bytes) noexcept;
bool verify_checksum(const std::uint8_t* data, std::size_t size, std::uint16_t expected) noexcept;
bool verify_checksum(const std::vector<std::uint8_t>& bytes, std::uint16_t expected) noexcept;

struct ChecksumAccumulator {
    std::uint16_t sum{0};

    void reset() noexcept { sum = 0; }
    void add(std::uint8_t b) noexcept { sum = static_cast<std::uint16_t>(sum + b); }
    void add(const std::uint8_t* data, std::size_t size) noexcept;
    std::uint16_t value() const noexcept { return sum; }
};

// ------------------------------
// Validation
// ------------------------------

struct ValidationIssue {
    ErrorKind kind{ErrorKind::LengthMismatch};
    std::string message{};
};

struct ValidationReport {
    std::vector<ValidationIssue> issues{};

    bool ok() const noexcept { return issues.empty(); }
    bool has(ErrorKind k) const noexcept;
};

// Runs the data length, entry bounds and checksum checks independently. Never throws.
ValidationReport validate_file(const std::uint8_t* data, std::size_t size);
ValidationReport validate_file(const std::vector<std::uint8_t>& bytes);

// Throwing checks shared by the decoders.
void check_entry_fits(std::size_t record_size, std::size_t remaining, std::size_t offset);
void check_trailing_length(std::uint16_t leading, std::uint16_t trailing, std::size_t offset);
void check_data_length(std::size_t declared, std::size_t actual);
void check_checksum(std::uint16_t stored, std::uint16_t computed);

// ------------------------------
// API
// ------------------------------

/// Decode one payload according to its type tag.
CalculatorValue decode_value(std::uint8_t tag, const std::uint8_t* data, std::size_t size);
CalculatorValue decode_value(std::uint8_t tag, const std::vector<std::uint8_t>& payload);

/// Encode one value to its payload bytes (without entry metadata).
std::vector<std::uint8_t> encode_value(const CalculatorValue& value);

struct EntryDecodeResult {
    VariableEntry entry{};
    std::size_t consumed{0};
};

/// Decode the entry starting at `cursor`; `size` bounds the entry region.
EntryDecodeResult decode_entry(
    const std::uint8_t* data,
    std::size_t size,
    std::size_t cursor,
    FileFormat format = FileFormat::TI83Plus
);

std::vector<std::uint8_t> encode_entry(
    const VariableEntry& entry,
    FileFormat format = FileFormat::TI83Plus
);

/// Decode a complete variable file. The buffer is borrowed for the duration of the call.
CalculatorFile decode_file(
    const std::uint8_t* data,
    std::size_t size,
    const DecodeOptions& opts = DecodeOptions{}
);

CalculatorFile decode_file(
    const std::vector<std::uint8_t>& bytes,
    const DecodeOptions& opts = DecodeOptions{}
);

/// Encode a complete variable file; data length and checksum are recomputed.
std::vector<std::uint8_t> encode_file(const CalculatorFile& file);

} // namespace tivar
