#include "internal.hpp"

#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <sstream>

namespace tivar {

using internal::append_u16_le;
using internal::read_u16_le_from;
using internal::to_u16_length;

// ------------------------------
// Formats
// ------------------------------

static const std::array<std::uint8_t, kSignatureSize> kTi83PlusSignature = {
    '*', '*', 'T', 'I', '8', '3', 'F', '*', 0x1A, 0x0A, 0x00,
};

static const std::array<std::uint8_t, kSignatureSize> kTi83Signature = {
    '*', '*', 'T', 'I', '8', '3', '*', '*', 0x1A, 0x0A, 0x00,
};

static constexpr std::size_t kCommentOffset    = kSignatureSize;
static constexpr std::size_t kDataLengthOffset = kCommentOffset + kCommentSize;

std::string to_string(FileFormat f) {
    switch (f) {
        case FileFormat::TI83: return "TI-83";
        case FileFormat::TI83Plus: return "TI-83 Plus";
    }
    return "unknown";
}

const std::array<std::uint8_t, kSignatureSize>& signature_bytes(FileFormat f) {
    return f == FileFormat::TI83 ? kTi83Signature : kTi83PlusSignature;
}

bool has_entry_flags(FileFormat f) noexcept {
    return f == FileFormat::TI83Plus;
}

namespace internal {

bool match_signature(const std::uint8_t* data, std::size_t size, FileFormat& out) noexcept {
    if (size < kSignatureSize) return false;
    for (FileFormat f : {FileFormat::TI83Plus, FileFormat::TI83}) {
        const auto& sig = signature_bytes(f);
        if (std::equal(sig.begin(), sig.end(), data)) {
            out = f;
            return true;
        }
    }
    return false;
}

} // namespace internal

// ------------------------------
// Comment
// ------------------------------

Comment Comment::from_text(const std::string& text, bool zero_terminated) {
    if (text.size() > kCommentSize) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "comment of " + std::to_string(text.size()) + " bytes exceeds the 42-byte field");
    }
    Comment c;
    std::size_t i = 0;
    for (; i < text.size(); ++i) c.raw_[i] = static_cast<std::uint8_t>(text[i]);
    for (; i < kCommentSize; ++i) c.raw_[i] = zero_terminated ? 0 : static_cast<std::uint8_t>(' ');
    return c;
}

Comment Comment::from_raw(const Raw& raw) {
    Comment c;
    c.raw_ = raw;
    return c;
}

std::size_t Comment::trailing_spaces() const noexcept {
    std::size_t n = 0;
    while (n < kCommentSize && raw_[kCommentSize - 1 - n] == ' ') ++n;
    return n;
}

std::string Comment::text(bool trim) const {
    auto nul = std::find(raw_.begin(), raw_.end(), std::uint8_t{0});
    if (nul != raw_.end()) {
        return std::string(raw_.begin(), nul);
    }
    std::size_t n = trim ? kCommentSize - trailing_spaces() : kCommentSize;
    return std::string(raw_.begin(), raw_.begin() + static_cast<std::ptrdiff_t>(n));
}

std::size_t Comment::length() const noexcept {
    auto nul = std::find(raw_.begin(), raw_.end(), std::uint8_t{0});
    if (nul != raw_.end()) return static_cast<std::size_t>(nul - raw_.begin());
    return kCommentSize - trailing_spaces();
}

bool Comment::is_zero_terminated() const noexcept {
    return std::find(raw_.begin(), raw_.end(), std::uint8_t{0}) != raw_.end();
}

Comment Comment::zero_terminated() const {
    Comment c = *this;
    if (is_zero_terminated()) return c;
    std::size_t spaces = trailing_spaces();
    // No room for a terminator when the text fills the field.
    if (spaces == 0) return c;
    c.raw_[kCommentSize - spaces] = 0;
    return c;
}

Comment Comment::padded() const {
    Comment c = *this;
    auto nul = std::find(c.raw_.begin(), c.raw_.end(), std::uint8_t{0});
    std::fill(nul, c.raw_.end(), static_cast<std::uint8_t>(' '));
    return c;
}

// ------------------------------
// CalculatorFile
// ------------------------------

static std::vector<std::uint8_t> encode_region(const CalculatorFile& file) {
    std::vector<std::uint8_t> region;
    for (const auto& e : file.entries) {
        std::vector<std::uint8_t> bytes = encode_entry(e, file.format);
        region.insert(region.end(), bytes.begin(), bytes.end());
    }
    to_u16_length(region.size(), "entry region");
    return region;
}

std::uint16_t CalculatorFile::data_length() const {
    return static_cast<std::uint16_t>(encode_region(*this).size());
}

std::uint16_t CalculatorFile::checksum() const {
    return compute_checksum(encode_region(*this));
}

std::size_t CalculatorFile::encoded_size() const {
    return kHeaderSize + data_length() + kChecksumSize;
}

const VariableEntry* CalculatorFile::find(const VarName& name) const noexcept {
    for (const auto& e : entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

// ------------------------------
// Container decode
// ------------------------------

namespace {

enum class DecodeState {
    Start,
    HeaderRead,
    CommentRead,
    EntriesReading,
    EntriesDone,
    ChecksumRead,
    Valid,
    Invalid,
};

// Single pass over a borrowed buffer. Any error leaves the decoder Invalid and
// propagates unchanged; there is no partial result.
class FileDecoder {
public:
    FileDecoder(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts)
        : data_(data), size_(size), opts_(opts) {}

    CalculatorFile run() {
        try {
            read_header();
            read_comment();
            read_entries();
            read_checksum();
            state_ = DecodeState::Valid;
            return std::move(file_);
        } catch (const TiVarError&) {
            state_ = DecodeState::Invalid;
            throw;
        }
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    DecodeOptions opts_;
    DecodeState state_{DecodeState::Start};
    CalculatorFile file_{};
    std::size_t region_end_{0};

    void read_header() {
        if (size_ < kSignatureSize) {
            throw TiVarError(ErrorKind::UnknownFormat,
                             "buffer of " + std::to_string(size_) + " bytes is too short for a signature");
        }
        FileFormat f = FileFormat::TI83Plus;
        if (!internal::match_signature(data_, size_, f)) {
            if (opts_.signature == ReadMode::Error) {
                std::string sig(reinterpret_cast<const char*>(data_), 8);
                throw TiVarError(ErrorKind::UnknownFormat, "unsupported signature '" + sig + "'");
            }
            f = FileFormat::TI83Plus;
        }
        file_.format = f;
        state_ = DecodeState::HeaderRead;
    }

    void read_comment() {
        if (size_ < kDataLengthOffset) {
            throw TiVarError(ErrorKind::TruncatedEntry, "file ends inside the comment field");
        }
        Comment::Raw raw{};
        std::memcpy(raw.data(), data_ + kCommentOffset, kCommentSize);
        file_.comment = Comment::from_raw(raw);
        state_ = DecodeState::CommentRead;
    }

    void read_entries() {
        if (size_ < kHeaderSize) {
            throw TiVarError(ErrorKind::TruncatedEntry, "file ends inside the data length field");
        }
        std::size_t declared = read_u16_le_from(data_ + kDataLengthOffset);
        if (opts_.data_length == ReadMode::Fix && size_ >= kHeaderSize + kChecksumSize) {
            declared = size_ - kHeaderSize - kChecksumSize;
        }
        region_end_ = kHeaderSize + declared;
        if (region_end_ > size_) {
            std::ostringstream oss;
            oss << "data length declares " << declared << " bytes but only " << (size_ - kHeaderSize)
                << " follow the header";
            throw TiVarError(ErrorKind::TruncatedEntry, oss.str());
        }

        state_ = DecodeState::EntriesReading;
        std::size_t cursor = kHeaderSize;
        while (cursor < region_end_) {
            EntryDecodeResult r = decode_entry(data_, region_end_, cursor, file_.format);
            cursor += r.consumed;
            file_.entries.push_back(std::move(r.entry));
        }
        state_ = DecodeState::EntriesDone;
    }

    void read_checksum() {
        if (region_end_ + kChecksumSize > size_) {
            throw TiVarError(ErrorKind::TruncatedEntry, "file ends before the checksum");
        }
        const std::uint16_t stored = read_u16_le_from(data_ + region_end_);
        state_ = DecodeState::ChecksumRead;

        check_data_length(region_end_ - kHeaderSize, size_ - kHeaderSize - kChecksumSize);
        if (opts_.checksum == ReadMode::Error) {
            check_checksum(stored, compute_checksum(data_ + kHeaderSize, region_end_ - kHeaderSize));
        }
    }
};

} // namespace

CalculatorFile decode_file(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts) {
    return FileDecoder(data, size, opts).run();
}

CalculatorFile decode_file(const std::vector<std::uint8_t>& bytes, const DecodeOptions& opts) {
    return decode_file(bytes.data(), bytes.size(), opts);
}

// ------------------------------
// Container encode
// ------------------------------

std::vector<std::uint8_t> encode_file(const CalculatorFile& file) {
    std::vector<std::uint8_t> region = encode_region(file);
    const std::uint16_t n = static_cast<std::uint16_t>(region.size());

    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + region.size() + kChecksumSize);

    const auto& sig = signature_bytes(file.format);
    out.insert(out.end(), sig.begin(), sig.end());
    const auto& comment = file.comment.raw();
    out.insert(out.end(), comment.begin(), comment.end());
    append_u16_le(out, n);
    out.insert(out.end(), region.begin(), region.end());
    append_u16_le(out, compute_checksum(region));
    return out;
}

} // namespace tivar
