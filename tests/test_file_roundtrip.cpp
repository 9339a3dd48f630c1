#include "test_support.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using tivar::CalculatorFile;
using tivar::Comment;
using tivar::DecodeOptions;
using tivar::ErrorKind;
using tivar::FileFormat;
using tivar::ReadMode;
using tivar::VarName;

static constexpr std::size_t kDataLengthOffset = tivar::kHeaderSize - 2;

// One Str1 entry whose region bytes sum to 0x1234.
static CalculatorFile make_checksum_file() {
    // Fixed entry bytes: len 0x28 twice, tag 0x04, name byte 0xAA -> 254.
    std::vector<std::uint8_t> payload(40, 0x00);
    for (std::size_t i = 0; i < 17; ++i) payload[i] = 0xFF;
    payload[17] = 0x47;

    CalculatorFile f;
    tivar::easy::add(f, VarName::string(0), tivar::easy::make_string(payload));
    return f;
}

int main() {
    const CalculatorFile sample = make_sample_file();

    // Encode + decode
    {
        auto bytes = tivar::encode_file(sample);
        CHECK(bytes.size() == sample.encoded_size());
        CHECK(std::memcmp(bytes.data(), "**TI83F*\x1A\x0A\x00", tivar::kSignatureSize) == 0);
        CHECK(u16_at(bytes, kDataLengthOffset) == sample.data_length());
        CHECK(u16_at(bytes, bytes.size() - 2) == sample.checksum());

        CalculatorFile round = tivar::decode_file(bytes);
        CHECK(round == sample);
        CHECK(round.entries.size() == 8);
        CHECK(round.comment.text() == "Single file dated Sat Oct 18 2026");

        // Re-encoding the decoded file is byte-exact.
        CHECK(tivar::encode_file(round) == bytes);
        CHECK(tivar::encode_file(tivar::decode_file(tivar::encode_file(round))) == bytes);
    }

    // Lookup by name
    {
        const auto* l1 = sample.find(VarName::list(0));
        CHECK(l1 != nullptr);
        CHECK(l1->value.as_real_list().elements.size() == 4);

        const auto* prog = sample.find(VarName::from_text("HELLO"));
        CHECK(prog != nullptr && prog->archived());
        CHECK(sample.find(VarName::from_text("NOPE")) == nullptr);

        auto round = tivar::decode_file(tivar::encode_file(sample));
        const auto* pic = round.find(VarName::from_bytes({0x60, 0x00}));
        CHECK(pic != nullptr);
        CHECK(pic->value.as_raw_opaque().tag == 0x07);
        CHECK(pic->name.to_string() == "Pic1");
    }

    // Empty file
    {
        CalculatorFile empty;
        auto bytes = tivar::encode_file(empty);
        CHECK(bytes.size() == tivar::kHeaderSize + tivar::kChecksumSize);
        CHECK(u16_at(bytes, kDataLengthOffset) == 0);
        CHECK(u16_at(bytes, bytes.size() - 2) == 0);
        CHECK(tivar::decode_file(bytes) == empty);
    }

    // Checksum 0x1234
    {
        CalculatorFile f = make_checksum_file();
        auto bytes = tivar::encode_file(f);
        CHECK(f.checksum() == 0x1234);
        CHECK(bytes[bytes.size() - 2] == 0x34);
        CHECK(bytes[bytes.size() - 1] == 0x12);
        CHECK(tivar::decode_file(bytes) == f);

        // First payload byte of the only entry.
        bytes[tivar::kHeaderSize + 13] ^= 0x01;
        CHECK(throws_kind(ErrorKind::ChecksumMismatch, [&] { (void)tivar::decode_file(bytes); }));
    }

    // Data length one short
    {
        auto bytes = tivar::encode_file(sample);
        put_u16(bytes, kDataLengthOffset, static_cast<std::uint16_t>(sample.data_length() - 1));
        CHECK(throws_kind(ErrorKind::TruncatedEntry, [&] { (void)tivar::decode_file(bytes); }));
    }

    // Data length beyond the buffer
    {
        auto bytes = tivar::encode_file(sample);
        put_u16(bytes, kDataLengthOffset, static_cast<std::uint16_t>(sample.data_length() + 10));
        CHECK(throws_kind(ErrorKind::TruncatedEntry, [&] { (void)tivar::decode_file(bytes); }));
    }

    // Trailing bytes after the checksum
    {
        auto bytes = tivar::encode_file(sample);
        bytes.push_back(0x00);
        CHECK(throws_kind(ErrorKind::LengthMismatch, [&] { (void)tivar::decode_file(bytes); }));
    }

    // Missing checksum
    {
        auto bytes = tivar::encode_file(sample);
        bytes.pop_back();
        CHECK(throws_kind(ErrorKind::TruncatedEntry, [&] { (void)tivar::decode_file(bytes); }));
    }

    // Signatures
    {
        auto bytes = tivar::encode_file(sample);
        std::memcpy(bytes.data(), "**TI82**", 8);
        CHECK(throws_kind(ErrorKind::UnknownFormat, [&] { (void)tivar::decode_file(bytes); }));

        std::vector<std::uint8_t> tiny = {'*', '*', 'T', 'I'};
        CHECK(throws_kind(ErrorKind::UnknownFormat, [&] { (void)tivar::decode_file(tiny); }));

        // A valid signature followed by half a comment.
        auto cut = tivar::encode_file(sample);
        cut.resize(30);
        CHECK(throws_kind(ErrorKind::TruncatedEntry, [&] { (void)tivar::decode_file(cut); }));
    }

    // Read modes
    {
        auto good = tivar::encode_file(sample);

        auto bad_sig = good;
        std::memcpy(bad_sig.data(), "**TI82**", 8);
        DecodeOptions sig_fix;
        sig_fix.signature = ReadMode::Fix;
        CalculatorFile fixed = tivar::decode_file(bad_sig, sig_fix);
        CHECK(fixed.format == FileFormat::TI83Plus);
        CHECK(fixed.entries == sample.entries);
        CHECK(tivar::encode_file(fixed) == good);

        auto bad_len = good;
        put_u16(bad_len, kDataLengthOffset, 0);
        CHECK(throws_kind(ErrorKind::LengthMismatch, [&] { (void)tivar::decode_file(bad_len); }));
        DecodeOptions len_fix;
        len_fix.data_length = ReadMode::Fix;
        CHECK(tivar::decode_file(bad_len, len_fix) == sample);

        auto bad_sum = good;
        bad_sum[bad_sum.size() - 1] ^= 0xFF;
        CHECK(throws_kind(ErrorKind::ChecksumMismatch, [&] { (void)tivar::decode_file(bad_sum); }));
        DecodeOptions sum_fix;
        sum_fix.checksum = ReadMode::Fix;
        CHECK(tivar::decode_file(bad_sum, sum_fix) == sample);
        // Re-encoding repairs the checksum.
        CHECK(tivar::encode_file(tivar::decode_file(bad_sum, sum_fix)) == good);

        // Fix modes do not hide structural errors in the entries.
        auto bad_trailer = good;
        std::size_t first_trailer = tivar::kHeaderSize + 15 + tivar::kRealSize - 2;
        bad_trailer[first_trailer] ^= 0x01;
        DecodeOptions all_fix;
        all_fix.signature = ReadMode::Fix;
        all_fix.data_length = ReadMode::Fix;
        all_fix.checksum = ReadMode::Fix;
        CHECK(throws_kind(ErrorKind::TrailingLengthMismatch,
                          [&] { (void)tivar::decode_file(bad_trailer, all_fix); }));
    }

    // Errors from inside an entry propagate unchanged
    {
        auto bytes = tivar::encode_file(sample);
        // Second mantissa byte of the first entry's real.
        bytes[tivar::kHeaderSize + 13 + 3] = 0x3A;
        CHECK(throws_kind(ErrorKind::MalformedDigit, [&] { (void)tivar::decode_file(bytes); }));

        auto named = tivar::encode_file(sample);
        named[tivar::kHeaderSize + 3 + 1] = '*';
        CHECK(throws_kind(ErrorKind::InvalidName, [&] { (void)tivar::decode_file(named); }));
    }

    // Comment field
    {
        Comment c = Comment::from_text("hello");
        CHECK(c.text() == "hello");
        CHECK(c.length() == 5);
        CHECK(c.is_zero_terminated());
        CHECK(c.raw()[5] == 0x00);

        Comment spaced = Comment::from_text("hello", false);
        CHECK(!spaced.is_zero_terminated());
        CHECK(spaced.raw()[41] == ' ');
        CHECK(spaced.text() == "hello");
        CHECK(spaced.text(false).size() == tivar::kCommentSize);
        CHECK(spaced.length() == 5);
        Comment terminated = spaced.zero_terminated();
        CHECK(terminated.is_zero_terminated());
        CHECK(terminated.raw()[5] == 0x00);
        CHECK(terminated.raw()[6] == ' ');
        CHECK(terminated.text() == "hello");
        CHECK(c.padded() == spaced);

        std::string full(tivar::kCommentSize, 'x');
        Comment filled = Comment::from_text(full);
        CHECK(!filled.is_zero_terminated());
        CHECK(filled.text() == full);
        CHECK(filled.zero_terminated() == filled);

        CHECK(throws_kind(ErrorKind::FieldOverflow,
                          [] { (void)Comment::from_text(std::string(tivar::kCommentSize + 1, 'x')); }));

        CalculatorFile f;
        f.comment = spaced;
        auto bytes = tivar::encode_file(f);
        CHECK(std::equal(spaced.raw().begin(), spaced.raw().end(), bytes.begin() + tivar::kSignatureSize));
        CHECK(tivar::decode_file(bytes).comment == spaced);
    }

    // TI-83 files
    {
        CalculatorFile f;
        f.format = FileFormat::TI83;
        f.comment = Comment::from_text("TI-83 file");
        tivar::easy::add(f, VarName::from_text("X"), tivar::easy::make_real(42.0));
        tivar::easy::add(f, VarName::matrix(1), tivar::easy::make_matrix(1, 2, {7, 8}));
        tivar::easy::add(f, VarName::from_text("PRGM"), tivar::easy::make_program({0xDE, 0x2A}));

        auto bytes = tivar::encode_file(f);
        CHECK(std::memcmp(bytes.data(), "**TI83**\x1A\x0A\x00", tivar::kSignatureSize) == 0);
        CHECK(u16_at(bytes, kDataLengthOffset) == 3 * 13 + tivar::kRealSize + (2 + 2 * tivar::kRealSize) + 4);

        CalculatorFile round = tivar::decode_file(bytes);
        CHECK(round.format == FileFormat::TI83);
        CHECK(round == f);
        CHECK(tivar::encode_file(round) == bytes);

        CalculatorFile archived = f;
        archived.entries[0].flags = tivar::kArchivedFlag;
        CHECK(throws_kind(ErrorKind::FieldOverflow, [&] { (void)tivar::encode_file(archived); }));
    }

    // Region larger than the 16-bit data length
    {
        CalculatorFile f;
        for (std::uint8_t i = 0; i < 2; ++i) {
            tivar::easy::add(f, VarName::string(i),
                             tivar::easy::make_string(std::vector<std::uint8_t>(40000, 0x41)));
        }
        CHECK(throws_kind(ErrorKind::FieldOverflow, [&] { (void)tivar::encode_file(f); }));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
