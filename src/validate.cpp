#include "internal.hpp"

#include <sstream>

namespace tivar {

using internal::hex4;
using internal::read_u16_le_from;

// ------------------------------
// Throwing checks
// ------------------------------

void check_entry_fits(std::size_t record_size, std::size_t remaining, std::size_t offset) {
    if (record_size > remaining) {
        std::ostringstream oss;
        oss << "entry at offset " << offset << " needs " << record_size << " bytes but only "
            << remaining << " remain in the entry region";
        throw TiVarError(ErrorKind::TruncatedEntry, oss.str());
    }
}

void check_trailing_length(std::uint16_t leading, std::uint16_t trailing, std::size_t offset) {
    if (leading != trailing) {
        std::ostringstream oss;
        oss << "trailing length " << trailing << " at offset " << offset
            << " does not repeat the leading length " << leading;
        throw TiVarError(ErrorKind::TrailingLengthMismatch, oss.str());
    }
}

void check_data_length(std::size_t declared, std::size_t actual) {
    if (declared != actual) {
        std::ostringstream oss;
        oss << "data length field declares " << declared << " bytes, entries occupy " << actual;
        throw TiVarError(ErrorKind::LengthMismatch, oss.str());
    }
}

void check_checksum(std::uint16_t stored, std::uint16_t computed) {
    if (stored != computed) {
        throw TiVarError(ErrorKind::ChecksumMismatch,
                         "checksum mismatch: stored " + hex4(stored) + ", computed " + hex4(computed));
    }
}

// ------------------------------
// Report
// ------------------------------

bool ValidationReport::has(ErrorKind k) const noexcept {
    for (const auto& i : issues) {
        if (i.kind == k) return true;
    }
    return false;
}

template <typename Check>
static void collect(ValidationReport& report, Check&& check) {
    try {
        check();
    } catch (const TiVarError& e) {
        report.issues.push_back(ValidationIssue{e.kind(), e.what()});
    }
}

ValidationReport validate_file(const std::uint8_t* data, std::size_t size) {
    ValidationReport report;

    FileFormat format = FileFormat::TI83Plus;
    if (!internal::match_signature(data, size, format)) {
        report.issues.push_back({ErrorKind::UnknownFormat, "unsupported or missing signature"});
        return report;
    }
    if (size < kHeaderSize + kChecksumSize) {
        report.issues.push_back({ErrorKind::TruncatedEntry, "file is shorter than its header and checksum"});
        return report;
    }

    // Everything between the header and the final two bytes is treated as the
    // entry region, independent of the declared data length.
    const std::size_t begin = kHeaderSize;
    const std::size_t end = size - kChecksumSize;
    const std::size_t declared = read_u16_le_from(data + kHeaderSize - 2);
    const std::uint16_t stored = read_u16_le_from(data + end);

    // Entry bounds: walk the length fields only.
    std::size_t pos = begin;
    while (pos < end) {
        const std::size_t remaining = end - pos;
        if (remaining < 2) {
            collect(report, [&] { check_entry_fits(2, remaining, pos); });
            break;
        }
        const std::size_t record = entry_overhead(format) + read_u16_le_from(data + pos);
        if (record > remaining) {
            collect(report, [&] { check_entry_fits(record, remaining, pos); });
            break;
        }
        pos += record;
    }

    // Data length: the bytes the entries occupy, whether or not the last one is complete.
    collect(report, [&] { check_data_length(declared, end - begin); });

    collect(report, [&] { check_checksum(stored, compute_checksum(data + begin, end - begin)); });

    return report;
}

ValidationReport validate_file(const std::vector<std::uint8_t>& bytes) {
    return validate_file(bytes.data(), bytes.size());
}

} // namespace tivar
