#include "internal.hpp"

#include <sstream>

namespace tivar {

using internal::append_u16_le;
using internal::read_u16_le_from;
using internal::to_u16_length;

// [len:2][tag:1][name:8]([version:1][flags:1])[payload:len][len':2]
static constexpr std::size_t kLengthOffset = 0;
static constexpr std::size_t kTagOffset    = 2;
static constexpr std::size_t kNameOffset   = 3;
static constexpr std::size_t kMetaOffset   = kNameOffset + kNameSize;

std::size_t entry_overhead(FileFormat f) noexcept {
    return 2 + 1 + kNameSize + (has_entry_flags(f) ? 2 : 0) + 2;
}

EntryDecodeResult decode_entry(
    const std::uint8_t* data,
    std::size_t size,
    std::size_t cursor,
    FileFormat format
) {
    if (cursor > size || size - cursor < 2) {
        std::ostringstream oss;
        oss << "entry at offset " << cursor << " ends before its length field";
        throw TiVarError(ErrorKind::TruncatedEntry, oss.str());
    }
    const std::size_t remaining = size - cursor;
    const std::uint8_t* p = data + cursor;

    const std::uint16_t len = read_u16_le_from(p + kLengthOffset);
    const std::size_t record = entry_overhead(format) + len;
    check_entry_fits(record, remaining, cursor);

    EntryDecodeResult out;
    VariableEntry& e = out.entry;

    const std::uint8_t tag = p[kTagOffset];
    e.name = decode_name(p + kNameOffset);

    std::size_t pos = kMetaOffset;
    if (has_entry_flags(format)) {
        e.version = p[pos++];
        e.flags = p[pos++];
    }

    e.value = decode_value(tag, p + pos, len);
    pos += len;

    const std::uint16_t trailing = read_u16_le_from(p + pos);
    check_trailing_length(len, trailing, cursor + pos);
    pos += 2;

    out.consumed = pos;
    return out;
}

std::vector<std::uint8_t> encode_entry(const VariableEntry& entry, FileFormat format) {
    if (!has_entry_flags(format) && (entry.version != 0 || entry.flags != 0)) {
        throw TiVarError(ErrorKind::FieldOverflow,
                         "entry '" + entry.name.to_string() + "' has version/flags bytes the " +
                         to_string(format) + " format cannot store");
    }

    std::vector<std::uint8_t> payload = encode_value(entry.value);
    const std::uint16_t len = to_u16_length(payload.size(), "entry payload");
    const auto name = encode_name(entry.name);

    std::vector<std::uint8_t> out;
    out.reserve(entry_overhead(format) + payload.size());
    append_u16_le(out, len);
    out.push_back(entry.type_tag());
    out.insert(out.end(), name.begin(), name.end());
    if (has_entry_flags(format)) {
        out.push_back(entry.version);
        out.push_back(entry.flags);
    }
    out.insert(out.end(), payload.begin(), payload.end());
    append_u16_le(out, len);
    return out;
}

} // namespace tivar
