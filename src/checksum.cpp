#include "tivar/tivar.hpp"

namespace tivar {

// Lower 16 bits of the byte sum over the entry region.

void ChecksumAccumulator::add(const std::uint8_t* data, std::size_t size) noexcept {
    for (std::size_t i = 0; i < size; ++i) {
        sum = static_cast<std::uint16_t>(sum + data[i]);
    }
}

std::uint16_t compute_checksum(const std::uint8_t* data, std::size_t size) noexcept {
    ChecksumAccumulator acc;
    acc.add(data, size);
    return acc.value();
}

std::uint16_t compute_checksum(const std::vector<std::uint8_t>& bytes) noexcept {
    return compute_checksum(bytes.data(), bytes.size());
}

bool verify_checksum(const std::uint8_t* data, std::size_t size, std::uint16_t expected) noexcept {
    return compute_checksum(data, size) == expected;
}

bool verify_checksum(const std::vector<std::uint8_t>& bytes, std::uint16_t expected) noexcept {
    return verify_checksum(bytes.data(), bytes.size(), expected);
}

} // namespace tivar
