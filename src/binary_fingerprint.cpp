#include "core/binary_fingerprint.hpp"
#include <stdexcept>

BinaryFingerprint BinaryFingerprint::fromString(const std::string &bit_string)
{
    std::vector<bool> bits;
    bits.reserve(bit_string.size());
    for (size_t i = 0; i < bit_string.size(); ++i)
    {
        char c = bit_string[i];
        if (c != '0' && c != '1')
        {
            throw std::invalid_argument("Invalid fingerprint character '" + std::string(1, c) +
                                        "' at position " + std::to_string(i));
        }
        bits.push_back(c == '1');
    }
    return BinaryFingerprint(std::move(bits));
}

BinaryFingerprint BinaryFingerprint::fromBytes(const std::vector<uint8_t> &bytes, size_t bit_count)
{
    if (bytes.size() * 8 < bit_count)
    {
        throw std::invalid_argument("Buffer of " + std::to_string(bytes.size()) + " bytes cannot hold " +
                                    std::to_string(bit_count) + " bits");
    }
    std::vector<bool> bits(bit_count);
    for (size_t i = 0; i < bit_count; ++i)
    {
        bits[i] = (bytes[i / 8] >> (7 - (i % 8))) & 1;
    }
    return BinaryFingerprint(std::move(bits));
}

BinaryFingerprint BinaryFingerprint::concatenate(const std::vector<BinaryFingerprint> &parts)
{
    std::vector<bool> bits;
    for (const auto &part : parts)
    {
        bits.insert(bits.end(), part.bits_.begin(), part.bits_.end());
    }
    return BinaryFingerprint(std::move(bits));
}

std::string BinaryFingerprint::toString() const
{
    std::string out;
    out.reserve(bits_.size());
    for (bool b : bits_)
    {
        out.push_back(b ? '1' : '0');
    }
    return out;
}

std::vector<uint8_t> BinaryFingerprint::toBytes() const
{
    std::vector<uint8_t> bytes((bits_.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits_.size(); ++i)
    {
        if (bits_[i])
        {
            bytes[i / 8] |= static_cast<uint8_t>(1 << (7 - (i % 8)));
        }
    }
    return bytes;
}

int BinaryFingerprint::hammingDistance(const BinaryFingerprint &other) const
{
    requireSameLength(other, "hamming distance");
    int distance = 0;
    for (size_t i = 0; i < bits_.size(); ++i)
    {
        if (bits_[i] != other.bits_[i])
            distance++;
    }
    return distance;
}

BinaryFingerprint BinaryFingerprint::xorWith(const BinaryFingerprint &other) const
{
    requireSameLength(other, "xor");
    std::vector<bool> bits(bits_.size());
    for (size_t i = 0; i < bits_.size(); ++i)
    {
        bits[i] = bits_[i] != other.bits_[i];
    }
    return BinaryFingerprint(std::move(bits));
}

void BinaryFingerprint::requireSameLength(const BinaryFingerprint &other, const char *operation) const
{
    if (bits_.size() != other.bits_.size())
    {
        throw std::invalid_argument(std::string("Cannot compute ") + operation + " of fingerprints with different lengths (" +
                                    std::to_string(bits_.size()) + " vs " + std::to_string(other.bits_.size()) + ")");
    }
}
