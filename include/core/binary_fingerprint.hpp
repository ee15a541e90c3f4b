#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Fixed-length bit sequence produced by a perceptual hash.
 *
 * Rendered either as a '0'/'1' string (storage/transport) or as bytes packed
 * MSB-first. Comparing fingerprints of different lengths is a programming
 * error and throws std::invalid_argument.
 */
class BinaryFingerprint
{
public:
    BinaryFingerprint() = default;
    explicit BinaryFingerprint(std::vector<bool> bits) : bits_(std::move(bits)) {}

    /**
     * @brief Parse a '0'/'1' string
     * @throws std::invalid_argument on any other character
     */
    static BinaryFingerprint fromString(const std::string &bit_string);

    /**
     * @brief Unpack the first bit_count bits of MSB-first packed bytes
     * @throws std::invalid_argument if the buffer holds fewer than bit_count bits
     */
    static BinaryFingerprint fromBytes(const std::vector<uint8_t> &bytes, size_t bit_count);

    /**
     * @brief Join fingerprints end to end, preserving order
     */
    static BinaryFingerprint concatenate(const std::vector<BinaryFingerprint> &parts);

    size_t size() const { return bits_.size(); }
    bool empty() const { return bits_.empty(); }
    bool bit(size_t index) const { return bits_.at(index); }
    const std::vector<bool> &bits() const { return bits_; }

    std::string toString() const;
    std::vector<uint8_t> toBytes() const;

    /**
     * @brief Number of differing bit positions
     * @throws std::invalid_argument if lengths differ
     */
    int hammingDistance(const BinaryFingerprint &other) const;

    /**
     * @brief Bitwise XOR of two equal-length fingerprints
     * @throws std::invalid_argument if lengths differ
     */
    BinaryFingerprint xorWith(const BinaryFingerprint &other) const;

    bool operator==(const BinaryFingerprint &other) const { return bits_ == other.bits_; }
    bool operator!=(const BinaryFingerprint &other) const { return bits_ != other.bits_; }

private:
    void requireSameLength(const BinaryFingerprint &other, const char *operation) const;

    std::vector<bool> bits_;
};
