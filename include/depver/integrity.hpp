#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace depver {

enum class HashAlgorithm { Sha256, Sha384, Sha512 };

const char* to_string(HashAlgorithm algo);

// Hex digest length for the algorithm (64 / 96 / 128).
std::size_t hex_length(HashAlgorithm algo);

class IntegrityHash {
public:
    // Accepts "sha256:<hex>", "sha256-<hex>" and a bare hex digest whose
    // length selects the algorithm. Digest is lowercased.
    static std::optional<IntegrityHash> parse(std::string_view text);

    HashAlgorithm algorithm() const { return algo_; }
    const std::string& digest() const { return digest_; }

    // "<algo>:<hex>"
    std::string to_string() const;

    bool operator==(const IntegrityHash&) const = default;

private:
    IntegrityHash(HashAlgorithm algo, std::string digest)
        : algo_(algo), digest_(std::move(digest)) {}

    HashAlgorithm algo_;
    std::string digest_;
};

} // namespace depver
