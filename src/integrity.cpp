#include "depver/integrity.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace depver {

namespace {

constexpr std::array<HashAlgorithm, 3> kAlgorithms{
    HashAlgorithm::Sha256, HashAlgorithm::Sha384, HashAlgorithm::Sha512};

std::optional<std::string> NormalizeHex(std::string_view hex) {
    std::string out;
    out.reserve(hex.size());
    for (char c : hex) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc)) return std::nullopt;
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

std::optional<HashAlgorithm> AlgorithmFromName(std::string_view name) {
    for (auto algo : kAlgorithms) {
        if (name == to_string(algo)) return algo;
    }
    return std::nullopt;
}

std::optional<HashAlgorithm> AlgorithmFromLength(std::size_t len) {
    for (auto algo : kAlgorithms) {
        if (len == hex_length(algo)) return algo;
    }
    return std::nullopt;
}

} // namespace

const char* to_string(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha384: return "sha384";
        case HashAlgorithm::Sha512: return "sha512";
    }
    return "unknown";
}

std::size_t hex_length(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::Sha256: return 64;
        case HashAlgorithm::Sha384: return 96;
        case HashAlgorithm::Sha512: return 128;
    }
    return 0;
}

std::optional<IntegrityHash> IntegrityHash::parse(std::string_view text) {
    std::optional<HashAlgorithm> algo;
    std::string_view hex = text;

    const auto sep = text.find_first_of(":-");
    if (sep != std::string_view::npos) {
        algo = AlgorithmFromName(text.substr(0, sep));
        if (!algo) return std::nullopt;
        hex = text.substr(sep + 1);
        if (hex.size() != hex_length(*algo)) return std::nullopt;
    } else {
        algo = AlgorithmFromLength(hex.size());
        if (!algo) return std::nullopt;
    }

    auto digest = NormalizeHex(hex);
    if (!digest) return std::nullopt;
    return IntegrityHash(*algo, std::move(*digest));
}

std::string IntegrityHash::to_string() const {
    return std::string(depver::to_string(algo_)) + ":" + digest_;
}

} // namespace depver
