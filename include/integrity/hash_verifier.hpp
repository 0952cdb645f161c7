#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace arcstream::integrity {

enum class HashAlgorithm {
    Sha256,
    Sha512
};

const char* algorithmName(HashAlgorithm algorithm) noexcept;

struct SidecarDigest {
    std::string digest;
    std::string originalName;
};

// Incremental digest over OpenSSL EVP.
class HashVerifier {
public:
    explicit HashVerifier(HashAlgorithm algorithm = HashAlgorithm::Sha256);
    ~HashVerifier();

    HashVerifier(const HashVerifier&) = delete;
    HashVerifier& operator=(const HashVerifier&) = delete;

    void update(const void* data, std::size_t size);
    // Returns the lowercase hex digest and resets for reuse.
    std::string finish();

    HashAlgorithm algorithm() const noexcept;

private:
    struct Context;

    void reset();

    HashAlgorithm algorithm_;
    std::unique_ptr<Context> context_;
};

std::string digest(std::istream& input, HashAlgorithm algorithm, std::size_t chunkSize);
std::string digestFile(const std::filesystem::path& path, HashAlgorithm algorithm, std::size_t chunkSize);

bool digestsMatch(const std::string& expected, const std::string& actual);

// "<archive>.sha256" for SHA-256, "<archive>.sha512" for SHA-512.
std::filesystem::path sidecarPathFor(const std::filesystem::path& archive,
                                     HashAlgorithm algorithm = HashAlgorithm::Sha256);

void writeSidecar(const SidecarDigest& sidecar, const std::filesystem::path& path);

// nullopt when the sidecar does not exist; throws std::runtime_error when it
// exists but cannot be read or parsed.
std::optional<SidecarDigest> readSidecar(const std::filesystem::path& path);

} // namespace arcstream::integrity
