#include "integrity/hash_verifier.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace arcstream::integrity {

struct HashVerifier::Context {
    EVP_MD_CTX* ctx {nullptr};

    ~Context()
    {
        EVP_MD_CTX_free(ctx);
    }
};

namespace {

const EVP_MD* digestFor(HashAlgorithm algorithm)
{
    switch (algorithm) {
    case HashAlgorithm::Sha256:
        return EVP_sha256();
    case HashAlgorithm::Sha512:
        return EVP_sha512();
    }
    throw std::invalid_argument("Unsupported hash algorithm");
}

std::string toHex(const unsigned char* data, std::size_t size)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t index = 0; index < size; ++index) {
        hex.push_back(kDigits[data[index] >> 4U]);
        hex.push_back(kDigits[data[index] & 0x0FU]);
    }
    return hex;
}

bool isHexDigest(const std::string& value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

} // namespace

const char* algorithmName(HashAlgorithm algorithm) noexcept
{
    switch (algorithm) {
    case HashAlgorithm::Sha256:
        return "sha256";
    case HashAlgorithm::Sha512:
        return "sha512";
    }
    return "unknown";
}

HashVerifier::HashVerifier(HashAlgorithm algorithm)
    : algorithm_(algorithm)
    , context_(std::make_unique<Context>())
{
    context_->ctx = EVP_MD_CTX_new();
    if (context_->ctx == nullptr) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    reset();
}

HashVerifier::~HashVerifier() = default;

void HashVerifier::update(const void* data, std::size_t size)
{
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(context_->ctx, data, size) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string HashVerifier::finish()
{
    unsigned char buffer[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context_->ctx, buffer, &length) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }

    auto hex = toHex(buffer, length);
    reset();
    return hex;
}

HashAlgorithm HashVerifier::algorithm() const noexcept
{
    return algorithm_;
}

void HashVerifier::reset()
{
    if (EVP_DigestInit_ex(context_->ctx, digestFor(algorithm_), nullptr) != 1) {
        throw std::runtime_error(std::string("Failed to initialise ") + algorithmName(algorithm_) + " digest");
    }
}

std::string digest(std::istream& input, HashAlgorithm algorithm, std::size_t chunkSize)
{
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }

    HashVerifier verifier(algorithm);
    std::vector<char> buffer(chunkSize);
    while (true) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (input.bad()) {
            throw std::runtime_error("Failed to read data for hashing");
        }
        if (got == 0) {
            break;
        }
        verifier.update(buffer.data(), got);
    }
    return verifier.finish();
}

std::string digestFile(const std::filesystem::path& path, HashAlgorithm algorithm, std::size_t chunkSize)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for hashing: " + path.string());
    }
    return digest(input, algorithm, chunkSize);
}

bool digestsMatch(const std::string& expected, const std::string& actual)
{
    return expected.size() == actual.size()
        && std::equal(expected.begin(), expected.end(), actual.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

std::filesystem::path sidecarPathFor(const std::filesystem::path& archive, HashAlgorithm algorithm)
{
    auto sidecar = archive;
    sidecar += ".";
    sidecar += algorithmName(algorithm);
    return sidecar;
}

void writeSidecar(const SidecarDigest& sidecar, const std::filesystem::path& path)
{
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open digest file for writing: " + path.string());
    }

    output << sidecar.digest << "  " << sidecar.originalName << "\n";
    output.flush();
    if (!output) {
        throw std::runtime_error("Failed to write digest file: " + path.string());
    }
}

std::optional<SidecarDigest> readSidecar(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open digest file: " + path.string());
    }

    std::string line;
    std::getline(input, line);
    if (input.bad()) {
        throw std::runtime_error("Failed to read digest file: " + path.string());
    }

    std::istringstream fields(line);
    SidecarDigest sidecar {};
    fields >> sidecar.digest;
    if (!isHexDigest(sidecar.digest)) {
        throw std::runtime_error("Malformed digest file: " + path.string());
    }

    std::getline(fields >> std::ws, sidecar.originalName);
    return sidecar;
}

} // namespace arcstream::integrity
