/*
 * safedl/src/downloader/integrity_verifier.cpp
 *
 * Checksum verification via OpenSSL EVP
 * - Streaming digests for sha256, sha512 (strong) and sha1, md5 (legacy)
 * - computeFileDigest() reads in 64 KiB chunks (constant memory)
 * - verifyFile() compares case-insensitively; a mismatch is an outcome, not an error
 * - parseChecksum() validates "<algo>:<hex>" strings
 */

#include <safedl/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace safedl::downloader {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Md5:
            return EVP_md5();
    }
    return nullptr;
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() = default;
    ~OpenSslIntegrityVerifier() override = default;

    Result<void> reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(algo);
        _ctx = EvpMdCtx{};
        _ready = false;
        if (!_ctx || !_md) {
            return Error{ErrorCode::NotSupported,
                         std::string("Digest unavailable: ") + hashAlgoName(algo)};
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            _ctx = EvpMdCtx{};
            return Error{ErrorCode::Unknown,
                         std::string("EVP_DigestInit_ex failed for ") + hashAlgoName(algo)};
        }
        _ready = true;
        return Result<void>();
    }

    void update(ByteSpan data) override {
        if (!_ready || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            _failed = true;
        }
    }

    Result<Checksum> finalize() override {
        if (!_ready) {
            return Error{ErrorCode::InvalidState, "Digest not initialized"};
        }
        _ready = false;
        if (_failed) {
            _failed = false;
            return Error{ErrorCode::Unknown, "EVP_DigestUpdate failed"};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            return Error{ErrorCode::Unknown, "EVP_DigestFinal_ex failed"};
        }
        return Checksum{_algo, to_hex_lower(md_buf.data(), md_len)};
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _ready{false};
    bool _failed{false};
};

} // namespace

std::optional<HashAlgo> parseHashAlgo(std::string_view name) {
    std::string n = to_lower(name);
    n.erase(std::remove(n.begin(), n.end(), '-'), n.end());
    if (n == "sha256")
        return HashAlgo::Sha256;
    if (n == "sha512")
        return HashAlgo::Sha512;
    if (n == "sha1")
        return HashAlgo::Sha1;
    if (n == "md5")
        return HashAlgo::Md5;
    return std::nullopt;
}

Result<ChecksumSpec> parseChecksum(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "Checksum must be '<algorithm>:<hex>': " + std::string(text)};
    }
    auto algo = parseHashAlgo(text.substr(0, colon));
    if (!algo) {
        return Error{ErrorCode::InvalidArgument,
                     "Unsupported checksum algorithm: " + std::string(text.substr(0, colon))};
    }
    std::string hex = to_lower(text.substr(colon + 1));
    if (hex.size() != digestHexLength(*algo)) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Expected ") + std::to_string(digestHexLength(*algo)) +
                         " hex digits for " + hashAlgoName(*algo) + ", got " +
                         std::to_string(hex.size())};
    }
    if (!std::all_of(hex.begin(), hex.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        return Error{ErrorCode::InvalidArgument, "Checksum contains non-hex characters"};
    }
    return ChecksumSpec{*algo, std::move(hex), false};
}

std::string formatChecksum(const ChecksumSpec& spec) {
    return std::string(hashAlgoName(spec.algo)) + ":" + spec.expectedHex;
}

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

Result<Checksum> computeFileDigest(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Error{ErrorCode::NotFound, "File to verify not found: " + path.string()};
        }
        return Error{ErrorCode::IoError, "Cannot open file to verify: " + path.string()};
    }

    OpenSslIntegrityVerifier verifier;
    if (auto r = verifier.reset(algo); !r) {
        return r.error();
    }

    std::vector<char> buf(kReadChunk);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got > 0) {
            verifier.update(
                ByteSpan(reinterpret_cast<const std::byte*>(buf.data()),
                         static_cast<std::size_t>(got)));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed while hashing " + path.string()};
    }
    return verifier.finalize();
}

Result<VerificationResult> verifyFile(const std::filesystem::path& path, HashAlgo algo,
                                      std::string_view expectedHex) {
    if (isWeakAlgorithm(algo)) {
        spdlog::warn("Verifying {} with weak digest algorithm {}", path.string(),
                     hashAlgoName(algo));
    }
    auto digest = computeFileDigest(path, algo);
    if (!digest) {
        return digest.error();
    }

    VerificationResult out;
    out.algo = algo;
    out.actualHex = std::move(digest.value().hex);
    out.matched = out.actualHex == to_lower(expectedHex);
    out.weakAlgorithm = isWeakAlgorithm(algo);
    return out;
}

} // namespace safedl::downloader
