#include "evp_digest.hpp"
#include "factories.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace qkdsim {

namespace {

const EVP_MD *evp_md_for(HashAlgorithm alg) {
    switch (alg) {
    case HashAlgorithm::SHA2_256: return EVP_sha256();
    case HashAlgorithm::SHA3_256: return EVP_sha3_256();
    }
    return nullptr;
}

} // namespace

std::size_t EvpDigestProvider::digest_size() const {
    const EVP_MD *md = evp_md_for(alg_);
    if (!md) {
        throw DigestError("digest algorithm unavailable: " + hash_algorithm_to_string(alg_));
    }
    return static_cast<std::size_t>(EVP_MD_size(md));
}

Digest EvpDigestProvider::digest(const std::vector<std::uint8_t> &msg) {
    const EVP_MD *md = evp_md_for(alg_);
    if (!md) {
        throw DigestError("digest algorithm unavailable: " + hash_algorithm_to_string(alg_));
    }

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw DigestError("EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx, msg.data(), msg.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw DigestError(hash_algorithm_to_string(alg_) + " digest initialization failed");
    }

    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw DigestError(hash_algorithm_to_string(alg_) + " digest finalization failed");
    }
    EVP_MD_CTX_free(ctx);

    out.resize(len);
    Digest d;
    d.algorithm = alg_;
    d.bytes = std::move(out);
    return d;
}

std::unique_ptr<DigestProvider> make_sha256_digest_provider() {
    return std::make_unique<EvpDigestProvider>(HashAlgorithm::SHA2_256);
}

std::unique_ptr<DigestProvider> make_sha3_256_digest_provider() {
    return std::make_unique<EvpDigestProvider>(HashAlgorithm::SHA3_256);
}

std::unique_ptr<DigestProvider> make_digest_provider(HashAlgorithm alg) {
    switch (alg) {
    case HashAlgorithm::SHA2_256: return make_sha256_digest_provider();
    case HashAlgorithm::SHA3_256: return make_sha3_256_digest_provider();
    }
    throw std::invalid_argument("unsupported digest algorithm");
}

} // namespace qkdsim
