#include <paulette/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace paulette::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

using compact_signature_t = std::array<uint8_t, 64>;

bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const paulette::schema::bytes_view_t& signature,
                   const paulette::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

evp_pkey_ptr make_secp256k1_key(
    const paulette::schema::secp256k1_signer_id& signer) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }

  auto public_key = signer.public_key;
  char group_name[] = "secp256k1";
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group_name,
                                       0),
      OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                        public_key.data(), public_key.size()),
      OSSL_PARAM_construct_end()};

  EVP_PKEY* raw_key{nullptr};
  if (EVP_PKEY_fromdata(ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return none;
  }
  return evp_pkey_ptr{raw_key, EVP_PKEY_free};
}

// 65-byte secp256k1 signatures carry a recovery byte at either end:
// [v || r || s] or [r || s || v], with v in 0..3 or 27 and above.
std::optional<compact_signature_t> strip_recovery_id(
    const paulette::schema::secp256k1_signature_t& signature) {
  const auto is_recovery_id = [](const uint8_t value) {
    return value <= 3 || value >= 27;
  };
  auto compact = compact_signature_t{};
  if (is_recovery_id(signature.front())) {
    std::copy(std::next(std::begin(signature)), std::end(signature),
              std::begin(compact));
    return compact;
  }
  if (is_recovery_id(signature.back())) {
    std::copy(std::begin(signature), std::prev(std::end(signature)),
              std::begin(compact));
    return compact;
  }
  return std::nullopt;
}

std::optional<paulette::schema::bytes_t> to_der(
    const compact_signature_t& compact) {
  auto signature = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!signature || !r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(signature.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto length = i2d_ECDSA_SIG(signature.get(), nullptr);
  if (length <= 0) {
    return std::nullopt;
  }
  auto der = paulette::schema::bytes_t(static_cast<size_t>(length));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(signature.get(), &cursor) != length) {
    return std::nullopt;
  }
  return der;
}

bool verify_ed25519(const paulette::schema::bytes_view_t& message,
                    const paulette::schema::ed25519_signer_id& signer,
                    const paulette::schema::ed25519_signature_t& signature) {
  auto key =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!key) {
    return false;
  }
  return digest_verify(key.get(), nullptr,
                       paulette::schema::bytes_view_t{signature}, message);
}

bool verify_secp256k1(const paulette::schema::bytes_view_t& message,
                      const paulette::schema::secp256k1_signer_id& signer,
                      const paulette::schema::secp256k1_signature_t& signature) {
  auto compact = strip_recovery_id(signature);
  if (!compact) {
    return false;
  }
  auto der = to_der(*compact);
  if (!der) {
    return false;
  }
  auto key = make_secp256k1_key(signer);
  if (!key) {
    return false;
  }
  return digest_verify(key.get(), EVP_sha256(),
                       paulette::schema::bytes_view_t{der->data(), der->size()},
                       message);
}

}  // namespace

bool available() {
  static const auto supported = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return supported;
}

bool verify_signature(const paulette::schema::bytes_view_t& message,
                      const paulette::schema::signer_id_t& signer,
                      const paulette::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const paulette::schema::ed25519_signer_id& value) {
            const auto* bytes =
                std::get_if<paulette::schema::ed25519_signature_t>(&signature);
            return bytes != nullptr && verify_ed25519(message, value, *bytes);
          },
          [&](const paulette::schema::secp256k1_signer_id& value) {
            const auto* bytes =
                std::get_if<paulette::schema::secp256k1_signature_t>(
                    &signature);
            return bytes != nullptr && verify_secp256k1(message, value, *bytes);
          },
          [](const paulette::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace paulette::crypto
