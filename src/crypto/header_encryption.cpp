#include "scapi/crypto/header_encryption.hpp"

#include <memory>
#include <vector>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/rsa.h>

#include "scapi/util/security.hpp"

namespace scapi::crypto {

namespace {

struct BignumDeleter {
  void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct ParamBuildDeleter {
  void operator()(OSSL_PARAM_BLD* bld) const { OSSL_PARAM_BLD_free(bld); }
};
struct ParamDeleter {
  void operator()(OSSL_PARAM* params) const { OSSL_PARAM_free(params); }
};
struct PkeyDeleter {
  void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using ParamBuildPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBuildDeleter>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, ParamDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

template<typename T>
Result<T> opensslError(const std::string& what) {
  std::string message = what;
  if (unsigned long code = ERR_get_error(); code != 0) {
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    message += ": ";
    message += buffer;
  }
  ERR_clear_error();
  return makeErrorResult<T>(ErrorCode::kEncryptionError, message);
}

BignumPtr bignumFromBytes(const std::string& bytes) {
  return BignumPtr(BN_bin2bn(reinterpret_cast<const unsigned char*>(bytes.data()),
                             static_cast<int>(bytes.size()), nullptr));
}

Result<PkeyPtr> importPublicKey(const model::PublicKeyResponse& key) {
  BignumPtr n = bignumFromBytes(key.modulus);
  BignumPtr e = bignumFromBytes(key.exponent);
  if (!n || !e) {
    return opensslError<PkeyPtr>("Failed to read public key components");
  }

  ParamBuildPtr builder(OSSL_PARAM_BLD_new());
  if (!builder ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_E, e.get())) {
    return opensslError<PkeyPtr>("Failed to build public key parameters");
  }

  ParamPtr params(OSSL_PARAM_BLD_to_param(builder.get()));
  if (!params) {
    return opensslError<PkeyPtr>("Failed to build public key parameters");
  }

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
    return opensslError<PkeyPtr>("Failed to initialize RSA key import");
  }

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0) {
    return opensslError<PkeyPtr>("Failed to import RSA public key");
  }
  return PkeyPtr(raw);
}

}  // namespace

Result<std::string> HeaderEncryption::encryptHeaderValue(
    std::string_view value, const std::optional<model::PublicKeyResponse>& key) {
  if (util::Security::isBlank(std::string(value))) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                        "Header value cannot be null or empty");
  }
  if (!key) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                        "Public key cannot be null");
  }

  auto pkey = importPublicKey(*key);
  if (!pkey) {
    return std::unexpected(pkey.error());
  }

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey->get(), nullptr));
  if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) {
    return opensslError<std::string>("Failed to initialize RSA encryption");
  }

  const auto* input = reinterpret_cast<const unsigned char*>(value.data());
  size_t out_len = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, input, value.size()) <= 0) {
    return opensslError<std::string>("Failed to size RSA ciphertext");
  }

  std::vector<unsigned char> ciphertext(out_len);
  if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &out_len, input, value.size()) <= 0) {
    return opensslError<std::string>("RSA encryption failed");
  }
  ciphertext.resize(out_len);

  return base64Encode(std::string_view(reinterpret_cast<const char*>(ciphertext.data()),
                                       ciphertext.size()));
}

std::string HeaderEncryption::base64Encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string encoded(4 * ((data.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

} // namespace scapi::crypto
