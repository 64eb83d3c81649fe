/**
 * @file secret.hpp
 * @author Ruan Formigoni
 * @brief Encrypted variable files
 *
 * A secret is ASCII text with the fields separated by '$':
 *
 * ```
 * $caerbannog$1$<salt>$<nonce>$<tag>$<ciphertext>
 * ```
 *
 * Salt, nonce, tag and ciphertext are base64 encoded. The key is derived with scrypt from the
 * password and the base64 text of the salt, the payload is sealed with AES-256-GCM. Whitespace is
 * ignored when decrypting, so a secret may be wrapped.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdint>
#include <format>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>

#include "../std/expected.hpp"
#include "../std/string.hpp"

/**
 * @namespace ns_secret
 * @brief Encryption of variable files and the password they are protected with
 */
namespace ns_secret
{

constexpr std::string_view HEADER = "caerbannog";
constexpr std::string_view VERSION = "1";
constexpr std::string_view MARKER = "$caerbannog$";

constexpr size_t SIZE_SALT = 32;
constexpr size_t SIZE_KEY = 32;
constexpr size_t SIZE_NONCE = 16;
constexpr size_t SIZE_TAG = 16;
constexpr size_t WIDTH_PRETTY = 80;

/**
 * @brief Cost parameters of scrypt
 */
struct KdfParams
{
  uint64_t n = uint64_t{1} << 20;
  uint64_t r = 8;
  uint64_t p = 1;
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// Encoding {{{

/**
 * @brief Last error of the OpenSSL error queue
 */
[[nodiscard]] inline std::string openssl_error()
{
  char buf[256]{};
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  return buf;
}

[[nodiscard]] inline std::string base64_encode(std::string_view bytes)
{
  std::string ret(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(ret.data())
    , reinterpret_cast<unsigned char const*>(bytes.data())
    , static_cast<int>(bytes.size())
  );
  ret.resize(static_cast<size_t>(length));
  return ret;
}

[[nodiscard]] inline Value<std::string> base64_decode(std::string_view text)
{
  return_if(text.size() % 4 != 0, Error("E::Invalid base64 length {}", text.size()));
  return_if(text.empty(), std::string{});
  std::string ret(text.size() / 4 * 3, '\0');
  int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(ret.data())
    , reinterpret_cast<unsigned char const*>(text.data())
    , static_cast<int>(text.size())
  );
  return_if(length < 0, Error("E::Invalid base64 text"));
  // EVP_DecodeBlock keeps the bytes of the padding
  size_t padding = text.ends_with("==")? 2 : text.ends_with("=")? 1 : 0;
  ret.resize(static_cast<size_t>(length) - padding);
  return ret;
}

[[nodiscard]] inline Value<std::string> random_bytes(size_t size)
{
  std::string ret(size, '\0');
  return_if(RAND_bytes(reinterpret_cast<unsigned char*>(ret.data()), static_cast<int>(size)) != 1
    , Error("E::Could not generate random bytes: {}", openssl_error())
  );
  return ret;
}

// }}}

// Key derivation {{{

/**
 * @brief Derives the key of a secret
 *
 * @param password The password of the secret
 * @param salt The base64 text of the salt
 * @param params The scrypt cost
 * @return Value<std::string> The key or the respective error
 */
[[nodiscard]] inline Value<std::string> derive_key(std::string_view password
  , std::string_view salt
  , KdfParams const& params)
{
  std::string key(SIZE_KEY, '\0');
  uint64_t maxmem = 128 * params.r * (params.n + params.p + 2) + (uint64_t{1} << 20);
  int ret = EVP_PBE_scrypt(password.data(), password.size()
    , reinterpret_cast<unsigned char const*>(salt.data()), salt.size()
    , params.n, params.r, params.p, maxmem
    , reinterpret_cast<unsigned char*>(key.data()), key.size()
  );
  return_if(ret != 1, Error("E::Could not derive key: {}", openssl_error()));
  return key;
}

/**
 * @brief Keys derived during a run
 *
 * Derivation is slow on purpose, the variable files of a run are usually encrypted with the same
 * password. Keys are looked up by password and salt.
 */
class KeyCache
{
  private:
    KdfParams m_params;
    std::map<std::pair<std::string,std::string>,std::string> m_keys;

  public:
    explicit KeyCache(KdfParams params = {})
      : m_params(params)
      , m_keys()
    {}

    [[nodiscard]] Value<std::string> key(std::string const& password, std::string const& salt)
    {
      auto it = m_keys.find({password, salt});
      return_if(it != m_keys.end(), it->second);
      std::string key = Pop(derive_key(password, salt, m_params));
      m_keys.emplace(std::make_pair(password, salt), key);
      return key;
    }

    [[nodiscard]] KdfParams const& params() const { return m_params; }
    [[nodiscard]] size_t size() const { return m_keys.size(); }
};

// }}}

// Cipher {{{

struct Sealed
{
  std::string nonce;
  std::string tag;
  std::string ciphertext;
};

[[nodiscard]] inline Value<Sealed> seal(std::string_view key, std::string_view plaintext)
{
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  return_if(not ctx, Error("E::Could not create cipher context: {}", openssl_error()));
  Sealed sealed;
  sealed.nonce = Pop(random_bytes(SIZE_NONCE));
  sealed.tag.resize(SIZE_TAG);
  sealed.ciphertext.resize(plaintext.size());
  int length = 0;
  return_if(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
    , Error("E::Could not initialize cipher: {}", openssl_error())
  );
  return_if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(SIZE_NONCE), nullptr) != 1
    , Error("E::Could not set nonce length: {}", openssl_error())
  );
  return_if(EVP_EncryptInit_ex(ctx.get()
      , nullptr
      , nullptr
      , reinterpret_cast<unsigned char const*>(key.data())
      , reinterpret_cast<unsigned char const*>(sealed.nonce.data())) != 1
    , Error("E::Could not set key: {}", openssl_error())
  );
  return_if(EVP_EncryptUpdate(ctx.get()
      , reinterpret_cast<unsigned char*>(sealed.ciphertext.data())
      , &length
      , reinterpret_cast<unsigned char const*>(plaintext.data())
      , static_cast<int>(plaintext.size())) != 1
    , Error("E::Could not encrypt: {}", openssl_error())
  );
  int length_final = 0;
  return_if(EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(sealed.ciphertext.data()) + length, &length_final) != 1
    , Error("E::Could not finish encryption: {}", openssl_error())
  );
  sealed.ciphertext.resize(static_cast<size_t>(length + length_final));
  return_if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(SIZE_TAG), sealed.tag.data()) != 1
    , Error("E::Could not read authentication tag: {}", openssl_error())
  );
  return sealed;
}

[[nodiscard]] inline Value<std::string> open(std::string_view key, Sealed sealed)
{
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  return_if(not ctx, Error("E::Could not create cipher context: {}", openssl_error()));
  return_if(sealed.tag.size() != SIZE_TAG, Error("E::Invalid authentication tag size {}", sealed.tag.size()));
  std::string plaintext(sealed.ciphertext.size(), '\0');
  int length = 0;
  return_if(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
    , Error("E::Could not initialize cipher: {}", openssl_error())
  );
  return_if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(sealed.nonce.size()), nullptr) != 1
    , Error("E::Could not set nonce length: {}", openssl_error())
  );
  return_if(EVP_DecryptInit_ex(ctx.get()
      , nullptr
      , nullptr
      , reinterpret_cast<unsigned char const*>(key.data())
      , reinterpret_cast<unsigned char const*>(sealed.nonce.data())) != 1
    , Error("E::Could not set key: {}", openssl_error())
  );
  return_if(EVP_DecryptUpdate(ctx.get()
      , reinterpret_cast<unsigned char*>(plaintext.data())
      , &length
      , reinterpret_cast<unsigned char const*>(sealed.ciphertext.data())
      , static_cast<int>(sealed.ciphertext.size())) != 1
    , Error("E::Could not decrypt: {}", openssl_error())
  );
  return_if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(SIZE_TAG), sealed.tag.data()) != 1
    , Error("E::Could not set authentication tag: {}", openssl_error())
  );
  int length_final = 0;
  return_if(EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + length, &length_final) != 1
    , Error("E::Could not decrypt secret, wrong password or corrupted content")
  );
  plaintext.resize(static_cast<size_t>(length + length_final));
  return plaintext;
}

// }}}

/**
 * @brief True if the text is a secret
 */
[[nodiscard]] inline bool is_secret(std::string_view text)
{
  return text.starts_with(MARKER);
}

/**
 * @brief Encrypts bytes into a secret
 *
 * @param plaintext The bytes to protect
 * @param password The password the key is derived from
 * @param pretty Whether to break the line after the version and wrap the fields at 80 columns
 * @param params The scrypt cost
 * @return Value<std::string> The secret or the respective error
 */
[[nodiscard]] inline Value<std::string> encrypt(std::string_view plaintext
  , std::string_view password
  , bool pretty = true
  , KdfParams const& params = {})
{
  std::string salt = base64_encode(Pop(random_bytes(SIZE_SALT)));
  std::string key = Pop(derive_key(password, salt, params));
  Sealed sealed = Pop(seal(key, plaintext));
  std::string message = std::format("{}${}${}${}"
    , salt
    , base64_encode(sealed.nonce)
    , base64_encode(sealed.tag)
    , base64_encode(sealed.ciphertext)
  );
  if (not pretty)
  {
    return std::format("{}{}${}", MARKER, VERSION, message);
  }
  return std::format("{}{}$\n{}", MARKER, VERSION, ns_string::from_container(ns_string::chunks(message, WIDTH_PRETTY), "\n"));
}

/**
 * @brief Decrypts a secret
 *
 * @param secret The text of the secret, whitespace is ignored
 * @param password The password the secret was encrypted with
 * @param cache Keys derived before, the key of this secret is added to it
 * @return Value<std::string> The plaintext or the respective error
 */
[[nodiscard]] inline Value<std::string> decrypt(std::string_view secret
  , std::string const& password
  , KeyCache& cache)
{
  std::vector<std::string> sections = ns_string::split(ns_string::remove_whitespace(secret), '$');
  return_if(sections.size() != 7, Error("E::Unknown secret format"));
  return_if(sections[1] != HEADER, Error("E::Unknown secret format"));
  return_if(sections[2] != VERSION, Error("E::Unknown secret format version: '{}'", sections[2]));
  Sealed sealed;
  sealed.nonce = Pop(base64_decode(sections[4]), "E::Invalid nonce");
  sealed.tag = Pop(base64_decode(sections[5]), "E::Invalid authentication tag");
  sealed.ciphertext = Pop(base64_decode(sections[6]), "E::Invalid ciphertext");
  std::string key = Pop(cache.key(password, sections[3]));
  return open(key, std::move(sealed));
}

[[nodiscard]] inline Value<std::string> decrypt(std::string_view secret
  , std::string const& password
  , KdfParams const& params = {})
{
  KeyCache cache(params);
  return decrypt(secret, password, cache);
}

} // namespace ns_secret

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
