/***
 * Name: pytdc::support::Md5Hex
 * Purpose: Hex MD5 digest of a byte string.
 * Inputs:
 *   - data: bytes to digest
 * Outputs:
 *   - out: 32 lowercase hex characters on success
 *   - err: error message on failure
 * Theory of Operation: EVP_MD_CTX init/update/final with EVP_md5(); the
 *   context is released on every path.
 */
#include "pytdc/support/digest.h"

#include <openssl/evp.h>

#include <memory>
#include <string>

namespace pytdc {
namespace support {

namespace {
struct MdCtxFree {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
constexpr const char* kHexDigits = "0123456789abcdef";
}  // namespace

bool Md5Hex(const std::string& data, std::string& out, std::string& err) {
  const std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    err = "failed to allocate digest context";
    return false;
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1
      || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
      || EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    err = "md5 digest failed";
    return false;
  }
  out.clear();
  out.reserve(static_cast<size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHexDigits[digest[i] >> 4U]);
    out.push_back(kHexDigits[digest[i] & 0x0FU]);
  }
  return true;
}

}  // namespace support
}  // namespace pytdc
