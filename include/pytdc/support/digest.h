/***
 * Name: pytdc::support (digest)
 * Purpose: Content digests used to name anonymous modules.
 * Inputs: Arbitrary bytes
 * Outputs: Lowercase hex digest string
 * Theory of Operation: OpenSSL EVP one-shot digest; the module name of an
 *   unnamed parse is the MD5 of its source text.
 */
#pragma once

#include <string>

namespace pytdc {
namespace support {

/*** Md5Hex: 32 lowercase hex characters, or false with err set. */
bool Md5Hex(const std::string& data, std::string& out, std::string& err);

}  // namespace support
}  // namespace pytdc
