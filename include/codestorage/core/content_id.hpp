#pragma once

#include <functional>
#include <string>

namespace codestorage {

/**
 * @brief Produces the opaque identifier that ties a file entry in the commit
 *        metadata to its blob_chunk frames
 *
 * Injected into the commit builder; tests supply deterministic generators.
 */
using ContentIdGenerator = std::function<std::string()>;

/**
 * @brief RFC 4122 version 4 UUID drawn from the OpenSSL CSPRNG
 *
 * Falls back to fallback_content_id() when the CSPRNG cannot produce bytes.
 */
std::string random_content_id();

/**
 * @brief Non-cryptographic "cid-<time36>-<random36>" identifier
 *
 * Only suitable for correlating frames within one request.
 */
std::string fallback_content_id();

ContentIdGenerator default_content_id_generator();

} // namespace codestorage
