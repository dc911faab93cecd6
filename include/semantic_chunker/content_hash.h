#pragma once

#include <string>

namespace semantic_chunker {

// Lowercase hex MD5 digest of `content`; used as the deterministic chunk id.
// Throws std::runtime_error if the digest cannot be computed.
std::string content_hash(const std::string& content);

} // namespace semantic_chunker
