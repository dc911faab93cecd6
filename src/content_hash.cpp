#include "semantic_chunker/content_hash.h"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace semantic_chunker {

std::string content_hash(const std::string& content) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(content.data(), content.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed while hashing chunk text");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace semantic_chunker
