#pragma once

#include <cstdint>
#include <string>

namespace pfs_redact::redaction {

/**
 * Replacement objId for a masked fiber: SHA-256 over
 * salt + catId + ":" + objId, first 8 digest bytes read little-endian and
 * reduced modulo INT64_MAX. Throws ConfigError for an empty salt.
 */
int64_t hashed_obj_id(int cat_id, int64_t obj_id, const std::string& secret_salt);

inline int64_t negated_fiber_id(int fiber_id) {
    return -static_cast<int64_t>(fiber_id);
}

} // namespace pfs_redact::redaction
