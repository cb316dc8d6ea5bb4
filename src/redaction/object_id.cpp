#include "pfs_redact/redaction/object_id.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/core/utils.hpp"

#include <limits>

namespace pfs_redact::redaction {

int64_t hashed_obj_id(int cat_id, int64_t obj_id, const std::string& secret_salt) {
    if (secret_salt.empty()) {
        throw ConfigError("secret salt must be provided for hashed object IDs");
    }

    const std::string input =
        secret_salt + std::to_string(cat_id) + ":" + std::to_string(obj_id);
    const auto digest = core::sha256_digest(input);

    uint64_t value = 0;
    for (int b = 7; b >= 0; --b) {
        value = (value << 8) | digest[static_cast<size_t>(b)];
    }

    const auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return static_cast<int64_t>(value % max);
}

} // namespace pfs_redact::redaction
