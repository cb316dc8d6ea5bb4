#include "pfs_redact/io/identifier.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/core/utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace pfs_redact::io {

uint64_t parse_design_id(const std::string& text, IdentifierKind kind) {
    std::string s = core::trim(text);
    int base = 10;
    if (kind == IdentifierKind::HEX) {
        base = 16;
        if (core::starts_with(core::to_lower(s), "0x")) {
            s = s.substr(2);
        }
    } else if (kind != IdentifierKind::DECIMAL) {
        throw InputError("a filename is not a design ID: " + text);
    }

    if (s.empty() || s[0] == '-' || s[0] == '+') {
        throw InputError("invalid design ID: '" + text + "'");
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(s.c_str(), &end, base);
    if (errno == ERANGE) {
        throw InputError("design ID out of range: '" + text + "'");
    }
    if (end == s.c_str() || *end != '\0') {
        throw InputError("invalid design ID: '" + text + "'");
    }
    return static_cast<uint64_t>(value);
}

std::string design_filename(uint64_t design_id) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "pfsDesign-0x%016llx.fits",
                  static_cast<unsigned long long>(design_id));
    return buf;
}

std::string config_filename(uint64_t design_id, int visit) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "pfsConfig-0x%016llx-%06d.fits",
                  static_cast<unsigned long long>(design_id), visit);
    return buf;
}

fs::path resolve_input_path(const std::string& identifier, IdentifierKind kind,
                            const fs::path& indir, std::optional<int> visit) {
    if (kind == IdentifierKind::FILENAME) {
        return indir / identifier;
    }

    uint64_t design_id = parse_design_id(identifier, kind);
    if (visit) {
        return indir / config_filename(design_id, *visit);
    }
    return indir / design_filename(design_id);
}

std::string output_filename(const fs::path& input_path, const std::string& proposal_id) {
    if (proposal_id.empty() || proposal_id.find_first_of("/\\") != std::string::npos ||
        proposal_id.find('\0') != std::string::npos) {
        throw InputError("proposal ID cannot be used in a file name: '" + proposal_id + "'");
    }
    return input_path.stem().string() + "_" + proposal_id + ".fits";
}

} // namespace pfs_redact::io
