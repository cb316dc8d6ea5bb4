#pragma once

#include "pfs_redact/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace pfs_redact::io {

// How the input identifier on the command line is to be read
enum class IdentifierKind {
    DECIMAL,   // 5734893949501672337
    HEX,       // 0x4f966fa98c958b91
    FILENAME   // pfsDesign-0x4f966fa98c958b91.fits
};

// Throws InputError for malformed or out-of-range numbers.
uint64_t parse_design_id(const std::string& text, IdentifierKind kind);

std::string design_filename(uint64_t design_id);
std::string config_filename(uint64_t design_id, int visit);

/**
 * Resolve an identifier to the input file path under indir.
 * Design IDs resolve to pfsConfig-0x%016x-%06d.fits when a visit is
 * given and to pfsDesign-0x%016x.fits otherwise.
 */
fs::path resolve_input_path(const std::string& identifier, IdentifierKind kind,
                            const fs::path& indir, std::optional<int> visit);

// <stem of input>_<proposal ID>.fits. Throws InputError for an empty proposal
// ID or one containing a path separator.
std::string output_filename(const fs::path& input_path, const std::string& proposal_id);

} // namespace pfs_redact::io
