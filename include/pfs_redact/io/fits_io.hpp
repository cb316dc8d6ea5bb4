#pragma once

#include "pfs_redact/core/configuration_set.hpp"
#include "pfs_redact/core/types.hpp"

namespace pfs_redact::io {

/**
 * Read a pfsDesign or pfsConfig file. The primary header supplies the
 * header metadata, the DESIGN table one row per fiber and the optional
 * PHOTOMETRY table one row per (fiber, band).
 */
ConfigurationSet read_configuration_set(const fs::path& path);

// Writes the same layout read_configuration_set() reads. Overwrites path.
void write_configuration_set(const fs::path& path, const ConfigurationSet& set);

} // namespace pfs_redact::io
