#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pfs_redact::core {

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Hash utilities
std::vector<uint8_t> sha256_digest(const std::string& data);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);

} // namespace pfs_redact::core
