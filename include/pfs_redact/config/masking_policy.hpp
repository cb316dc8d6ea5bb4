#pragma once

#include "pfs_redact/core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace pfs_redact::config {

namespace fs = std::filesystem;

// Fiber fields that can be overwritten on a masked row. objId is handled
// by ObjIdStrategy, flux and filter columns by the flux settings.
enum class MaskField {
  CAT_ID,
  TRACT,
  PATCH,
  RA,
  DEC,
  PM_RA,
  PM_DEC,
  PARALLAX,
  PROPOSAL_ID,
  OB_CODE,
  PFI_NOMINAL,
  PFI_CENTER,
  TARGET_TYPE
};

enum class MaskValueKind { INTEGER, REAL, STRING, POINT, TARGET_TYPE };

using MaskValue =
    std::variant<int64_t, double, std::string, PfiPoint, TargetType>;

using FieldOverrideMap = std::map<MaskField, MaskValue>;

std::string mask_field_to_string(MaskField field);
std::optional<MaskField> string_to_mask_field(const std::string &s);
MaskValueKind mask_field_kind(MaskField field);
MaskValueKind mask_value_kind(const MaskValue &value);
std::string mask_value_kind_to_string(MaskValueKind kind);

FieldOverrideMap default_field_overrides(int cat_id_override);

enum class ObjIdStrategy {
  SALTED_HASH,      // one-way hash of (catId, objId), needs a secret salt
  NEGATED_FIBER_ID  // -fiberId
};

std::string obj_id_strategy_to_string(ObjIdStrategy strategy);
std::optional<ObjIdStrategy> string_to_obj_id_strategy(const std::string &s);

struct MaskingPolicy {
  int cat_id_override = 9000;
  // Entries replace the matching default_field_overrides(cat_id_override)
  // values; fields not listed keep their defaults.
  std::optional<FieldOverrideMap> field_overrides;
  std::vector<FluxField> flux_fields{all_flux_fields().begin(),
                                     all_flux_fields().end()};
  double flux_fill = std::numeric_limits<double>::quiet_NaN();
  std::string filter_fill = "none";

  ObjIdStrategy obj_id_strategy = ObjIdStrategy::SALTED_HASH;
  std::optional<std::string> secret_salt;

  int workers = 1;  // 0 = hardware concurrency
  int64_t sequence_start = 0;

  FieldOverrideMap effective_overrides() const;

  static MaskingPolicy load(const fs::path &path);
  static MaskingPolicy from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  // The secret salt is never serialized.
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace pfs_redact::config
