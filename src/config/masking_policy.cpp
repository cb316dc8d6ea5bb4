#include "pfs_redact/config/masking_policy.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <set>

namespace pfs_redact::config {

namespace {

struct MaskFieldInfo {
    MaskField field;
    const char* name;
    MaskValueKind kind;
};

const MaskFieldInfo kMaskFields[] = {
    {MaskField::CAT_ID, "catId", MaskValueKind::INTEGER},
    {MaskField::TRACT, "tract", MaskValueKind::INTEGER},
    {MaskField::PATCH, "patch", MaskValueKind::STRING},
    {MaskField::RA, "ra", MaskValueKind::REAL},
    {MaskField::DEC, "dec", MaskValueKind::REAL},
    {MaskField::PM_RA, "pmRa", MaskValueKind::REAL},
    {MaskField::PM_DEC, "pmDec", MaskValueKind::REAL},
    {MaskField::PARALLAX, "parallax", MaskValueKind::REAL},
    {MaskField::PROPOSAL_ID, "proposalId", MaskValueKind::STRING},
    {MaskField::OB_CODE, "obCode", MaskValueKind::STRING},
    {MaskField::PFI_NOMINAL, "pfiNominal", MaskValueKind::POINT},
    {MaskField::PFI_CENTER, "pfiCenter", MaskValueKind::POINT},
    {MaskField::TARGET_TYPE, "targetType", MaskValueKind::TARGET_TYPE},
};

const MaskFieldInfo& field_info(MaskField field) {
    for (const auto& info : kMaskFields) {
        if (info.field == field) return info;
    }
    throw ConfigError("unknown mask field");
}

double read_real(const YAML::Node& n, const std::string& where) {
    if (!n.IsScalar()) {
        throw ConfigError(where + " must be a number");
    }
    try {
        return n.as<double>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(where + " must be a number, got '" + n.Scalar() + "'");
    }
}

int64_t read_integer(const YAML::Node& n, const std::string& where) {
    if (!n.IsScalar()) {
        throw ConfigError(where + " must be an integer");
    }
    try {
        return n.as<int64_t>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(where + " must be an integer, got '" + n.Scalar() + "'");
    }
}

bool fits_int32(int64_t v) {
    return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
}

// catId, tract and the runner counts land in 32-bit columns and fields.
int64_t read_int32(const YAML::Node& n, const std::string& where) {
    const int64_t v = read_integer(n, where);
    if (!fits_int32(v)) {
        throw ConfigError(where + " is out of 32-bit range: " + std::to_string(v));
    }
    return v;
}

std::string read_string(const YAML::Node& n, const std::string& where) {
    if (!n.IsScalar()) {
        throw ConfigError(where + " must be a string");
    }
    return n.as<std::string>();
}

MaskValue read_mask_value(MaskField field, const YAML::Node& n) {
    const std::string where = "masking.overrides." + mask_field_to_string(field);
    switch (mask_field_kind(field)) {
        case MaskValueKind::INTEGER:
            return read_int32(n, where);
        case MaskValueKind::REAL:
            return read_real(n, where);
        case MaskValueKind::STRING:
            return read_string(n, where);
        case MaskValueKind::POINT: {
            if (!n.IsSequence() || n.size() != 2) {
                throw ConfigError(where + " must be a sequence of two numbers");
            }
            return PfiPoint{read_real(n[0], where), read_real(n[1], where)};
        }
        case MaskValueKind::TARGET_TYPE: {
            if (!n.IsScalar()) {
                throw ConfigError(where + " must be a target type name or code");
            }
            auto by_name = string_to_target_type(n.Scalar());
            if (by_name) return *by_name;
            int code = 0;
            if (YAML::convert<int>::decode(n, code)) {
                auto by_code = int_to_target_type(code);
                if (by_code) return *by_code;
            }
            throw ConfigError(where + ": unknown target type '" + n.Scalar() + "'");
        }
    }
    throw ConfigError(where + ": unsupported value");
}

// NaN is written as the YAML literal so that it reads back as a double.
YAML::Node real_node(double v) {
    if (std::isnan(v)) return YAML::Node(".nan");
    return YAML::Node(v);
}

YAML::Node mask_value_node(const MaskValue& value) {
    YAML::Node n;
    if (auto i = std::get_if<int64_t>(&value)) {
        n = *i;
    } else if (auto d = std::get_if<double>(&value)) {
        n = real_node(*d);
    } else if (auto s = std::get_if<std::string>(&value)) {
        n = *s;
    } else if (auto p = std::get_if<PfiPoint>(&value)) {
        n.push_back(real_node((*p)[0]));
        n.push_back(real_node((*p)[1]));
    } else if (auto t = std::get_if<TargetType>(&value)) {
        n = target_type_to_string(*t);
    }
    return n;
}

} // namespace

std::string mask_field_to_string(MaskField field) {
    return field_info(field).name;
}

std::optional<MaskField> string_to_mask_field(const std::string& s) {
    for (const auto& info : kMaskFields) {
        if (s == info.name) return info.field;
    }
    return std::nullopt;
}

MaskValueKind mask_field_kind(MaskField field) {
    return field_info(field).kind;
}

MaskValueKind mask_value_kind(const MaskValue& value) {
    switch (value.index()) {
        case 0: return MaskValueKind::INTEGER;
        case 1: return MaskValueKind::REAL;
        case 2: return MaskValueKind::STRING;
        case 3: return MaskValueKind::POINT;
        default: return MaskValueKind::TARGET_TYPE;
    }
}

std::string mask_value_kind_to_string(MaskValueKind kind) {
    switch (kind) {
        case MaskValueKind::INTEGER: return "integer";
        case MaskValueKind::REAL: return "real";
        case MaskValueKind::STRING: return "string";
        case MaskValueKind::POINT: return "point";
        case MaskValueKind::TARGET_TYPE: return "target type";
        default: return "unknown";
    }
}

FieldOverrideMap default_field_overrides(int cat_id_override) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return {
        {MaskField::CAT_ID, static_cast<int64_t>(cat_id_override)},
        {MaskField::TRACT, int64_t{-1}},
        {MaskField::PATCH, std::string("-1,-1")},
        {MaskField::RA, -99.0},
        {MaskField::DEC, -99.0},
        {MaskField::PM_RA, 0.0},
        {MaskField::PM_DEC, 0.0},
        {MaskField::PARALLAX, 1.0e-7},
        {MaskField::PROPOSAL_ID, std::string("masked")},
        {MaskField::OB_CODE, std::string("masked")},
        {MaskField::PFI_NOMINAL, PfiPoint{nan, nan}},
        {MaskField::PFI_CENTER, PfiPoint{nan, nan}},
        {MaskField::TARGET_TYPE, TargetType::SCIENCE_MASKED},
    };
}

std::string obj_id_strategy_to_string(ObjIdStrategy strategy) {
    switch (strategy) {
        case ObjIdStrategy::SALTED_HASH: return "salted_hash";
        case ObjIdStrategy::NEGATED_FIBER_ID: return "negated_fiber_id";
        default: return "unknown";
    }
}

std::optional<ObjIdStrategy> string_to_obj_id_strategy(const std::string& s) {
    std::string norm = core::to_lower(core::trim(s));
    if (norm == "salted_hash") return ObjIdStrategy::SALTED_HASH;
    if (norm == "negated_fiber_id") return ObjIdStrategy::NEGATED_FIBER_ID;
    return std::nullopt;
}

FieldOverrideMap MaskingPolicy::effective_overrides() const {
    FieldOverrideMap merged = default_field_overrides(cat_id_override);
    if (field_overrides) {
        for (const auto& [field, value] : *field_overrides) {
            merged[field] = value;
        }
    }
    return merged;
}

MaskingPolicy MaskingPolicy::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Policy file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse policy file " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

MaskingPolicy MaskingPolicy::from_yaml(const YAML::Node& node) {
    MaskingPolicy policy;

    if (node["masking"]) {
        auto m = node["masking"];
        if (m["cat_id_override"]) {
            policy.cat_id_override =
                static_cast<int>(read_int32(m["cat_id_override"], "masking.cat_id_override"));
        }

        if (m["overrides"]) {
            auto o = m["overrides"];
            if (!o.IsMap()) {
                throw ConfigError("masking.overrides must be a mapping");
            }
            FieldOverrideMap overrides;
            for (const auto& kv : o) {
                const std::string key = kv.first.as<std::string>();
                auto field = string_to_mask_field(key);
                if (!field) {
                    throw ConfigError("masking.overrides: unknown field '" + key + "'");
                }
                overrides[*field] = read_mask_value(*field, kv.second);
            }
            policy.field_overrides = overrides;
        }

        if (m["flux_fields"]) {
            auto f = m["flux_fields"];
            if (!f.IsSequence()) {
                throw ConfigError("masking.flux_fields must be a sequence");
            }
            policy.flux_fields.clear();
            for (const auto& item : f) {
                const std::string name = read_string(item, "masking.flux_fields");
                auto field = string_to_flux_field(name);
                if (!field) {
                    throw ConfigError("masking.flux_fields: unknown field '" + name + "'");
                }
                policy.flux_fields.push_back(*field);
            }
        }

        if (m["flux_fill"]) policy.flux_fill = read_real(m["flux_fill"], "masking.flux_fill");
        if (m["filter_fill"]) policy.filter_fill = read_string(m["filter_fill"], "masking.filter_fill");
    }

    if (node["object_id"]) {
        auto o = node["object_id"];
        if (o["strategy"]) {
            const std::string name = read_string(o["strategy"], "object_id.strategy");
            auto strategy = string_to_obj_id_strategy(name);
            if (!strategy) {
                throw ConfigError("object_id.strategy: unknown strategy '" + name + "'");
            }
            policy.obj_id_strategy = *strategy;
        }
        if (o["salt"]) policy.secret_salt = read_string(o["salt"], "object_id.salt");
    }

    if (node["runner"]) {
        auto r = node["runner"];
        if (r["workers"]) policy.workers = static_cast<int>(read_int32(r["workers"], "runner.workers"));
        if (r["sequence_start"]) policy.sequence_start = read_integer(r["sequence_start"], "runner.sequence_start");
    }

    return policy;
}

void MaskingPolicy::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write policy file: " + path.string());
    }
    out << node;
}

YAML::Node MaskingPolicy::to_yaml() const {
    YAML::Node node;

    node["masking"]["cat_id_override"] = cat_id_override;
    for (const auto& [field, value] : effective_overrides()) {
        node["masking"]["overrides"][mask_field_to_string(field)] = mask_value_node(value);
    }
    for (FluxField field : flux_fields) {
        node["masking"]["flux_fields"].push_back(flux_field_to_string(field));
    }
    node["masking"]["flux_fill"] = real_node(flux_fill);
    node["masking"]["filter_fill"] = filter_fill;

    node["object_id"]["strategy"] = obj_id_strategy_to_string(obj_id_strategy);

    node["runner"]["workers"] = workers;
    node["runner"]["sequence_start"] = sequence_start;

    return node;
}

void MaskingPolicy::validate() const {
    if (obj_id_strategy == ObjIdStrategy::SALTED_HASH &&
        (!secret_salt || secret_salt->empty())) {
        throw ConfigError("object_id.strategy 'salted_hash' requires a secret salt");
    }

    for (const auto& [field, value] : effective_overrides()) {
        MaskValueKind want = mask_field_kind(field);
        MaskValueKind got = mask_value_kind(value);
        if (want != got) {
            throw ConfigError("masking.overrides." + mask_field_to_string(field) + " expects a " +
                              mask_value_kind_to_string(want) + " value, got a " +
                              mask_value_kind_to_string(got));
        }
        if (got == MaskValueKind::INTEGER && !fits_int32(std::get<int64_t>(value))) {
            throw ConfigError("masking.overrides." + mask_field_to_string(field) +
                              " is out of 32-bit range: " +
                              std::to_string(std::get<int64_t>(value)));
        }
    }

    std::set<FluxField> seen;
    for (FluxField field : flux_fields) {
        if (!seen.insert(field).second) {
            throw ConfigError("masking.flux_fields lists '" + flux_field_to_string(field) + "' twice");
        }
    }

    if (workers < 0) {
        throw ConfigError("runner.workers must be >= 0");
    }
}

} // namespace pfs_redact::config
