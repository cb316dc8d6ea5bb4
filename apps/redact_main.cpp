#include "pfs_redact/config/masking_policy.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/core/utils.hpp"
#include "pfs_redact/io/fits_io.hpp"
#include "pfs_redact/io/identifier.hpp"
#include "pfs_redact/redaction/redaction.hpp"
#include "pfs_redact/runner/events.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace pfs_redact;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInput = 3;
constexpr int kExitConsistency = 4;
constexpr int kExitSystem = 5;

void print_usage() {
    std::cerr << "Usage: pfs_redact_cli <identifier> [options]\n"
              << "\n"
              << "Write one redacted pfsDesign/pfsConfig per proposal found in the input.\n"
              << "<identifier> is a decimal design ID (default), a hex design ID (--hex)\n"
              << "or a filename (--file).\n"
              << "\n"
              << "Options:\n"
              << "  --hex                    Identifier is a hex string\n"
              << "  --file                   Identifier is a filename\n"
              << "  --visit N                Read pfsConfig for visit N instead of pfsDesign\n"
              << "  -d, --indir DIR          Input directory (default: .)\n"
              << "  -o, --outdir DIR         Output directory (default: .)\n"
              << "  --config PATH            Masking policy YAML\n"
              << "  --salt-env VAR           Environment variable holding the secret salt\n"
              << "                           (default: PFS_REDACT_SALT)\n"
              << "  --id-strategy NAME       salted_hash | negated_fiber_id\n"
              << "  --workers N              Parallel workers, 0 = all cores\n"
              << "  --log-file PATH          Also append events to PATH\n"
              << "  --no-policy-copy         Do not write the effective policy next to outputs\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage();
        return kExitUsage;
    }

    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 1; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 1; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (std::strcmp(argv[i], "--hex") != 0 && std::strcmp(argv[i], "--file") != 0 &&
                       std::strcmp(argv[i], "--no-policy-copy") != 0 && i + 1 < argc) {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    const std::string identifier = get_positional(0);
    if (identifier.empty()) {
        std::cerr << "missing <identifier> argument\n";
        print_usage();
        return kExitUsage;
    }
    if (has_flag("--hex") && has_flag("--file")) {
        std::cerr << "--hex and --file are mutually exclusive\n";
        return kExitUsage;
    }

    io::IdentifierKind kind = io::IdentifierKind::DECIMAL;
    if (has_flag("--hex")) kind = io::IdentifierKind::HEX;
    if (has_flag("--file")) kind = io::IdentifierKind::FILENAME;

    std::optional<int> visit;
    const std::string visit_str = get_arg("--visit");
    if (!visit_str.empty()) {
        try {
            visit = std::stoi(visit_str);
        } catch (const std::exception&) {
            std::cerr << "--visit expects an integer, got '" << visit_str << "'\n";
            return kExitUsage;
        }
    }

    std::string indir = get_arg("--indir", "-d");
    std::string outdir = get_arg("--outdir", "-o");
    if (indir.empty()) indir = ".";
    if (outdir.empty()) outdir = ".";

    std::ofstream log_file;
    const std::string log_path = get_arg("--log-file");
    if (!log_path.empty()) {
        log_file.open(log_path, std::ios::app);
        if (!log_file) {
            std::cerr << "Cannot open log file: " << log_path << "\n";
            return kExitUsage;
        }
    }

    const std::string run_id = core::get_run_id();
    runner::EventEmitter emitter(std::cout, log_path.empty() ? nullptr : &log_file);

    bool started = false;
    auto fail = [&](const char* type, const std::exception& e, int code) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (started) {
            emitter.run_error(run_id, type, e.what());
            emitter.run_end(run_id, false);
        }
        return code;
    };

    config::MaskingPolicy policy;
    try {
        const std::string config_path = get_arg("--config");
        if (!config_path.empty()) {
            policy = config::MaskingPolicy::load(config_path);
        }

        const std::string strategy = get_arg("--id-strategy");
        if (!strategy.empty()) {
            auto parsed = config::string_to_obj_id_strategy(strategy);
            if (!parsed) {
                throw ConfigError("unknown --id-strategy '" + strategy + "'");
            }
            policy.obj_id_strategy = *parsed;
        }

        const std::string workers = get_arg("--workers");
        if (!workers.empty()) {
            try {
                policy.workers = std::stoi(workers);
            } catch (const std::exception&) {
                throw ConfigError("--workers expects an integer, got '" + workers + "'");
            }
        }

        std::string salt_env = get_arg("--salt-env");
        if (salt_env.empty()) salt_env = "PFS_REDACT_SALT";
        if (const char* salt = std::getenv(salt_env.c_str())) {
            policy.secret_salt = std::string(salt);
        }

        policy.validate();
    } catch (const ConfigError& e) {
        return fail("config", e, kExitConfig);
    } catch (const YAML::Exception& e) {
        return fail("config", e, kExitConfig);
    }

    fs::path input_path;
    ConfigurationSet source;
    try {
        input_path = io::resolve_input_path(identifier, kind, indir, visit);
        std::cout << "Reading " << input_path.string() << std::endl;
        source = io::read_configuration_set(input_path);
    } catch (const InputError& e) {
        return fail("input", e, kExitInput);
    } catch (const IOError& e) {
        return fail("io", e, kExitInput);
    }

    emitter.run_start(run_id, {
        {"input", input_path.string()},
        {"outdir", outdir},
        {"fibers", source.size()},
        {"design_id", source.header.design_id},
        {"frame_id", source.header.frame_id},
        {"obj_id_strategy", config::obj_id_strategy_to_string(policy.obj_id_strategy)},
        {"workers", policy.workers}
    });
    started = true;

    std::vector<redaction::RedactionResult> results;
    try {
        results = redaction::redact(source, policy, [&](const redaction::RedactionSummary& s) {
            std::cout << "Proposal " << s.proposal_id << ": " << s.total_fibers << " fibers, "
                      << s.masked_fibers << " masked, " << s.unmasked_fibers << " unmasked, "
                      << s.science_fibers << " own SCIENCE" << std::endl;
            emitter.proposal_redacted(run_id, s);
        });
    } catch (const ConfigError& e) {
        return fail("config", e, kExitConfig);
    } catch (const InputError& e) {
        return fail("input", e, kExitInput);
    } catch (const ConsistencyError& e) {
        return fail("consistency", e, kExitConsistency);
    } catch (const std::system_error& e) {
        return fail("system", e, kExitSystem);
    }

    json outputs = json::array();
    try {
        fs::create_directories(outdir);
        for (const auto& result : results) {
            fs::path out_path = fs::path(outdir) / io::output_filename(input_path, result.proposal_id());
            io::write_configuration_set(out_path, result.config());
            std::cout << out_path.filename().string() << " is written in " << outdir << std::endl;
            emitter.output_written(run_id, result.proposal_id(), result.sequence_id(), out_path.string());
            outputs.push_back(out_path.string());
        }

        if (!has_flag("--no-policy-copy") && !results.empty()) {
            fs::path policy_path = fs::path(outdir) / (input_path.stem().string() + "_redaction_policy.yaml");
            policy.save(policy_path);
        }
    } catch (const IOError& e) {
        return fail("io", e, kExitInput);
    } catch (const InputError& e) {
        return fail("input", e, kExitInput);
    } catch (const ConfigError& e) {
        return fail("config", e, kExitConfig);
    } catch (const fs::filesystem_error& e) {
        return fail("io", e, kExitInput);
    }

    if (results.empty()) {
        std::cout << "No proposals to redact in " << input_path.string() << std::endl;
    }

    emitter.run_end(run_id, true, {{"outputs", outputs}, {"proposals", results.size()}});
    return kExitOk;
}
