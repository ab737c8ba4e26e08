/**
 * @file main.cpp
 * @brief Command-line front end for the firestorm simulator
 *
 * Runs one simulation (or a parameter scan) and prints the hit and coverage
 * statistics. Settings come from an optional XML config, then command-line
 * overrides.
 */

#include "firestorm/firestorm.h"
#include <iostream>
#include <iomanip>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "FirestormSim\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <file>      XML configuration file\n"
              << "  --ignites <n>        Ignites consumed (default: 3)\n"
              << "  --area-mod <pct>     Area modifier in percent (default: 0)\n"
              << "  --duration <s>       Storm duration in seconds (default: 6)\n"
              << "  --hitboxes <list>    Comma-separated hitbox radii (default: 0.5,1.0)\n"
              << "  --trials <n>         Monte Carlo trials (default: 1000)\n"
              << "  --seed <n>           Random seed, 0 = non-deterministic (default: 0)\n"
              << "  --scan <variable>    Scan ignites | area_modifier | duration\n"
              << "  --steps <n>          Scan points (default: 11)\n"
              << "  --help               Show this help\n";
}

void print_result(const firestorm::sim::SimulationResult& result) {
    using firestorm::sim::HitboxStatistics;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Storm radius " << result.radii.storm << "m, ordinary blast "
              << result.radii.ordinary_blast << "m, improved blast "
              << result.radii.improved_blast << "m\n";
    std::cout << "Projectiles per trial: " << result.allocation.ordinary << " ordinary, "
              << result.allocation.improved << " improved\n\n";

    for (const HitboxStatistics& h : result.statistics.hitboxes) {
        std::cout << h.radius << "m -> Ord " << h.ordinary.mean << "±" << h.ordinary.sem
                  << ", Imp " << h.improved.mean << "±" << h.improved.sem << "\n";
    }

    const auto& cov = result.statistics.coverage;
    std::cout << std::setprecision(1);
    std::cout << "Coverage Ord " << cov.ordinary.mean * 100.0 << "±" << cov.ordinary.sem * 100.0
              << "%, Imp " << cov.improved.mean * 100.0 << "±" << cov.improved.sem * 100.0
              << "%\n";
}

firestorm::Int64 parse_option_count(const std::string& value, const std::string& option) {
    firestorm::Int64 count = 0;
    firestorm::throw_on_failure(firestorm::interface::parse_count(value, count), option);
    return count;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace firestorm;

    config::FirestormConfig settings = config::FirestormConfig::defaults();
    bool scan_requested = false;

    try {
        // Config file first so that command-line options override it
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config::ConfigLoader loader;
                settings = loader.load_config(argv[++i]);
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
        }

        sim::SimulationConfig& cfg = settings.simulation;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (i + 1 >= argc) {
                throw InputValidationError(StormResult::ParseError, "Missing value for " + arg);
            }
            std::string value = argv[++i];

            if (arg == "--config") {
                continue;
            } else if (arg == "--ignites") {
                throw_on_failure(interface::parse_ignites(value, cfg.ignites), "--ignites");
            } else if (arg == "--area-mod") {
                Real percent = 0.0;
                throw_on_failure(interface::parse_real(value, percent), "--area-mod");
                cfg.area_modifier = interface::area_percent_to_fraction(percent);
            } else if (arg == "--duration") {
                throw_on_failure(interface::parse_real(value, cfg.duration), "--duration");
            } else if (arg == "--hitboxes") {
                throw_on_failure(interface::parse_hitbox_radii(value, cfg.hitbox_radii), "--hitboxes");
            } else if (arg == "--trials") {
                throw_on_failure(interface::parse_trial_count(value, cfg.trials), "--trials");
            } else if (arg == "--seed") {
                cfg.seed = static_cast<UInt64>(parse_option_count(value, arg));
            } else if (arg == "--scan") {
                auto variable = sim::parse_scan_variable(value);
                if (!variable) {
                    throw InputValidationError(StormResult::InvalidConfiguration,
                                               "Unknown scan variable: " + value);
                }
                settings.scan.variable = *variable;
                scan_requested = true;
            } else if (arg == "--steps") {
                settings.scan.steps = static_cast<SizeT>(parse_option_count(value, arg));
            } else {
                throw InputValidationError(StormResult::ParseError, "Unknown option: " + arg);
            }
        }

        throw_on_failure(sim::validate_config(cfg), "Invalid configuration");

        std::cout << "FirestormSim " << GetVersionString() << "\n";
        RandomEngine rng = make_random_engine(cfg.seed);

        if (scan_requested) {
            std::cout << "Scanning " << sim::scan_variable_to_string(settings.scan.variable)
                      << " (" << settings.scan.steps << " steps, " << cfg.trials
                      << " trials each)...\n\n";
            sim::ScanResult scan = sim::run_parameter_scan(cfg, settings.scan, rng);
            std::cout << "Hitbox " << std::fixed << std::setprecision(2)
                      << scan.hitbox_radius << "m\n";
            std::cout << sim::format_scan_csv(scan);
        } else {
            std::cout << "Running " << cfg.trials << " trials...\n\n";
            sim::SimulationResult result = sim::simulate_firestorm(cfg, rng);
            print_result(result);
        }
    } catch (const DegenerateConfigurationError& e) {
        std::cerr << "Degenerate configuration: " << e.what() << "\n";
        return 1;
    } catch (const InputValidationError& e) {
        std::cerr << "Input error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
