/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Implements firestorm XML configuration loading using pugixml. Element text
 * goes through the front-end parsers so that a non-numeric value fails with
 * InputValidationError instead of silently falling back to a default.
 */

#include "firestorm/interface/config.h"
#include "firestorm/interface/input_parser.h"
#include "firestorm/core/error.h"
#include <pugixml.hpp>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace firestorm::config {

namespace {

// ============================================================================
// Unit Conversion Helpers
// ============================================================================

enum class Quantity {
    Length,
    Time,
    Frequency,
    AreaFraction
};

Real convert_to_si(Real value, const std::string& unit, Quantity quantity, const char* element) {
    switch (quantity) {
        case Quantity::Length:
            if (unit == "m") return value;
            if (unit == "cm") return value * 0.01;
            break;
        case Quantity::Time:
            if (unit == "s") return value;
            if (unit == "ms") return value * 0.001;
            break;
        case Quantity::Frequency:
            if (unit == "Hz" || unit == "1/s") return value;
            break;
        case Quantity::AreaFraction:
            if (unit == "fraction") return value;
            if (unit == "percent" || unit == "%") return interface::area_percent_to_fraction(value);
            break;
    }

    throw InputValidationError(StormResult::InvalidConfiguration,
                               "Unit '" + unit + "' not allowed on <" + element + ">");
}

Real parse_real_node(const pugi::xml_node& node, Quantity quantity) {
    Real value = 0.0;
    StormResult result = interface::parse_real(node.text().as_string(), value);
    throw_on_failure(result, std::string("Invalid <") + node.name() + "> value");

    std::string unit = node.attribute("unit").as_string("");
    return unit.empty() ? value : convert_to_si(value, unit, quantity, node.name());
}

void read_real(const pugi::xml_node& parent, const char* name, Quantity quantity, Real& value) {
    if (auto node = parent.child(name)) {
        value = parse_real_node(node, quantity);
    }
}

using CountParser = StormResult (*)(std::string_view, Int64&);

void read_count(const pugi::xml_node& parent, const char* name, Int64& value,
                CountParser parse = interface::parse_count) {
    if (auto node = parent.child(name)) {
        throw_on_failure(parse(node.text().as_string(), value),
                         std::string("Invalid <") + name + "> value");
    }
}

const char* scan_variable_key(sim::ScanVariable variable) {
    switch (variable) {
        case sim::ScanVariable::Ignites: return "ignites";
        case sim::ScanVariable::AreaModifierPercent: return "area_modifier";
        case sim::ScanVariable::Duration: return "duration";
    }
    return "ignites";
}

FirestormConfig parse_document(const pugi::xml_document& doc) {
    auto root = doc.child("firestorm_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw InputValidationError(StormResult::InvalidConfiguration,
                                   "Invalid firestorm config XML: no root element");
    }

    FirestormConfig config = FirestormConfig::defaults();
    sim::SimulationConfig& simulation = config.simulation;

    // Control inputs
    if (auto node = root.child("simulation")) {
        read_count(node, "ignites", simulation.ignites, interface::parse_ignites);
        read_real(node, "area_modifier", Quantity::AreaFraction, simulation.area_modifier);
        read_real(node, "duration", Quantity::Time, simulation.duration);

        if (auto trials = node.child("trials")) {
            StormResult result = interface::parse_trial_count(trials.text().as_string(),
                                                             simulation.trials);
            throw_on_failure(result, "Invalid <trials> value");
        }

        Int64 seed = 0;
        read_count(node, "seed", seed);
        simulation.seed = static_cast<UInt64>(seed);

        if (auto hitboxes = node.child("hitboxes")) {
            std::vector<Real> radii;
            for (auto radius : hitboxes.children("radius")) {
                radii.push_back(parse_real_node(radius, Quantity::Length));
            }
            throw_on_failure(sim::validate_hitbox_radii(radii), "Invalid <hitboxes>");
            simulation.hitbox_radii = std::move(radii);
        }
    }

    // Storm model
    if (auto node = root.child("storm")) {
        read_real(node, "storm_radius", Quantity::Length, simulation.storm_radius);
        read_real(node, "ordinary_blast_radius", Quantity::Length,
                  simulation.ordinary_blast_radius);
        read_real(node, "improved_blast_radius", Quantity::Length,
                  simulation.improved_blast_radius);
        read_real(node, "frequency", Quantity::Frequency, simulation.frequency);

        Int64 samples = static_cast<Int64>(simulation.coverage_samples);
        read_count(node, "coverage_samples", samples);
        simulation.coverage_samples = static_cast<SizeT>(samples);
    }

    // Parameter scan
    if (auto node = root.child("scan")) {
        if (auto variable = node.child("variable")) {
            auto parsed = sim::parse_scan_variable(variable.text().as_string());
            if (!parsed) {
                throw InputValidationError(StormResult::InvalidConfiguration,
                                           std::string("Unknown scan variable: ") +
                                           variable.text().as_string());
            }
            config.scan.variable = *parsed;
        }

        Int64 steps = static_cast<Int64>(config.scan.steps);
        read_count(node, "steps", steps);
        config.scan.steps = static_cast<SizeT>(steps);
    }

    return config;
}

void build_document(const FirestormConfig& config, pugi::xml_document& doc) {
    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("firestorm_config");
    const sim::SimulationConfig& simulation = config.simulation;

    // Control inputs
    auto sim_node = root.append_child("simulation");
    sim_node.append_child("ignites").text().set(static_cast<long long>(simulation.ignites));
    auto area = sim_node.append_child("area_modifier");
    area.append_attribute("unit") = "fraction";
    area.text().set(simulation.area_modifier);
    auto duration = sim_node.append_child("duration");
    duration.append_attribute("unit") = "s";
    duration.text().set(simulation.duration);
    sim_node.append_child("trials").text().set(static_cast<long long>(simulation.trials));
    sim_node.append_child("seed").text().set(static_cast<unsigned long long>(simulation.seed));

    auto hitboxes = sim_node.append_child("hitboxes");
    for (Real radius : simulation.hitbox_radii) {
        hitboxes.append_child("radius").text().set(radius);
    }

    // Storm model
    auto storm = root.append_child("storm");
    storm.append_child("storm_radius").text().set(simulation.storm_radius);
    storm.append_child("ordinary_blast_radius").text().set(simulation.ordinary_blast_radius);
    storm.append_child("improved_blast_radius").text().set(simulation.improved_blast_radius);
    storm.append_child("frequency").text().set(simulation.frequency);
    storm.append_child("coverage_samples").text().set(
        static_cast<unsigned long long>(simulation.coverage_samples));

    // Parameter scan
    auto scan = root.append_child("scan");
    scan.append_child("variable").text().set(scan_variable_key(config.scan.variable));
    scan.append_child("steps").text().set(static_cast<unsigned long long>(config.scan.steps));
}

} // anonymous namespace

// ============================================================================
// FirestormConfig Implementation
// ============================================================================

FirestormConfig FirestormConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw InputValidationError(StormResult::ParseError,
                                   "Failed to load config '" + path + "': " +
                                   std::string(result.description()));
    }
    return parse_document(doc);
}

FirestormConfig FirestormConfig::load_string(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw InputValidationError(StormResult::ParseError,
                                   "Failed to parse config: " + std::string(result.description()));
    }
    return parse_document(doc);
}

FirestormConfig FirestormConfig::defaults() {
    return FirestormConfig{};
}

bool FirestormConfig::save(const std::string& path) const {
    pugi::xml_document doc;
    build_document(*this, doc);
    return doc.save_file(path.c_str());
}

std::string FirestormConfig::to_xml() const {
    pugi::xml_document doc;
    build_document(*this, doc);

    std::ostringstream out;
    doc.save(out);
    return out.str();
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

FirestormConfig ConfigLoader::load_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw InputValidationError(StormResult::InvalidConfiguration,
                                   "Firestorm config file not found: " + path);
    }
    return FirestormConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    // Check if it's already an absolute path that exists
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    // Search in all paths
    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace firestorm::config
