#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "firestorm/core/types.h"
#include "firestorm/sim/storm_config.h"
#include "firestorm/sim/parameter_scan.h"
#include <string>
#include <vector>

namespace firestorm::config {

/**
 * @brief Complete front-end configuration loaded from XML
 *
 * Root element <firestorm_config> with optional <simulation>, <storm> and
 * <scan> sections. Missing elements keep their defaults. The area modifier
 * accepts unit="fraction" (default) or unit="percent".
 */
struct FirestormConfig {
    sim::SimulationConfig simulation;
    sim::ScanSettings scan;

    /**
     * @brief Load configuration from XML file
     * @throws InputValidationError on unreadable, malformed or non-numeric input
     */
    static FirestormConfig load(const std::string& path);

    /**
     * @brief Load configuration from an XML string
     * @throws InputValidationError on malformed or non-numeric input
     */
    static FirestormConfig load_string(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static FirestormConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;

    /**
     * @brief Serialize configuration to an XML string
     */
    std::string to_xml() const;
};

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Resolve @p path against the search paths and load it
     * @throws InputValidationError if the file cannot be found or parsed
     */
    FirestormConfig load_config(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     * @return Resolved path, or an empty string if not found
     */
    std::string find_file(const std::string& filename) const;

private:
    std::vector<std::string> search_paths_;
};

} // namespace firestorm::config
