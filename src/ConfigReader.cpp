#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <set>

namespace FSPLIT {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    parseStream(file);
    file.close();
    return true;
}

void ConfigReader::loadString(const std::string& content) {
    std::istringstream in(content);
    parseStream(in);
}

void ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            current_section = trim(current_section);
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse '" << val << "' as integer for "
                  << section << "." << key << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::vector<std::string> ConfigReader::unrecognizedKeys() const {
    static const std::map<std::string, std::set<std::string>> known = {
        {"INPUT", {"faults_path", "regions_path", "restore_shx"}},
        {"REGIONS", {"name_field", "default_crs"}},
        {"OUTPUT", {"directory", "file_prefix", "driver", "extension"}},
        {"RUN", {"progress_interval"}}
    };

    std::vector<std::string> unknown;
    for (const auto& section : getSections()) {
        auto sec_it = known.find(section);
        for (const auto& key : getKeys(section)) {
            if (sec_it == known.end() || !sec_it->second.count(key)) {
                unknown.push_back(section + "." + key);
            }
        }
    }
    return unknown;
}

void ConfigReader::parsePartitionConfig(PartitionConfig& config) const {
    config.faults_path = getString("INPUT", "faults_path", config.faults_path);
    config.regions_path = getString("INPUT", "regions_path", config.regions_path);
    config.restore_shx = getBool("INPUT", "restore_shx", config.restore_shx);

    config.region_name_field = getString("REGIONS", "name_field", config.region_name_field);
    config.default_crs = getString("REGIONS", "default_crs", config.default_crs);

    config.output_dir = getString("OUTPUT", "directory", config.output_dir);
    config.file_prefix = getString("OUTPUT", "file_prefix", config.file_prefix);
    config.output_driver = getString("OUTPUT", "driver", config.output_driver);
    config.file_extension = getString("OUTPUT", "extension", config.file_extension);

    config.progress_interval = getInt("RUN", "progress_interval", config.progress_interval);

    for (const auto& key : unrecognizedKeys()) {
        std::cerr << "Warning: Unrecognized configuration key " << key << std::endl;
    }
}

ConfigReader::ValidationResult ConfigReader::validate(const PartitionConfig& config) {
    ValidationResult result;
    result.valid = true;

    if (config.faults_path.empty()) {
        result.errors.push_back("No fault dataset given (INPUT.faults_path or -faults)");
        result.valid = false;
    }
    if (config.regions_path.empty()) {
        result.errors.push_back("No region dataset given (INPUT.regions_path or -regions)");
        result.valid = false;
    }
    if (config.output_dir.empty()) {
        result.errors.push_back("No output directory given (OUTPUT.directory or -o)");
        result.valid = false;
    }
    if (config.region_name_field.empty()) {
        result.errors.push_back("Region name field is unset (REGIONS.name_field or -name_field)");
        result.valid = false;
    }
    if (config.output_driver.empty()) {
        result.errors.push_back("Output driver is unset (OUTPUT.driver)");
        result.valid = false;
    }

    if (config.default_crs.empty()) {
        result.warnings.push_back("REGIONS.default_crs is empty - datasets without a CRS cannot be normalized");
    }
    if (config.progress_interval < 0 || config.progress_interval > 100) {
        result.warnings.push_back("RUN.progress_interval outside 0-100 - progress reporting disabled");
    }
    if (config.file_extension.empty()) {
        result.warnings.push_back("OUTPUT.extension is empty - output files will have no extension");
    }

    return result;
}

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template configuration: " << filename << std::endl;
        return false;
    }

    PartitionConfig defaults;

    file << "# FSPLIT Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n";
    file << "# Command-line options (-faults, -regions, -o, -name_field, -default_crs)\n";
    file << "# override the values below.\n\n";

    file << "[INPUT]\n";
    file << "faults_path = geojsons/gem_active_faults_harmonized.geojson\n";
    file << "regions_path = shapefiles/ne_10m_admin_0_countries.shp\n";
    file << "restore_shx = true                    # Rebuild a missing shapefile .shx\n\n";

    file << "[REGIONS]\n";
    file << "name_field = " << defaults.region_name_field
         << "                    # NAME_EN, NAME_LONG, SOVEREIGNT, ...\n";
    file << "default_crs = " << defaults.default_crs
         << "               # Used when a dataset declares no CRS\n\n";

    file << "[OUTPUT]\n";
    file << "directory = output/faults_by_country\n";
    file << "file_prefix = " << defaults.file_prefix << "\n";
    file << "driver = " << defaults.output_driver << "                      # Any OGR vector driver\n";
    file << "extension = " << defaults.file_extension << "\n\n";

    file << "[RUN]\n";
    file << "progress_interval = " << defaults.progress_interval
         << "                 # Join progress step in percent (0 = off)\n";

    return file.good();
}

} // namespace FSPLIT
