#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "FSPLIT.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace FSPLIT {

/**
 * @brief INI-style configuration reader
 *
 * Sections in brackets, "key = value" lines, '#' or ';' comment lines and
 * trailing '#' comments. Everything the partitioner needs can be set from a
 * single file; command-line options override it.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    /**
     * @brief Load and parse a configuration file
     * @return false if the file cannot be opened
     */
    bool loadFile(const std::string& filename);

    /**
     * @brief Parse configuration text directly
     */
    void loadString(const std::string& content);

    // =========================================================================
    // Raw value accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key, int default_val = 0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /**
     * @brief "SECTION.key" for every loaded entry the partitioner does not read
     */
    std::vector<std::string> unrecognizedKeys() const;

    // =========================================================================
    // Partitioner configuration
    // =========================================================================

    /**
     * @brief Fill config from [INPUT], [REGIONS], [OUTPUT] and [RUN]
     *
     * Keys that are absent leave the corresponding member untouched.
     * Unrecognized keys are reported as warnings on stderr.
     */
    void parsePartitionConfig(PartitionConfig& config) const;

    /**
     * @brief Check that a configuration is complete enough to run
     *
     * Unset input paths, output directory or region-name field are errors.
     */
    static ValidationResult validate(const PartitionConfig& config);

    /**
     * @brief Write a commented template configuration
     * @return false if the file cannot be written
     */
    static bool generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    void parseStream(std::istream& in);
    std::string trim(const std::string& str) const;
};

} // namespace FSPLIT

#endif // CONFIG_READER_HPP
