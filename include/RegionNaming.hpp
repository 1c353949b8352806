#ifndef REGION_NAMING_HPP
#define REGION_NAMING_HPP

#include <string>

namespace FSPLIT {

/// Slug used when a region name sanitizes to nothing
const std::string FALLBACK_REGION_SLUG = "unknown_region";

/**
 * @brief Filesystem-safe slug for a region name
 *
 * Trims whitespace, drops apostrophes, collapses every run of characters
 * outside [A-Za-z0-9_] into one underscore, lower-cases and strips outer
 * underscores. Non-ASCII text counts as outside the set, byte by byte.
 *
 * Distinct names can share a slug ("Côte" and "C te" both give "c_te"); the
 * file written last wins.
 *
 * @code
 * makeRegionSlug("People's Republic of China");  // "peoples_republic_of_china"
 * makeRegionSlug("   ");                         // "unknown_region"
 * @endcode
 */
std::string makeRegionSlug(const std::string& raw_name);

/**
 * @brief <output_dir>/<prefix><slug><extension>
 */
std::string regionOutputPath(const std::string& output_dir, const std::string& prefix,
                             const std::string& slug, const std::string& extension);

} // namespace FSPLIT

#endif // REGION_NAMING_HPP
