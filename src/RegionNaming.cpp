#include "RegionNaming.hpp"

#include <cctype>
#include <filesystem>

namespace FSPLIT {

namespace {

bool isSlugChar(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

} // namespace

std::string makeRegionSlug(const std::string& raw_name) {
    size_t first = raw_name.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) return FALLBACK_REGION_SLUG;
    size_t last = raw_name.find_last_not_of(" \t\r\n\f\v");

    std::string slug;
    slug.reserve(last - first + 1);
    bool in_run = false;
    for (size_t i = first; i <= last; ++i) {
        const unsigned char c = static_cast<unsigned char>(raw_name[i]);
        if (c == '\'') continue;

        if (isSlugChar(c)) {
            slug.push_back(static_cast<char>(std::tolower(c)));
            in_run = false;
        } else if (!in_run) {
            slug.push_back('_');
            in_run = true;
        }
    }

    size_t begin = slug.find_first_not_of('_');
    if (begin == std::string::npos) return FALLBACK_REGION_SLUG;
    size_t end = slug.find_last_not_of('_');
    return slug.substr(begin, end - begin + 1);
}

std::string regionOutputPath(const std::string& output_dir, const std::string& prefix,
                             const std::string& slug, const std::string& extension) {
    return (std::filesystem::path(output_dir) / (prefix + slug + extension)).string();
}

} // namespace FSPLIT
