#include "RegionGrouper.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace FSPLIT {

namespace {

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::string joinArtifactFieldName(JoinArtifactField field, const std::string& region_name_field) {
    switch (field) {
        case JoinArtifactField::LEFT_INDEX:  return "index_left";
        case JoinArtifactField::RIGHT_INDEX: return "index_right";
        case JoinArtifactField::REGION_NAME: return region_name_field;
    }
    return "";
}

std::vector<std::string> joinArtifactFieldNames(const std::string& region_name_field) {
    return {
        joinArtifactFieldName(JoinArtifactField::LEFT_INDEX, region_name_field),
        joinArtifactFieldName(JoinArtifactField::RIGHT_INDEX, region_name_field),
        joinArtifactFieldName(JoinArtifactField::REGION_NAME, region_name_field)
    };
}

RegionGrouper::RegionGrouper(std::string region_name_field)
    : region_name_field_(std::move(region_name_field)) {
}

std::vector<FieldDefinition> RegionGrouper::sanitizedFields(const FeatureSet& faults) const {
    const std::vector<std::string> artifacts = joinArtifactFieldNames(region_name_field_);
    std::vector<FieldDefinition> kept;
    for (const auto& field : faults.getFields()) {
        if (std::find(artifacts.begin(), artifacts.end(), field.name) == artifacts.end()) {
            kept.push_back(field);
        }
    }
    return kept;
}

GroupingResult RegionGrouper::group(const std::vector<JoinRecord>& records,
                                    const FeatureSet& faults,
                                    const FeatureSet& regions) const {
    const auto name_idx = regions.findField(region_name_field_);
    if (!name_idx) {
        throw std::invalid_argument("Region set has no field '" + region_name_field_ + "'");
    }

    // Positions of the fault fields that survive sanitization
    const std::vector<std::string> artifacts = joinArtifactFieldNames(region_name_field_);
    std::vector<std::size_t> kept_columns;
    const auto& fault_fields = faults.getFields();
    for (std::size_t i = 0; i < fault_fields.size(); ++i) {
        if (std::find(artifacts.begin(), artifacts.end(), fault_fields[i].name) == artifacts.end()) {
            kept_columns.push_back(i);
        }
    }
    const std::vector<FieldDefinition> out_fields = sanitizedFields(faults);

    GroupingResult result;
    std::unordered_map<std::string, std::size_t> group_of;
    std::map<std::size_t, std::size_t> invalid_region_hits;

    for (const auto& rec : records) {
        const AttributeValue& name_value = regions.getFeature(rec.region_index).values[*name_idx];
        const std::string* name = std::get_if<std::string>(&name_value);
        if (!name || isBlank(*name)) {
            ++invalid_region_hits[rec.region_index];
            ++result.discarded_records;
            continue;
        }

        auto it = group_of.find(*name);
        if (it == group_of.end()) {
            it = group_of.emplace(*name, result.groups.size()).first;
            RegionGroup fresh;
            fresh.region_id = *name;
            fresh.features = FeatureSet(out_fields);
            fresh.features.setReference(faults.getReference());
            fresh.features.setHasZ(faults.hasZ());
            result.groups.push_back(std::move(fresh));
        }

        RegionGroup& grp = result.groups[it->second];
        // Records arrive fault-ordered; a repeat can only be the last entry
        if (!grp.fault_indices.empty() && grp.fault_indices.back() == rec.fault_index) {
            continue;
        }
        grp.fault_indices.push_back(rec.fault_index);

        const Feature& src = faults.getFeature(rec.fault_index);
        Feature out;
        out.geometry = src.geometry;
        out.values.reserve(kept_columns.size());
        for (std::size_t col : kept_columns) {
            out.values.push_back(src.values[col]);
        }
        grp.features.addFeature(std::move(out));
    }

    for (const auto& entry : invalid_region_hits) {
        const AttributeValue& bad = regions.getFeature(entry.first).values[*name_idx];
        result.diagnostics.push_back(
            "Skipping " + std::to_string(entry.second) + " fault record(s) for region #" +
            std::to_string(entry.first) + " with invalid " + region_name_field_ + " value " +
            toDisplayString(bad));
    }

    return result;
}

} // namespace FSPLIT
