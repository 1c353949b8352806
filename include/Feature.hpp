#ifndef FEATURE_HPP
#define FEATURE_HPP

#include "Geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace FSPLIT {

/**
 * @brief Storage type of an attribute field
 *
 * INTEGER and INTEGER64 values are held as std::int64_t, REAL as double.
 * DATE, TIME and DATETIME are held as text in the "YYYY/MM/DD HH:MM:SS+TZ"
 * form and parsed back when written. The list types hold vectors.
 */
enum class FieldType {
    INTEGER,
    INTEGER64,
    REAL,
    TEXT,
    DATE,
    TIME,
    DATETIME,
    INTEGER_LIST,
    INTEGER64_LIST,
    REAL_LIST,
    TEXT_LIST
};

/**
 * @brief Narrower interpretation of a field type (BOOLEAN on an INTEGER field, ...)
 */
enum class FieldSubType {
    NONE,
    BOOLEAN,
    INT16,
    FLOAT32,
    JSON
};

struct FieldDefinition {
    std::string name;
    FieldType type;
    FieldSubType subtype;
    int width;          ///< 0 = unspecified
    int precision;      ///< 0 = unspecified

    FieldDefinition() : type(FieldType::TEXT), subtype(FieldSubType::NONE), width(0), precision(0) {}
    FieldDefinition(std::string n, FieldType t, FieldSubType st = FieldSubType::NONE,
                    int w = 0, int p = 0)
        : name(std::move(n)), type(t), subtype(st), width(w), precision(p) {}
};

/**
 * @brief Attribute value; std::monostate is a null field
 */
using AttributeValue = std::variant<std::monostate, std::int64_t, double, std::string,
                                    std::vector<std::int64_t>, std::vector<double>,
                                    std::vector<std::string>>;

inline bool isNull(const AttributeValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Printable form used in diagnostics ("<null>" for nulls)
 */
std::string toDisplayString(const AttributeValue& v);

/**
 * @brief One record: geometry plus values aligned with the owning set's fields
 */
struct Feature {
    Geometry geometry;
    std::vector<AttributeValue> values;
};

/**
 * @brief Collection of features sharing one field schema and one CRS
 *
 * The reference identifier is empty when the source declared no CRS.
 */
class FeatureSet {
public:
    FeatureSet() = default;
    explicit FeatureSet(std::vector<FieldDefinition> fields);

    // =========================================================================
    // Schema
    // =========================================================================

    const std::vector<FieldDefinition>& getFields() const { return fields_; }
    std::vector<std::string> getFieldNames() const;

    /**
     * @brief Position of a field in the schema, if present
     */
    std::optional<std::size_t> findField(const std::string& name) const;

    // =========================================================================
    // Features
    // =========================================================================

    /**
     * @brief Append a feature
     * @throws std::invalid_argument if the value count does not match the schema
     */
    void addFeature(Feature feature);

    const std::vector<Feature>& getFeatures() const { return features_; }
    const Feature& getFeature(std::size_t i) const { return features_.at(i); }
    Feature& getFeature(std::size_t i) { return features_.at(i); }

    std::size_t size() const { return features_.size(); }
    bool empty() const { return features_.empty(); }

    // =========================================================================
    // Reference system
    // =========================================================================

    const std::string& getReference() const { return reference_id_; }
    bool hasReference() const { return !reference_id_.empty(); }
    void setReference(const std::string& id) { reference_id_ = id; }

    /**
     * @brief True when the coordinates carry a meaningful Z component
     */
    bool hasZ() const { return has_z_; }
    void setHasZ(bool has_z) { has_z_ = has_z; }

private:
    std::vector<FieldDefinition> fields_;
    std::vector<Feature> features_;
    std::string reference_id_;
    bool has_z_ = false;
};

} // namespace FSPLIT

#endif // FEATURE_HPP
