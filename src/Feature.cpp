#include "Feature.hpp"

#include <sstream>
#include <stdexcept>

namespace FSPLIT {

namespace {

struct Printer {
    std::string operator()(std::monostate) const { return "<null>"; }
    std::string operator()(std::int64_t i) const { return std::to_string(i); }
    std::string operator()(double d) const {
        std::ostringstream oss;
        oss << d;
        return oss.str();
    }
    std::string operator()(const std::string& s) const { return "'" + s + "'"; }
    template <typename T>
    std::string operator()(const std::vector<T>& list) const {
        std::string out = "[";
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (i > 0) out += ", ";
            out += (*this)(list[i]);
        }
        return out + "]";
    }
};

} // namespace

std::string toDisplayString(const AttributeValue& v) {
    return std::visit(Printer{}, v);
}

FeatureSet::FeatureSet(std::vector<FieldDefinition> fields)
    : fields_(std::move(fields)) {
}

std::vector<std::string> FeatureSet::getFieldNames() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& f : fields_) {
        names.push_back(f.name);
    }
    return names;
}

std::optional<std::size_t> FeatureSet::findField(const std::string& name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return std::nullopt;
}

void FeatureSet::addFeature(Feature feature) {
    if (feature.values.size() != fields_.size()) {
        throw std::invalid_argument("Feature has " + std::to_string(feature.values.size()) +
                                    " values but the schema defines " +
                                    std::to_string(fields_.size()) + " fields");
    }
    features_.push_back(std::move(feature));
}

} // namespace FSPLIT
