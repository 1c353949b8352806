#include "FeatureIO.hpp"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>

#include <filesystem>
#include <memory>

namespace FSPLIT {

namespace {

// ============================================================================
// OGR -> model conversion
// ============================================================================

Polyline toPolyline(const OGRSimpleCurve& curve) {
    Polyline line;
    const int n = curve.getNumPoints();
    line.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        line.emplace_back(curve.getX(i), curve.getY(i), curve.getZ(i));
    }
    return line;
}

void copyRing(const OGRSimpleCurve& curve, Polygon::ring_type& ring) {
    const int n = curve.getNumPoints();
    ring.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        ring.emplace_back(curve.getX(i), curve.getY(i), curve.getZ(i));
    }
}

Polygon toPolygon(const OGRPolygon& poly) {
    Polygon out;
    if (const OGRLinearRing* exterior = poly.getExteriorRing()) {
        copyRing(*exterior, out.outer());
    }
    for (int i = 0; i < poly.getNumInteriorRings(); ++i) {
        out.inners().emplace_back();
        copyRing(*poly.getInteriorRing(i), out.inners().back());
    }
    return out;
}

Geometry toGeometry(const OGRGeometry* geom) {
    if (!geom || geom->IsEmpty()) return Geometry{};

    // Arcs and curve polygons are approximated by straight segments
    std::unique_ptr<OGRGeometry> linearized;
    if (OGR_GT_IsNonLinear(geom->getGeometryType())) {
        linearized.reset(geom->getLinearGeometry());
        if (!linearized) return Geometry{};
        geom = linearized.get();
    }

    switch (wkbFlatten(geom->getGeometryType())) {
        case wkbLineString: {
            MultiPolyline lines;
            lines.push_back(toPolyline(*geom->toLineString()));
            return lines;
        }
        case wkbMultiLineString: {
            MultiPolyline lines;
            for (const OGRLineString* ls : *geom->toMultiLineString()) {
                lines.push_back(toPolyline(*ls));
            }
            return lines;
        }
        case wkbPolygon: {
            MultiPolygon polys;
            polys.push_back(toPolygon(*geom->toPolygon()));
            Geometry result = polys;
            correct(result);
            return result;
        }
        case wkbMultiPolygon: {
            MultiPolygon polys;
            for (const OGRPolygon* p : *geom->toMultiPolygon()) {
                polys.push_back(toPolygon(*p));
            }
            Geometry result = polys;
            correct(result);
            return result;
        }
        default:
            return Geometry{};
    }
}

std::string describeReference(const OGRSpatialReference* srs) {
    if (!srs) return "";

    std::unique_ptr<OGRSpatialReference> copy(srs->Clone());
    // Shapefile .prj files rarely carry authority codes; try to recover one
    copy->AutoIdentifyEPSG();

    const char* auth = copy->GetAuthorityName(nullptr);
    const char* code = copy->GetAuthorityCode(nullptr);
    if (auth && code) {
        return normalizeReferenceId(std::string(auth) + ":" + code);
    }

    char* wkt = nullptr;
    std::string result;
    if (copy->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

FieldType toFieldType(OGRFieldType type) {
    switch (type) {
        case OFTInteger:         return FieldType::INTEGER;
        case OFTInteger64:       return FieldType::INTEGER64;
        case OFTReal:            return FieldType::REAL;
        case OFTDate:            return FieldType::DATE;
        case OFTTime:            return FieldType::TIME;
        case OFTDateTime:        return FieldType::DATETIME;
        case OFTIntegerList:     return FieldType::INTEGER_LIST;
        case OFTInteger64List:   return FieldType::INTEGER64_LIST;
        case OFTRealList:        return FieldType::REAL_LIST;
        case OFTStringList:      return FieldType::TEXT_LIST;
        default:                 return FieldType::TEXT;
    }
}

FieldSubType toFieldSubType(OGRFieldSubType subtype) {
    switch (subtype) {
        case OFSTBoolean: return FieldSubType::BOOLEAN;
        case OFSTInt16:   return FieldSubType::INT16;
        case OFSTFloat32: return FieldSubType::FLOAT32;
        case OFSTJSON:    return FieldSubType::JSON;
        default:          return FieldSubType::NONE;
    }
}

AttributeValue readValue(OGRFeature& feat, int i, FieldType type) {
    switch (type) {
        case FieldType::INTEGER:
        case FieldType::INTEGER64:
            return static_cast<std::int64_t>(feat.GetFieldAsInteger64(i));
        case FieldType::REAL:
            return feat.GetFieldAsDouble(i);
        case FieldType::INTEGER_LIST:
        case FieldType::INTEGER64_LIST: {
            int n = 0;
            const GIntBig* list = feat.GetFieldAsInteger64List(i, &n);
            return std::vector<std::int64_t>(list, list + n);
        }
        case FieldType::REAL_LIST: {
            int n = 0;
            const double* list = feat.GetFieldAsDoubleList(i, &n);
            return std::vector<double>(list, list + n);
        }
        case FieldType::TEXT_LIST: {
            std::vector<std::string> values;
            for (char** it = feat.GetFieldAsStringList(i); it && *it; ++it) {
                values.emplace_back(*it);
            }
            return values;
        }
        default:
            // Dates and times keep OGR's text form
            return std::string(feat.GetFieldAsString(i));
    }
}

// ============================================================================
// model -> OGR conversion
// ============================================================================

template <typename Curve, typename Points>
void addPoints(Curve& curve, const Points& points, bool has_z) {
    for (const auto& p : points) {
        if (has_z) {
            curve.addPoint(p.x, p.y, p.z);
        } else {
            curve.addPoint(p.x, p.y);
        }
    }
}

std::unique_ptr<OGRLineString> toOGRLineString(const Polyline& line, bool has_z) {
    auto ls = std::make_unique<OGRLineString>();
    addPoints(*ls, line, has_z);
    return ls;
}

std::unique_ptr<OGRLinearRing> toOGRRing(const Polygon::ring_type& ring, bool has_z) {
    auto lr = std::make_unique<OGRLinearRing>();
    addPoints(*lr, ring, has_z);
    lr->closeRings();
    return lr;
}

std::unique_ptr<OGRPolygon> toOGRPolygon(const Polygon& poly, bool has_z) {
    auto out = std::make_unique<OGRPolygon>();
    out->addRingDirectly(toOGRRing(poly.outer(), has_z).release());
    for (const auto& inner : poly.inners()) {
        out->addRingDirectly(toOGRRing(inner, has_z).release());
    }
    return out;
}

std::unique_ptr<OGRGeometry> toOGRGeometry(const Geometry& geom, bool has_z) {
    if (const auto* lines = std::get_if<MultiPolyline>(&geom)) {
        if (lines->empty()) return nullptr;
        if (lines->size() == 1) return toOGRLineString(lines->front(), has_z);
        auto mls = std::make_unique<OGRMultiLineString>();
        for (const auto& line : *lines) {
            mls->addGeometryDirectly(toOGRLineString(line, has_z).release());
        }
        return mls;
    }
    if (const auto* polys = std::get_if<MultiPolygon>(&geom)) {
        if (polys->empty()) return nullptr;
        if (polys->size() == 1) return toOGRPolygon(polys->front(), has_z);
        auto mp = std::make_unique<OGRMultiPolygon>();
        for (const auto& poly : *polys) {
            mp->addGeometryDirectly(toOGRPolygon(poly, has_z).release());
        }
        return mp;
    }
    return nullptr;
}

OGRFieldType toOGRFieldType(FieldType type) {
    switch (type) {
        case FieldType::INTEGER:        return OFTInteger;
        case FieldType::INTEGER64:      return OFTInteger64;
        case FieldType::REAL:           return OFTReal;
        case FieldType::TEXT:           return OFTString;
        case FieldType::DATE:           return OFTDate;
        case FieldType::TIME:           return OFTTime;
        case FieldType::DATETIME:       return OFTDateTime;
        case FieldType::INTEGER_LIST:   return OFTIntegerList;
        case FieldType::INTEGER64_LIST: return OFTInteger64List;
        case FieldType::REAL_LIST:      return OFTRealList;
        case FieldType::TEXT_LIST:      return OFTStringList;
    }
    return OFTString;
}

OGRFieldSubType toOGRFieldSubType(FieldSubType subtype) {
    switch (subtype) {
        case FieldSubType::NONE:    return OFSTNone;
        case FieldSubType::BOOLEAN: return OFSTBoolean;
        case FieldSubType::INT16:   return OFSTInt16;
        case FieldSubType::FLOAT32: return OFSTFloat32;
        case FieldSubType::JSON:    return OFSTJSON;
    }
    return OFSTNone;
}

void writeValue(OGRFeature& feature, int idx, const AttributeValue& v) {
    if (const auto* iv = std::get_if<std::int64_t>(&v)) {
        feature.SetField(idx, static_cast<GIntBig>(*iv));
    } else if (const auto* dv = std::get_if<double>(&v)) {
        feature.SetField(idx, *dv);
    } else if (const auto* sv = std::get_if<std::string>(&v)) {
        feature.SetField(idx, sv->c_str());
    } else if (const auto* il = std::get_if<std::vector<std::int64_t>>(&v)) {
        std::vector<GIntBig> values(il->begin(), il->end());
        feature.SetField(idx, static_cast<int>(values.size()), values.data());
    } else if (const auto* dl = std::get_if<std::vector<double>>(&v)) {
        feature.SetField(idx, static_cast<int>(dl->size()), dl->data());
    } else if (const auto* sl = std::get_if<std::vector<std::string>>(&v)) {
        std::vector<const char*> values;
        for (const auto& s : *sl) values.push_back(s.c_str());
        values.push_back(nullptr);
        feature.SetField(idx, values.data());
    } else {
        feature.SetFieldNull(idx);
    }
}

std::string lastGDALError(const std::string& fallback) {
    const char* msg = CPLGetLastErrorMsg();
    if (msg && *msg) return msg;
    return fallback;
}

} // namespace

// ============================================================================
// OGRFeatureSetReader Implementation
// ============================================================================

OGRFeatureSetReader::OGRFeatureSetReader(bool restore_shx)
    : restore_shx_(restore_shx) {
    GDALAllRegister();
}

SetupResult<FeatureSet> OGRFeatureSetReader::load(const std::string& path) {
    // Rebuild a missing .shx index instead of refusing the shapefile
    CPLSetConfigOption("SHAPE_RESTORE_SHX", restore_shx_ ? "YES" : "NO");
    CPLErrorReset();

    GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                              nullptr, nullptr, nullptr));
    if (!ds) {
        return SetupResult<FeatureSet>::fatal(
            "Cannot open '" + path + "': " + lastGDALError("not a readable vector dataset"));
    }
    if (ds->GetLayerCount() < 1) {
        return SetupResult<FeatureSet>::fatal("Dataset '" + path + "' contains no layers");
    }

    OGRLayer* layer = ds->GetLayer(0);
    OGRFeatureDefn* defn = layer->GetLayerDefn();

    std::vector<FieldDefinition> fields;
    for (int i = 0; i < defn->GetFieldCount(); ++i) {
        const OGRFieldDefn* fd = defn->GetFieldDefn(i);
        fields.emplace_back(fd->GetNameRef(), toFieldType(fd->GetType()),
                            toFieldSubType(fd->GetSubType()), fd->GetWidth(), fd->GetPrecision());
    }

    FeatureSet set(fields);
    set.setReference(describeReference(layer->GetSpatialRef()));
    // GeoJSON layers report wkbUnknown; the geometries decide then
    bool has_z = wkbHasZ(layer->GetGeomType()) != 0;

    layer->ResetReading();
    OGRFeature* raw = nullptr;
    while ((raw = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feat(raw);

        const OGRGeometry* geom = feat->GetGeometryRef();
        if (geom && geom->Is3D()) has_z = true;

        Feature feature;
        feature.geometry = toGeometry(geom);
        feature.values.reserve(fields.size());
        for (int i = 0; i < static_cast<int>(fields.size()); ++i) {
            if (!feat->IsFieldSetAndNotNull(i)) {
                feature.values.emplace_back(std::monostate{});
                continue;
            }
            feature.values.push_back(readValue(*feat, i, fields[static_cast<size_t>(i)].type));
        }
        set.addFeature(std::move(feature));
    }
    set.setHasZ(has_z);

    return SetupResult<FeatureSet>::success(std::move(set));
}

// ============================================================================
// OGRFeatureSetWriter Implementation
// ============================================================================

OGRFeatureSetWriter::OGRFeatureSetWriter(std::string driver_name)
    : driver_name_(std::move(driver_name)) {
    GDALAllRegister();
}

bool OGRFeatureSetWriter::write(const std::string& path, const FeatureSet& features) {
    last_error_.clear();
    CPLErrorReset();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name_.c_str());
    if (!driver) {
        last_error_ = "OGR driver '" + driver_name_ + "' is not available";
        return false;
    }

    // Replace an existing file; most drivers refuse to create over one
    VSIStatBufL stat_buf;
    if (VSIStatL(path.c_str(), &stat_buf) == 0) {
        if (driver->Delete(path.c_str()) != CE_None && VSIUnlink(path.c_str()) != 0) {
            last_error_ = "Cannot replace existing file '" + path + "': " +
                          lastGDALError("delete failed");
            return false;
        }
        CPLErrorReset();
    }

    GDALDatasetUniquePtr ds(driver->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!ds) {
        last_error_ = "Cannot create '" + path + "': " + lastGDALError("driver refused");
        return false;
    }

    std::unique_ptr<OGRSpatialReference> srs;
    if (features.hasReference()) {
        srs = std::make_unique<OGRSpatialReference>();
        srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        if (srs->SetFromUserInput(features.getReference().c_str()) != OGRERR_NONE) {
            last_error_ = "Cannot interpret reference system '" + features.getReference() + "'";
            return false;
        }
    }

    const std::string layer_name = std::filesystem::path(path).stem().string();
    OGRLayer* layer = ds->CreateLayer(layer_name.c_str(), srs.get(), wkbUnknown, nullptr);
    if (!layer) {
        last_error_ = "Cannot create layer in '" + path + "': " + lastGDALError("unknown error");
        return false;
    }

    const auto& fields = features.getFields();
    for (const auto& field : fields) {
        OGRFieldDefn fd(field.name.c_str(), toOGRFieldType(field.type));
        fd.SetSubType(toOGRFieldSubType(field.subtype));
        fd.SetWidth(field.width);
        fd.SetPrecision(field.precision);
        if (layer->CreateField(&fd) != OGRERR_NONE) {
            last_error_ = "Cannot create field '" + field.name + "' in '" + path + "'";
            return false;
        }
    }

    for (const auto& src : features.getFeatures()) {
        OGRFeature feature(layer->GetLayerDefn());
        for (size_t i = 0; i < fields.size(); ++i) {
            writeValue(feature, static_cast<int>(i), src.values[i]);
        }
        if (auto geom = toOGRGeometry(src.geometry, features.hasZ())) {
            feature.SetGeometryDirectly(geom.release());
        }
        if (layer->CreateFeature(&feature) != OGRERR_NONE) {
            last_error_ = "Cannot write feature to '" + path + "': " + lastGDALError("unknown error");
            return false;
        }
    }

    // Closing flushes the file
    ds.reset();
    if (CPLGetLastErrorType() == CE_Failure) {
        last_error_ = "Error while finalizing '" + path + "': " + lastGDALError("unknown error");
        return false;
    }
    return true;
}

} // namespace FSPLIT
