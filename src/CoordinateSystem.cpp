#include "CoordinateSystem.hpp"
#include <proj.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace FSPLIT {

namespace {

std::string trimmed(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool isAllDigits(const std::string& str) {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool looksLikeWKT(const std::string& str) {
    static const char* const keywords[] = {
        "GEOGCS[", "PROJCS[", "GEOCCS[", "COMPD_CM[", "GEOGCRS[", "PROJCRS[",
        "GEODCRS[", "BOUNDCRS[", "COMPOUNDCRS[", "VERTCRS[", "ENGCRS["
    };
    for (const char* kw : keywords) {
        if (str.rfind(kw, 0) == 0) return true;
    }
    return false;
}

} // namespace

// ============================================================================
// CRSDefinition Implementation
// ============================================================================

const std::string& CRSDefinition::identifier() const {
    if (!epsg_code.empty()) return epsg_code;
    if (!proj_string.empty()) return proj_string;
    return wkt;
}

CRSDefinition CRSDefinition::fromIdentifier(const std::string& id) {
    CRSDefinition def;
    std::string norm = normalizeReferenceId(id);
    if (norm.empty()) return def;

    if (norm[0] == '+' || norm.rfind("proj=", 0) == 0) {
        def.proj_string = norm;
    } else if (looksLikeWKT(norm)) {
        def.wkt = norm;
    } else {
        def.epsg_code = norm;
    }
    return def;
}

std::string normalizeReferenceId(const std::string& id) {
    std::string norm = trimmed(id);
    if (norm.empty()) return norm;

    // Just a number: EPSG code
    if (isAllDigits(norm)) {
        return "EPSG:" + norm;
    }

    // auth:code form, e.g. "epsg:4326"
    size_t colon = norm.find(':');
    if (colon != std::string::npos && colon > 0 &&
        norm.find_first_of(" [+=") == std::string::npos) {
        std::string auth = norm.substr(0, colon);
        std::transform(auth.begin(), auth.end(), auth.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return auth + norm.substr(colon);
    }

    return norm;
}

// ============================================================================
// CoordinateTransformer Implementation
// ============================================================================

CoordinateTransformer::CoordinateTransformer()
    : ctx_(proj_context_create()), transform_(nullptr), is_valid_(false) {
}

CoordinateTransformer::~CoordinateTransformer() {
    cleanup();
}

CoordinateTransformer::CoordinateTransformer(CoordinateTransformer&& other) noexcept
    : source_crs_(std::move(other.source_crs_)),
      target_crs_(std::move(other.target_crs_)),
      ctx_(other.ctx_),
      transform_(other.transform_),
      is_valid_(other.is_valid_),
      last_error_(std::move(other.last_error_)) {
    other.ctx_ = nullptr;
    other.transform_ = nullptr;
    other.is_valid_ = false;
}

CoordinateTransformer& CoordinateTransformer::operator=(CoordinateTransformer&& other) noexcept {
    if (this != &other) {
        cleanup();
        source_crs_ = std::move(other.source_crs_);
        target_crs_ = std::move(other.target_crs_);
        ctx_ = other.ctx_;
        transform_ = other.transform_;
        is_valid_ = other.is_valid_;
        last_error_ = std::move(other.last_error_);
        other.ctx_ = nullptr;
        other.transform_ = nullptr;
        other.is_valid_ = false;
    }
    return *this;
}

void CoordinateTransformer::cleanup() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    if (ctx_) {
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
    }
    is_valid_ = false;
}

void CoordinateTransformer::setSourceCRS(const std::string& id) {
    source_crs_ = CRSDefinition::fromIdentifier(id);
    is_valid_ = false;
}

void CoordinateTransformer::setTargetCRS(const std::string& id) {
    target_crs_ = CRSDefinition::fromIdentifier(id);
    is_valid_ = false;
}

bool CoordinateTransformer::initialize(const std::string& source_id, const std::string& target_id) {
    setSourceCRS(source_id);
    setTargetCRS(target_id);
    return initialize();
}

bool CoordinateTransformer::initialize() {
    last_error_.clear();
    is_valid_ = false;

    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    if (!ctx_) {
        ctx_ = proj_context_create();
    }

    if (source_crs_.empty()) {
        last_error_ = "Source CRS not specified";
        return false;
    }
    if (target_crs_.empty()) {
        last_error_ = "Target CRS not specified";
        return false;
    }

    const std::string& src_str = source_crs_.identifier();
    const std::string& tgt_str = target_crs_.identifier();

    // Create transformation
    transform_ = proj_create_crs_to_crs(ctx_, src_str.c_str(), tgt_str.c_str(), nullptr);

    if (!transform_) {
        int err = proj_context_errno(ctx_);
        last_error_ = "Failed to create transformation from '" + src_str + "' to '" +
                      tgt_str + "': " + proj_context_errno_string(ctx_, err);
        return false;
    }

    // Normalize for longitude/latitude ordering
    PJ* norm = proj_normalize_for_visualization(ctx_, transform_);
    if (norm) {
        proj_destroy(transform_);
        transform_ = norm;
    }

    is_valid_ = true;
    return true;
}

bool CoordinateTransformer::transform(double* x, double* y, size_t n) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        return false;
    }
    if (n == 0) return true;

    size_t done = proj_trans_generic(
        transform_, PJ_FWD,
        x, sizeof(double), n,
        y, sizeof(double), n,
        nullptr, 0, 0,
        nullptr, 0, 0
    );

    // Failed points come back as HUGE_VAL
    bool all_finite = true;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            all_finite = false;
            break;
        }
    }

    if (done != n || !all_finite) {
        last_error_ = "Not all points transformed successfully from '" +
                      source_crs_.identifier() + "' to '" + target_crs_.identifier() + "'";
        return false;
    }

    return true;
}

std::string CoordinateTransformer::getProjVersion() {
    return std::string(proj_info().version);
}

} // namespace FSPLIT
