#include "FaultPartitioner.hpp"
#include "ConfigReader.hpp"
#include "ReferenceNormalizer.hpp"
#include "RegionGrouper.hpp"
#include "RegionIndex.hpp"
#include "RegionNaming.hpp"
#include "SpatialJoin.hpp"

#include <filesystem>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>

namespace FSPLIT {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) oss << ", ";
        oss << names[i];
    }
    return oss.str();
}

long long asLL(std::size_t n) {
    return static_cast<long long>(n);
}

} // namespace

FaultPartitioner::FaultPartitioner(MPI_Comm comm_in)
    : FaultPartitioner(comm_in,
                       std::make_unique<OGRFeatureSetReader>(),
                       std::make_unique<OGRFeatureSetWriter>(),
                       std::make_unique<CoordinateTransformer>()) {
}

FaultPartitioner::FaultPartitioner(MPI_Comm comm_in,
                                   std::unique_ptr<FeatureSetReader> reader,
                                   std::unique_ptr<FeatureSetWriter> writer,
                                   std::unique_ptr<ReprojectionService> reprojection)
    : comm(comm_in), rank(0),
      reader_(std::move(reader)),
      writer_(std::move(writer)),
      reprojection_(std::move(reprojection)) {
    MPI_Comm_rank(comm, &rank);
}

FaultPartitioner::~FaultPartitioner() = default;

PetscErrorCode FaultPartitioner::initialize(const PartitionConfig& config) {
    PetscFunctionBeginUser;

    config_ = config;

    // Reader and writer follow the configured GDAL options
    if (dynamic_cast<OGRFeatureSetReader*>(reader_.get())) {
        reader_ = std::make_unique<OGRFeatureSetReader>(config_.restore_shx);
    }
    if (dynamic_cast<OGRFeatureSetWriter*>(writer_.get())) {
        writer_ = std::make_unique<OGRFeatureSetWriter>(config_.output_driver);
    }

    if (rank == 0) {
        PetscPrintf(comm, "Configuration:\n");
        PetscPrintf(comm, "  Faults:        %s\n", config_.faults_path.c_str());
        PetscPrintf(comm, "  Regions:       %s\n", config_.regions_path.c_str());
        PetscPrintf(comm, "  Name field:    %s\n", config_.region_name_field.c_str());
        PetscPrintf(comm, "  Output folder: %s\n", config_.output_dir.c_str());
        PetscPrintf(comm, "  Output driver: %s\n", config_.output_driver.c_str());
    }

    PetscFunctionReturn(0);
}

PetscErrorCode FaultPartitioner::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    PartitionConfig config = config_;
    reader.parsePartitionConfig(config);
    ierr = initialize(config); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

SetupResult<FeatureSet> FaultPartitioner::loadInput(const std::string& label,
                                                    const std::string& path) {
    if (rank == 0) {
        PetscPrintf(comm, "Loading %s data from: %s\n", label.c_str(), path.c_str());
    }

    SetupResult<FeatureSet> loaded = reader_->load(path);
    if (!loaded.ok()) {
        return SetupResult<FeatureSet>::fatal("Error loading " + label + " from " + path + ": " +
                                              loaded.error());
    }

    if (rank == 0) {
        PetscPrintf(comm, "Loaded %lld %s features.\n", asLL(loaded.value().size()), label.c_str());
    }
    return loaded;
}

SetupResult<bool> FaultPartitioner::ensureOutputDirectory() {
    int status = 0;
    std::string message;
    bool created = false;

    if (rank == 0) {
        std::error_code ec;
        created = std::filesystem::create_directories(config_.output_dir, ec);
        if (ec) {
            message = "Cannot create output folder '" + config_.output_dir + "': " + ec.message();
            status = 1;
        } else if (!std::filesystem::is_directory(config_.output_dir, ec)) {
            message = "Output path '" + config_.output_dir + "' exists and is not a folder";
            status = 1;
        } else if (created) {
            PetscPrintf(comm, "Created output folder: %s\n", config_.output_dir.c_str());
        }
    }

    MPI_Bcast(&status, 1, MPI_INT, 0, comm);
    if (status != 0) {
        if (message.empty()) {
            message = "Output folder '" + config_.output_dir + "' could not be created on rank 0";
        }
        return SetupResult<bool>::fatal(message);
    }
    return SetupResult<bool>::success(created);
}

SetupResult<std::size_t> FaultPartitioner::checkRegionNameField(const FeatureSet& regions) const {
    const auto idx = regions.findField(config_.region_name_field);
    if (!idx) {
        return SetupResult<std::size_t>::fatal(
            "Column '" + config_.region_name_field + "' not found in region data. " +
            "Available columns: [" + joinNames(regions.getFieldNames()) + "]. " +
            "Set REGIONS.name_field (or -name_field) to one of them.");
    }

    if (rank == 0 && regions.getFields()[*idx].type != FieldType::TEXT) {
        PetscPrintf(comm, "Warning: column '%s' is not a text field; its values are not usable "
                    "region names\n", config_.region_name_field.c_str());
    }
    return SetupResult<std::size_t>::success(*idx);
}

SetupResult<PartitionSummary> FaultPartitioner::execute() {
    PartitionSummary summary;
    summary_ = summary;

    ConfigReader::ValidationResult validation = ConfigReader::validate(config_);
    if (rank == 0) {
        for (const auto& w : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", w.c_str());
        }
    }
    if (!validation.valid) {
        return SetupResult<PartitionSummary>::fatal("Invalid configuration: " +
                                                    joinNames(validation.errors));
    }

    // -------------------------------------------------------------------------
    // Output folder
    // -------------------------------------------------------------------------
    SetupResult<bool> dir = ensureOutputDirectory();
    if (!dir.ok()) {
        return SetupResult<PartitionSummary>::fatal(dir.error());
    }

    // -------------------------------------------------------------------------
    // Inputs
    // -------------------------------------------------------------------------
    SetupResult<FeatureSet> faults = loadInput("faults", config_.faults_path);
    if (!faults.ok()) {
        return SetupResult<PartitionSummary>::fatal(faults.error());
    }
    SetupResult<FeatureSet> regions = loadInput("regions", config_.regions_path);
    if (!regions.ok()) {
        return SetupResult<PartitionSummary>::fatal(regions.error());
    }
    FeatureSet& fault_set = faults.value();
    FeatureSet& region_set = regions.value();
    summary.faults_loaded = fault_set.size();
    summary.regions_loaded = region_set.size();

    SetupResult<std::size_t> name_field = checkRegionNameField(region_set);
    if (!name_field.ok()) {
        return SetupResult<PartitionSummary>::fatal(name_field.error());
    }

    // -------------------------------------------------------------------------
    // Reference systems
    // -------------------------------------------------------------------------
    const bool region_crs_missing = !region_set.hasReference();
    const std::string fault_crs_before = fault_set.getReference();
    const std::string region_crs_before = region_set.getReference();

    ReferenceNormalizer normalizer(*reprojection_, config_.default_crs);
    SetupResult<NormalizationOutcome> norm = normalizer.normalize(fault_set, region_set);
    if (!norm.ok()) {
        return SetupResult<PartitionSummary>::fatal(norm.error());
    }
    summary.reference_id = norm.value().reference_id;
    summary.reprojected = norm.value().reprojected;

    if (rank == 0) {
        if (region_crs_missing) {
            PetscPrintf(comm, "Region data has no CRS. Setting CRS to %s.\n",
                        region_set.getReference().c_str());
        }
        if (norm.value().fault_default_assigned) {
            PetscPrintf(comm, "Fault data has no CRS. Setting CRS to %s.\n",
                        fault_set.getReference().c_str());
        }
        if (norm.value().reprojected) {
            PetscPrintf(comm, "CRS mismatch detected. Faults CRS: %s, Regions CRS: %s\n",
                        fault_crs_before.c_str(),
                        region_crs_missing ? config_.default_crs.c_str() : region_crs_before.c_str());
            PetscPrintf(comm, "Converted regions to the fault CRS (%lld points).\n",
                        asLL(norm.value().points_transformed));
        } else {
            PetscPrintf(comm, "CRS match: %s\n", summary.reference_id.c_str());
        }
    }

    // -------------------------------------------------------------------------
    // Index + join
    // -------------------------------------------------------------------------
    Diagnostics index_diagnostics;
    RegionIndex index = RegionIndex::build(region_set, index_diagnostics);
    summary.regions_indexed = index.size();
    if (rank == 0) {
        PetscPrintf(comm, "Indexed %lld region bounding boxes.\n", asLL(summary.regions_indexed));
        PetscPrintf(comm, "Performing spatial join (this may take a while for large datasets)...\n");
    }

    SpatialJoinEngine engine(comm, std::move(index));
    const bool interval_ok = config_.progress_interval >= 0 && config_.progress_interval <= 100;
    engine.setProgressInterval(interval_ok ? config_.progress_interval : 0);

    const double join_start = MPI_Wtime();
    JoinResult joined = engine.join(fault_set, region_set);
    const double join_time = MPI_Wtime() - join_start;

    // Grouping and writing happen on rank 0 only
    if (rank != 0) {
        summary_ = summary;
        return SetupResult<PartitionSummary>::success(std::move(summary));
    }

    summary.join_records = joined.records.size();
    summary.unassigned_faults = joined.unassigned_faults;
    summary.skipped_faults = joined.skipped_faults.size();
    summary.diagnostics = std::move(index_diagnostics);
    if (!joined.skipped_faults.empty()) {
        std::ostringstream oss;
        oss << joined.skipped_faults.size() << " fault(s) without usable geometry were skipped (#";
        for (size_t i = 0; i < joined.skipped_faults.size() && i < 10; ++i) {
            if (i) oss << ", #";
            oss << joined.skipped_faults[i];
        }
        if (joined.skipped_faults.size() > 10) oss << ", ...";
        oss << ")";
        summary.diagnostics.push_back(oss.str());
    }

    PetscPrintf(comm, "Spatial join complete in %.2f s. Found %lld fault-region pairs "
                "(%lld faults outside every region).\n",
                join_time, asLL(summary.join_records), asLL(summary.unassigned_faults));

    // -------------------------------------------------------------------------
    // Group + write
    // -------------------------------------------------------------------------
    RegionGrouper grouper(config_.region_name_field);
    GroupingResult grouped = grouper.group(joined.records, fault_set, region_set);
    summary.groups = grouped.groups.size();
    summary.discarded_records = grouped.discarded_records;
    for (auto& d : grouped.diagnostics) {
        PetscPrintf(comm, "%s\n", d.c_str());
        summary.diagnostics.push_back(std::move(d));
    }

    PetscPrintf(comm, "Found %lld unique regions with associated fault data.\n",
                asLL(summary.groups));
    PetscPrintf(comm, "Splitting and saving fault data by region...\n");

    std::map<std::string, std::string> owner_of_path;
    for (size_t g = 0; g < grouped.groups.size(); ++g) {
        const RegionGroup& group = grouped.groups[g];
        const std::string slug = makeRegionSlug(group.region_id);
        const std::string path = regionOutputPath(config_.output_dir, config_.file_prefix,
                                                  slug, config_.file_extension);

        auto previous = owner_of_path.find(path);
        if (previous != owner_of_path.end()) {
            summary.diagnostics.push_back("Region '" + group.region_id + "' maps to the same file as '" +
                                          previous->second + "' (" + path + "); the earlier file is overwritten");
        }
        owner_of_path[path] = group.region_id;

        if (!writer_->write(path, group.features)) {
            ++summary.write_failures;
            std::string msg = "Error saving faults for " + group.region_id + " to " + path + ": " +
                              writer_->getLastError();
            PetscPrintf(comm, "%s\n", msg.c_str());
            summary.diagnostics.push_back(std::move(msg));
            continue;
        }

        ++summary.files_written;
        summary.written_files.push_back(path);
        PetscPrintf(comm, "  [%lld/%lld] %s -> %s (%lld faults)\n",
                    asLL(g + 1), asLL(grouped.groups.size()), group.region_id.c_str(),
                    path.c_str(), asLL(group.features.size()));
    }

    summary_ = summary;
    return SetupResult<PartitionSummary>::success(std::move(summary));
}

PetscErrorCode FaultPartitioner::run() {
    PetscFunctionBeginUser;

    SetupResult<PartitionSummary> result = execute();
    if (!result.ok()) {
        if (rank == 0) {
            PetscPrintf(comm, "\nError: %s\n", result.error().c_str());
        }
        SETERRQ(comm, PETSC_ERR_USER, "Fault partitioning aborted: %s", result.error().c_str());
    }

    printSummary();
    PetscFunctionReturn(0);
}

void FaultPartitioner::printSummary() const {
    if (rank != 0) return;

    PetscPrintf(comm, "\n--- Process complete! ---\n");
    PetscPrintf(comm, "  Faults loaded:         %lld\n", asLL(summary_.faults_loaded));
    PetscPrintf(comm, "  Regions loaded:        %lld\n", asLL(summary_.regions_loaded));
    PetscPrintf(comm, "  Reference system:      %s%s\n", summary_.reference_id.c_str(),
                summary_.reprojected ? " (regions reprojected)" : "");
    PetscPrintf(comm, "  Fault-region pairs:    %lld\n", asLL(summary_.join_records));
    PetscPrintf(comm, "  Unassigned faults:     %lld\n", asLL(summary_.unassigned_faults));
    PetscPrintf(comm, "  Regions with faults:   %lld\n", asLL(summary_.groups));
    PetscPrintf(comm, "  Files written:         %lld\n", asLL(summary_.files_written));
    PetscPrintf(comm, "  Write failures:        %lld\n", asLL(summary_.write_failures));

    if (!summary_.diagnostics.empty()) {
        PetscPrintf(comm, "\nIssues encountered (%lld):\n", asLL(summary_.diagnostics.size()));
        for (const auto& d : summary_.diagnostics) {
            PetscPrintf(comm, "  - %s\n", d.c_str());
        }
    }

    PetscPrintf(comm, "\nAll fault data has been split and saved into the '%s' folder.\n",
                config_.output_dir.c_str());
}

} // namespace FSPLIT
