#ifndef FAULT_PARTITIONER_HPP
#define FAULT_PARTITIONER_HPP

#include "FSPLIT.hpp"
#include "CoordinateSystem.hpp"
#include "Feature.hpp"
#include "FeatureIO.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace FSPLIT {

/**
 * @brief Counts and per-record issues of a finished run
 *
 * Only rank 0 holds the grouping and writing figures.
 */
struct PartitionSummary {
    std::size_t faults_loaded = 0;
    std::size_t regions_loaded = 0;
    std::string reference_id;
    bool reprojected = false;
    std::size_t regions_indexed = 0;
    std::size_t join_records = 0;
    std::size_t unassigned_faults = 0;
    std::size_t skipped_faults = 0;
    std::size_t discarded_records = 0;
    std::size_t groups = 0;
    std::size_t files_written = 0;
    std::size_t write_failures = 0;
    std::vector<std::string> written_files;
    Diagnostics diagnostics;
};

/**
 * @brief Splits a fault dataset into one output file per intersected region
 *
 * Pipeline: load -> normalize CRS -> index regions -> join -> group -> write.
 * Setup failures (unreadable input, unresolvable CRS, missing name field,
 * uncreatable output directory) abort the run; per-region problems are
 * collected as diagnostics and the run continues.
 */
class FaultPartitioner {
public:
    explicit FaultPartitioner(MPI_Comm comm);

    /**
     * @brief Use custom collaborators instead of the OGR/PROJ defaults
     */
    FaultPartitioner(MPI_Comm comm,
                     std::unique_ptr<FeatureSetReader> reader,
                     std::unique_ptr<FeatureSetWriter> writer,
                     std::unique_ptr<ReprojectionService> reprojection);

    ~FaultPartitioner();

    PetscErrorCode initialize(const PartitionConfig& config);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);

    /**
     * @brief Run the whole pipeline, printing progress and the final summary
     *
     * Fatal setup errors are raised as PETSc errors.
     */
    PetscErrorCode run();

    /**
     * @brief Run the pipeline and return the summary or the fatal error
     *
     * Collective over the communicator.
     */
    SetupResult<PartitionSummary> execute();

    const PartitionConfig& getConfig() const { return config_; }
    const PartitionSummary& getSummary() const { return summary_; }

private:
    MPI_Comm comm;
    int rank;

    PartitionConfig config_;
    PartitionSummary summary_;

    std::unique_ptr<FeatureSetReader> reader_;
    std::unique_ptr<FeatureSetWriter> writer_;
    std::unique_ptr<ReprojectionService> reprojection_;

    SetupResult<FeatureSet> loadInput(const std::string& label, const std::string& path);
    SetupResult<bool> ensureOutputDirectory();
    SetupResult<std::size_t> checkRegionNameField(const FeatureSet& regions) const;
    void printSummary() const;
};

} // namespace FSPLIT

#endif // FAULT_PARTITIONER_HPP
