#include "SpatialJoin.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace FSPLIT {

namespace {

// Gather a flat list of indices from every rank onto rank 0 (rank order kept)
std::vector<unsigned long long> gatherIndices(MPI_Comm comm, int rank, int size,
                                              const std::vector<unsigned long long>& local) {
    int local_count = static_cast<int>(local.size());
    std::vector<int> counts(rank == 0 ? size : 0);
    MPI_Gather(&local_count, 1, MPI_INT, counts.data(), 1, MPI_INT, 0, comm);

    std::vector<int> displs;
    std::vector<unsigned long long> all;
    if (rank == 0) {
        displs.resize(static_cast<size_t>(size), 0);
        int total = 0;
        for (int r = 0; r < size; ++r) {
            displs[static_cast<size_t>(r)] = total;
            total += counts[static_cast<size_t>(r)];
        }
        all.resize(static_cast<size_t>(total));
    }

    MPI_Gatherv(local.data(), local_count, MPI_UNSIGNED_LONG_LONG,
                all.data(), counts.data(), displs.data(), MPI_UNSIGNED_LONG_LONG,
                0, comm);
    return all;
}

} // namespace

std::string formatJoinProgress(int percent, std::size_t done, std::size_t total, int nranks) {
    char buf[128];
    if (nranks > 1) {
        std::snprintf(buf, sizeof(buf), "  Join progress (rank 0 block of %d): %3d%% (%llu/%llu faults)",
                      nranks, percent, static_cast<unsigned long long>(done),
                      static_cast<unsigned long long>(total));
    } else {
        std::snprintf(buf, sizeof(buf), "  Join progress: %3d%% (%llu/%llu faults)", percent,
                      static_cast<unsigned long long>(done), static_cast<unsigned long long>(total));
    }
    return buf;
}

SpatialJoinEngine::SpatialJoinEngine(MPI_Comm comm, RegionIndex index)
    : comm_(comm), rank_(0), size_(1), index_(std::move(index)), progress_interval_(10) {
    MPI_Comm_rank(comm_, &rank_);
    MPI_Comm_size(comm_, &size_);
}

JoinResult SpatialJoinEngine::joinRange(const FeatureSet& faults, const FeatureSet& regions,
                                        std::size_t begin, std::size_t end) const {
    JoinResult result;
    end = std::min(end, faults.size());
    if (begin >= end) return result;

    const std::size_t total = end - begin;
    int next_report = progress_interval_ > 0 ? progress_interval_ : 101;

    for (std::size_t f = begin; f < end; ++f) {
        const Geometry& fault_geom = faults.getFeature(f).geometry;
        ++result.faults_examined;

        if (isEmpty(fault_geom)) {
            result.skipped_faults.push_back(f);
        } else {
            const GeoBox box = envelope(fault_geom);
            bool assigned = false;

            // Candidates come back ascending, so records stay (fault, region)-ordered
            for (std::size_t r : index_.query(box)) {
                ++result.candidate_tests;
                if (intersects(fault_geom, regions.getFeature(r).geometry)) {
                    result.records.push_back(JoinRecord{f, r});
                    assigned = true;
                }
            }
            if (!assigned) ++result.unassigned_faults;
        }

        const int percent = static_cast<int>(100.0 * static_cast<double>(f - begin + 1) /
                                             static_cast<double>(total));
        if (percent >= next_report) {
            PetscPrintf(comm_, "%s\n",
                        formatJoinProgress(percent, f - begin + 1, total, size_).c_str());
            while (next_report <= percent) next_report += progress_interval_;
        }
    }

    return result;
}

JoinResult SpatialJoinEngine::join(const FeatureSet& faults, const FeatureSet& regions) const {
    if (size_ == 1) {
        return joinRange(faults, regions, 0, faults.size());
    }

    const std::size_t n = faults.size();
    const std::size_t begin = n * static_cast<std::size_t>(rank_) / static_cast<std::size_t>(size_);
    const std::size_t end = n * static_cast<std::size_t>(rank_ + 1) / static_cast<std::size_t>(size_);

    JoinResult result = joinRange(faults, regions, begin, end);
    gatherToRoot(result);
    return result;
}

void SpatialJoinEngine::gatherToRoot(JoinResult& result) const {
    std::vector<unsigned long long> flat_records;
    flat_records.reserve(result.records.size() * 2);
    for (const auto& rec : result.records) {
        flat_records.push_back(rec.fault_index);
        flat_records.push_back(rec.region_index);
    }
    std::vector<unsigned long long> flat_skipped(result.skipped_faults.begin(),
                                                 result.skipped_faults.end());

    std::vector<unsigned long long> all_records = gatherIndices(comm_, rank_, size_, flat_records);
    std::vector<unsigned long long> all_skipped = gatherIndices(comm_, rank_, size_, flat_skipped);

    unsigned long long local_counts[3] = {
        result.faults_examined, result.unassigned_faults, result.candidate_tests
    };
    unsigned long long global_counts[3] = {0, 0, 0};
    MPI_Reduce(local_counts, global_counts, 3, MPI_UNSIGNED_LONG_LONG, MPI_SUM, 0, comm_);

    result.records.clear();
    result.skipped_faults.clear();
    if (rank_ != 0) {
        result.faults_examined = 0;
        result.unassigned_faults = 0;
        result.candidate_tests = 0;
        return;
    }

    result.records.reserve(all_records.size() / 2);
    for (size_t i = 0; i + 1 < all_records.size(); i += 2) {
        result.records.push_back(JoinRecord{static_cast<std::size_t>(all_records[i]),
                                            static_cast<std::size_t>(all_records[i + 1])});
    }
    // Blocks are contiguous, but sort anyway so the order never depends on rank layout
    std::sort(result.records.begin(), result.records.end());

    result.skipped_faults.assign(all_skipped.begin(), all_skipped.end());
    std::sort(result.skipped_faults.begin(), result.skipped_faults.end());

    result.faults_examined = static_cast<std::size_t>(global_counts[0]);
    result.unassigned_faults = static_cast<std::size_t>(global_counts[1]);
    result.candidate_tests = static_cast<std::size_t>(global_counts[2]);
}

} // namespace FSPLIT
