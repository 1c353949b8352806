/**
 * @file test_spatial_join.cpp
 * @brief Unit tests for the fault/region intersection join
 */

#include <gtest/gtest.h>
#include "SpatialJoin.hpp"
#include "TestHelpers.hpp"

#include <algorithm>

using namespace FSPLIT;
using namespace FSPLIT::test;

namespace {

// Every intersecting pair by exhaustive comparison
std::vector<JoinRecord> bruteForce(const FeatureSet& faults, const FeatureSet& regions) {
    std::vector<JoinRecord> out;
    for (std::size_t f = 0; f < faults.size(); ++f) {
        for (std::size_t r = 0; r < regions.size(); ++r) {
            if (intersects(faults.getFeature(f).geometry, regions.getFeature(r).geometry)) {
                out.push_back(JoinRecord{f, r});
            }
        }
    }
    return out;
}

} // namespace

class SpatialJoinTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Three side-by-side regions and one far away
        regions = makeRegionSet();
        addRegion(regions, std::string("West"), makeBox(0, 0, 10, 10));
        addRegion(regions, std::string("Middle"), makeBox(10, 0, 20, 10));
        addRegion(regions, std::string("East"), makeBox(20, 0, 30, 10));
        addRegion(regions, std::string("Island"), makeBox(100, 100, 101, 101));

        faults = makeFaultSet();
        addFault(faults, "inside_west", makeLine(2, 2, 4, 4));
        addFault(faults, "spans_all", makeLine(5, 5, 25, 5));
        addFault(faults, "outside", makeLine(50, 50, 60, 60));
        addFault(faults, "no_geometry", Geometry());
        addFault(faults, "border", makeLine(10, 1, 10, 2));
        // Envelope overlaps the island box, trace stays clear of it
        addFault(faults, "near_island", makeLine(99, 103.5, 103.5, 99));
    }

    JoinResult runJoin() const {
        Diagnostics diagnostics;
        SpatialJoinEngine engine(PETSC_COMM_SELF, RegionIndex::build(regions, diagnostics));
        engine.setProgressInterval(0);
        return engine.join(faults, regions);
    }

    FeatureSet regions;
    FeatureSet faults;
};

TEST_F(SpatialJoinTest, MatchesExhaustiveComparison) {
    JoinResult result = runJoin();
    EXPECT_EQ(result.records, bruteForce(faults, regions));
    EXPECT_TRUE(std::is_sorted(result.records.begin(), result.records.end()));
}

TEST_F(SpatialJoinTest, ReplicatesAcrossRegions) {
    JoinResult result = runJoin();
    std::size_t spans = std::count_if(result.records.begin(), result.records.end(),
                                      [](const JoinRecord& r) { return r.fault_index == 1; });
    EXPECT_EQ(spans, 3u);

    std::size_t border = std::count_if(result.records.begin(), result.records.end(),
                                       [](const JoinRecord& r) { return r.fault_index == 4; });
    EXPECT_EQ(border, 2u);
}

TEST_F(SpatialJoinTest, NoPhantomAssignments) {
    JoinResult result = runJoin();
    for (const auto& rec : result.records) {
        EXPECT_TRUE(intersects(faults.getFeature(rec.fault_index).geometry,
                               regions.getFeature(rec.region_index).geometry));
        EXPECT_NE(rec.fault_index, 2u);
        EXPECT_NE(rec.fault_index, 5u);
    }
}

TEST_F(SpatialJoinTest, CountsSkippedAndUnassigned) {
    JoinResult result = runJoin();
    EXPECT_EQ(result.faults_examined, 6u);
    ASSERT_EQ(result.skipped_faults.size(), 1u);
    EXPECT_EQ(result.skipped_faults[0], 3u);
    EXPECT_EQ(result.unassigned_faults, 2u);
    EXPECT_GE(result.candidate_tests, result.records.size());
}

TEST_F(SpatialJoinTest, Deterministic) {
    JoinResult first = runJoin();
    JoinResult second = runJoin();
    EXPECT_EQ(first.records, second.records);
}

TEST_F(SpatialJoinTest, RangesConcatenateToFullJoin) {
    Diagnostics diagnostics;
    SpatialJoinEngine engine(PETSC_COMM_SELF, RegionIndex::build(regions, diagnostics));
    engine.setProgressInterval(0);

    JoinResult head = engine.joinRange(faults, regions, 0, 2);
    JoinResult tail = engine.joinRange(faults, regions, 2, faults.size());
    std::vector<JoinRecord> combined = head.records;
    combined.insert(combined.end(), tail.records.begin(), tail.records.end());

    EXPECT_EQ(combined, engine.join(faults, regions).records);
    EXPECT_TRUE(engine.joinRange(faults, regions, 4, 2).records.empty());
}

TEST_F(SpatialJoinTest, EmptyRegionSet) {
    FeatureSet none = makeRegionSet();
    Diagnostics diagnostics;
    SpatialJoinEngine engine(PETSC_COMM_SELF, RegionIndex::build(none, diagnostics));
    JoinResult result = engine.join(faults, none);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(result.unassigned_faults, 5u);
}

TEST_F(SpatialJoinTest, DistributedJoinMatchesSerialOnRoot) {
    int rank;
    MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

    Diagnostics diagnostics;
    SpatialJoinEngine engine(PETSC_COMM_WORLD, RegionIndex::build(regions, diagnostics));
    engine.setProgressInterval(50);
    JoinResult result = engine.join(faults, regions);

    if (rank == 0) {
        EXPECT_EQ(result.records, bruteForce(faults, regions));
        EXPECT_EQ(result.faults_examined, faults.size());
        EXPECT_EQ(result.skipped_faults.size(), 1u);
    } else {
        EXPECT_TRUE(result.records.empty());
    }
}

TEST(JoinProgressTest, SingleRankReportsWholeJoin) {
    EXPECT_EQ(formatJoinProgress(50, 5, 10, 1), "  Join progress:  50% (5/10 faults)");
}

TEST(JoinProgressTest, MultipleRanksLabelTheLocalBlock) {
    std::string line = formatJoinProgress(100, 3, 3, 4);
    EXPECT_NE(line.find("rank 0 block of 4"), std::string::npos);
    EXPECT_NE(line.find("100% (3/3 faults)"), std::string::npos);
}
