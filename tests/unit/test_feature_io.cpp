/**
 * @file test_feature_io.cpp
 * @brief Unit tests for OGR dataset reading and writing
 */

#include <gtest/gtest.h>
#include "FeatureIO.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace FSPLIT;
using namespace FSPLIT::test;

namespace fs = std::filesystem;

class FeatureIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        int rank;
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        dir = fs::temp_directory_path() / ("fsplit_io_test_" + std::to_string(rank));
        fs::remove_all(dir);
        fs::create_directories(dir);

        faults = makeFaultSet();
        faults.setReference("EPSG:4326");
        addFault(faults, "Alpine Fault", makeLine(168.0, -44.0, 172.0, -42.0), 27.5);
        addFault(faults, "San Andreas", makeLine(-122.5, 37.5, -121.0, 36.0), 34.0);

        Feature unnamed;
        unnamed.geometry = makeLine(0, 0, 1, 1);
        unnamed.values = {AttributeValue(), AttributeValue(), AttributeValue(std::int64_t(3))};
        faults.addFeature(unnamed);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::string path(const std::string& name) const {
        return (dir / name).string();
    }

    fs::path dir;
    FeatureSet faults;
};

TEST_F(FeatureIOTest, GeoJSONRoundTripKeepsSchemaValuesAndReference) {
    OGRFeatureSetWriter writer("GeoJSON");
    ASSERT_TRUE(writer.write(path("faults.geojson"), faults)) << writer.getLastError();

    OGRFeatureSetReader reader;
    SetupResult<FeatureSet> loaded = reader.load(path("faults.geojson"));
    ASSERT_TRUE(loaded.ok()) << loaded.error();

    const FeatureSet& set = loaded.value();
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set.getFieldNames(), faults.getFieldNames());
    EXPECT_EQ(set.getReference(), "EPSG:4326");
    EXPECT_FALSE(set.hasZ());
    EXPECT_EQ(set.getFields()[2].type, FieldType::INTEGER);

    EXPECT_EQ(textField(set, 0, "name"), "Alpine Fault");
    EXPECT_DOUBLE_EQ(std::get<double>(set.getFeature(1).values[1]), 34.0);
    EXPECT_TRUE(isNull(set.getFeature(2).values[0]));
    EXPECT_EQ(std::get<std::int64_t>(set.getFeature(2).values[2]), 3);

    EXPECT_EQ(geometryKind(set.getFeature(0).geometry), GeometryKind::LINEAR);
    GeoBox box = envelope(set.getFeature(0).geometry);
    EXPECT_DOUBLE_EQ(box.min_corner().x, 168.0);
    EXPECT_DOUBLE_EQ(box.max_corner().y, -42.0);
}

TEST_F(FeatureIOTest, GeoJSONRoundTripKeepsZDatesListsAndBooleans) {
    FeatureSet traces({FieldDefinition("name", FieldType::TEXT),
                       FieldDefinition("mapped_on", FieldType::DATE),
                       FieldDefinition("active", FieldType::INTEGER, FieldSubType::BOOLEAN),
                       FieldDefinition("segments", FieldType::INTEGER_LIST),
                       FieldDefinition("sources", FieldType::TEXT_LIST)});
    traces.setReference("EPSG:4326");
    traces.setHasZ(true);

    Polyline line;
    line.push_back(GeoPoint(10.0, 45.0, -5.0));
    line.push_back(GeoPoint(11.0, 46.0, -6.5));
    MultiPolyline ml;
    ml.push_back(line);

    Feature f;
    f.geometry = ml;
    f.values = {AttributeValue(std::string("Periadriatic")),
                AttributeValue(std::string("2021/06/15")),
                AttributeValue(std::int64_t(1)),
                AttributeValue(std::vector<std::int64_t>{3, 4}),
                AttributeValue(std::vector<std::string>{"GEM", "DISS"})};
    traces.addFeature(f);

    OGRFeatureSetWriter writer("GeoJSON");
    ASSERT_TRUE(writer.write(path("traces.geojson"), traces)) << writer.getLastError();

    OGRFeatureSetReader reader;
    SetupResult<FeatureSet> loaded = reader.load(path("traces.geojson"));
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    const FeatureSet& set = loaded.value();
    ASSERT_EQ(set.size(), 1u);

    EXPECT_TRUE(set.hasZ());
    const auto& read_line = std::get<MultiPolyline>(set.getFeature(0).geometry).front();
    ASSERT_EQ(read_line.size(), 2u);
    EXPECT_DOUBLE_EQ(read_line[0].z, -5.0);
    EXPECT_DOUBLE_EQ(read_line[1].z, -6.5);

    const auto& fields = set.getFields();
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields[1].type, FieldType::DATE);
    EXPECT_EQ(textField(set, 0, "mapped_on"), "2021/06/15");

    EXPECT_EQ(fields[2].type, FieldType::INTEGER);
    EXPECT_EQ(fields[2].subtype, FieldSubType::BOOLEAN);
    EXPECT_EQ(std::get<std::int64_t>(set.getFeature(0).values[2]), 1);

    EXPECT_EQ(fields[3].type, FieldType::INTEGER_LIST);
    EXPECT_EQ(std::get<std::vector<std::int64_t>>(set.getFeature(0).values[3]),
              (std::vector<std::int64_t>{3, 4}));

    EXPECT_EQ(fields[4].type, FieldType::TEXT_LIST);
    EXPECT_EQ(std::get<std::vector<std::string>>(set.getFeature(0).values[4]),
              (std::vector<std::string>{"GEM", "DISS"}));
}

TEST_F(FeatureIOTest, WriterReplacesExistingFile) {
    OGRFeatureSetWriter writer;
    ASSERT_TRUE(writer.write(path("out.geojson"), faults));

    FeatureSet smaller(faults.getFields());
    smaller.setReference("EPSG:4326");
    smaller.addFeature(faults.getFeature(0));
    ASSERT_TRUE(writer.write(path("out.geojson"), smaller)) << writer.getLastError();

    OGRFeatureSetReader reader;
    SetupResult<FeatureSet> loaded = reader.load(path("out.geojson"));
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.value().size(), 1u);
}

TEST_F(FeatureIOTest, PolygonsLoadAsAreal) {
    FeatureSet regions = makeRegionSet();
    regions.setReference("EPSG:4326");
    addRegion(regions, std::string("Alpha"), makeBox(0, 0, 10, 10), "ALP");

    OGRFeatureSetWriter writer;
    ASSERT_TRUE(writer.write(path("regions.geojson"), regions));

    OGRFeatureSetReader reader;
    SetupResult<FeatureSet> loaded = reader.load(path("regions.geojson"));
    ASSERT_TRUE(loaded.ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(geometryKind(loaded.value().getFeature(0).geometry), GeometryKind::AREAL);
    EXPECT_EQ(textField(loaded.value(), 0, "NAME_EN"), "Alpha");
}

TEST_F(FeatureIOTest, ShapefileWithoutIndexNeedsRestore) {
    FeatureSet regions = makeRegionSet();
    regions.setReference("EPSG:4326");
    addRegion(regions, std::string("Alpha"), makeBox(0, 0, 10, 10), "ALP");
    addRegion(regions, std::string("Beta"), makeBox(20, 0, 30, 10), "BET");

    OGRFeatureSetWriter writer("ESRI Shapefile");
    ASSERT_TRUE(writer.write(path("regions.shp"), regions)) << writer.getLastError();
    ASSERT_TRUE(fs::exists(dir / "regions.shx"));
    fs::remove(dir / "regions.shx");

    OGRFeatureSetReader strict(false);
    SetupResult<FeatureSet> refused = strict.load(path("regions.shp"));
    ASSERT_FALSE(refused.ok());
    EXPECT_NE(refused.error().find("regions.shp"), std::string::npos);

    OGRFeatureSetReader restoring(true);
    SetupResult<FeatureSet> loaded = restoring.load(path("regions.shp"));
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    ASSERT_EQ(loaded.value().size(), 2u);
    EXPECT_EQ(textField(loaded.value(), 1, "NAME_EN"), "Beta");
    EXPECT_EQ(geometryKind(loaded.value().getFeature(0).geometry), GeometryKind::AREAL);
}

TEST_F(FeatureIOTest, MissingDatasetIsFatalAndNamesPath) {
    OGRFeatureSetReader reader;
    SetupResult<FeatureSet> loaded = reader.load(path("missing.geojson"));
    ASSERT_FALSE(loaded.ok());
    EXPECT_NE(loaded.error().find("missing.geojson"), std::string::npos);
}

TEST_F(FeatureIOTest, GarbageFileIsFatal) {
    std::ofstream(path("garbage.geojson")) << "this is not json";
    OGRFeatureSetReader reader;
    EXPECT_FALSE(reader.load(path("garbage.geojson")).ok());
}

TEST_F(FeatureIOTest, UnknownDriverFailsWrite) {
    OGRFeatureSetWriter writer("NoSuchDriver");
    EXPECT_FALSE(writer.write(path("x.geojson"), faults));
    EXPECT_NE(writer.getLastError().find("NoSuchDriver"), std::string::npos);
}

TEST_F(FeatureIOTest, UnwritableLocationFailsWrite) {
    OGRFeatureSetWriter writer;
    EXPECT_FALSE(writer.write(path("no_such_dir/out.geojson"), faults));
    EXPECT_FALSE(writer.getLastError().empty());
}
