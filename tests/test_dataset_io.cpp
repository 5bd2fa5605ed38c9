#include <gtest/gtest.h>

#include "io/benchmark_results.h"
#include "io/dataset_catalog.h"
#include "io/dataset_loader.h"
#include "io/schema_loader.h"
#include "test_helpers.h"
#include "utils/exceptions.h"

using test_helpers::gnssRecord;
using test_helpers::imuRecord;
using test_helpers::TempDir;

// ---------------------------------------------------------------------------
// DatasetLoader
// ---------------------------------------------------------------------------

TEST(DatasetLoader, LoadsRecordsUnderCategoryKey)
{
    TempDir dir;
    const auto path = dir.writeJson("gnss_01.json",
                                    {{"gnss_data", {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 11)}}});

    auto d = DatasetLoader::loadFile(path.string(), SensorCategory::Gnss);

    EXPECT_EQ(d.name, "gnss_01.json");
    EXPECT_EQ(d.category, SensorCategory::Gnss);
    ASSERT_EQ(d.size(), 2u);
    EXPECT_DOUBLE_EQ(*d.records[1].get(FieldId::LlaAltitude), 11.0);
    EXPECT_GT(d.sizeBytes, 0u);
}

TEST(DatasetLoader, MissingKeyGivesEmptyDataset)
{
    TempDir dir;
    const auto path = dir.writeJson("imu_01.json", {{"gnss_data", {gnssRecord(0, 22, 114, 10)}}});

    auto d = DatasetLoader::loadFile(path.string(), SensorCategory::Imu);
    EXPECT_TRUE(d.empty());
}

TEST(DatasetLoader, SkipsNonObjectRecords)
{
    TempDir dir;
    const auto path = dir.write("imu_01.json",
                                "{\"imu_data\": [1, {\"time_unix\": 0.5}, \"x\", {\"time_unix\": 1.5}]}");

    auto d = DatasetLoader::loadFile(path.string(), SensorCategory::Imu);
    ASSERT_EQ(d.size(), 2u);
    EXPECT_DOUBLE_EQ(*d.records[1].time, 1.5);
}

TEST(DatasetLoader, NonArrayPayloadGivesEmptyDataset)
{
    TempDir dir;
    const auto path = dir.write("imu_01.json", "{\"imu_data\": {\"time_unix\": 0.5}}");
    EXPECT_TRUE(DatasetLoader::loadFile(path.string(), SensorCategory::Imu).empty());

    const auto list = dir.write("imu_02.json", "[1, 2, 3]");
    EXPECT_TRUE(DatasetLoader::loadFile(list.string(), SensorCategory::Imu).empty());
}

TEST(DatasetLoader, Errors)
{
    TempDir dir;
    EXPECT_THROW(DatasetLoader((dir.path() / "none.json").string(), SensorCategory::Gnss),
                 nav_eval::FileException);

    const auto broken = dir.write("gnss_bad.json", "{\"gnss_data\": [");
    EXPECT_THROW(DatasetLoader::loadFile(broken.string(), SensorCategory::Gnss), nav_eval::DataException);
}

TEST(DatasetLoader, NumberOverflowIsDataError)
{
    TempDir dir;
    const auto path = dir.write("gnss_01.json", "{\"gnss_data\": [{\"time_unix\": 1e400}]}");
    EXPECT_THROW(DatasetLoader::loadFile(path.string(), SensorCategory::Gnss), nav_eval::DataException);
}

TEST(DatasetLoader, LoadIsIdempotent)
{
    TempDir dir;
    const auto path = dir.writeJson("gnss_01.json", {{"gnss_data", {gnssRecord(0, 22, 114, 10)}}});

    DatasetLoader loader(path.string(), SensorCategory::Gnss);
    EXPECT_FALSE(loader.loaded());
    EXPECT_EQ(loader.load().size(), 1u);
    EXPECT_TRUE(loader.loaded());
    EXPECT_EQ(loader.load().size(), 1u);
}

// ---------------------------------------------------------------------------
// SchemaLoader
// ---------------------------------------------------------------------------

TEST(SchemaLoader, SidecarPath)
{
    EXPECT_EQ(SchemaLoader::sidecarPath("/data/ground_truth"), "/data/metadata/schema_documentation.json");
    EXPECT_EQ(SchemaLoader::sidecarPath("/data/ground_truth/"), "/data/metadata/schema_documentation.json");
}

TEST(SchemaLoader, LoadsRequiredFields)
{
    TempDir dir;
    const auto path = dir.writeJson("schema.json",
                                    {{"gnss", {{"required_fields", nlohmann::json::array({"time_unix", "dop.hdop"})}}},
                                     {"imu", {{"description", "no list"}}}});

    auto schema = SchemaLoader::load(path.string());
    ASSERT_TRUE(schema.has_value());
    EXPECT_FALSE(schema->inferred);
    EXPECT_EQ(schema->required(SensorCategory::Gnss), (std::vector<std::string>{"time_unix", "dop.hdop"}));
    EXPECT_TRUE(schema->required(SensorCategory::Imu).empty());
}

TEST(SchemaLoader, MissingFileGivesNothing)
{
    TempDir dir;
    EXPECT_FALSE(SchemaLoader::load((dir.path() / "absent.json").string()).has_value());
}

TEST(SchemaLoader, MalformedDocuments)
{
    TempDir dir;
    EXPECT_THROW(SchemaLoader::load(dir.write("a.json", "{").string()), nav_eval::DataException);
    EXPECT_THROW(SchemaLoader::load(dir.write("b.json", "[]").string()), nav_eval::DataException);
    EXPECT_THROW(SchemaLoader::load(dir.write("c.json", "{\"gnss\": 1}").string()), nav_eval::DataException);
    EXPECT_THROW(SchemaLoader::load(dir.write("d.json", "{\"gnss\": {\"required_fields\": \"x\"}}").string()),
                 nav_eval::DataException);
    EXPECT_THROW(SchemaLoader::load(dir.write("e.json", "{\"imu\": {\"required_fields\": [1]}}").string()),
                 nav_eval::DataException);
    EXPECT_THROW(SchemaLoader::load(dir.write("f.json", "{\"gnss\": {\"version\": 1e400}}").string()),
                 nav_eval::DataException);
}

// ---------------------------------------------------------------------------
// DatasetCatalog
// ---------------------------------------------------------------------------

TEST(DatasetCatalog, PairsByFileName)
{
    TempDir dir;
    dir.writeJson("gt/gnss_02.json", {{"gnss_data", nlohmann::json::array()}});
    dir.writeJson("gt/GNSS_01.json", {{"gnss_data", nlohmann::json::array()}});
    dir.writeJson("gt/imu_01.json", {{"imu_data", nlohmann::json::array()}});
    dir.writeJson("gt/imu_unpaired.json", {{"imu_data", nlohmann::json::array()}});
    dir.writeJson("gt/readme.json", nlohmann::json::object());
    dir.write("gt/gnss_03.txt", "not json");
    dir.writeJson("conv/gnss_02.json", {{"gnss_data", nlohmann::json::array()}});
    dir.writeJson("conv/GNSS_01.json", {{"gnss_data", nlohmann::json::array()}});
    dir.writeJson("conv/imu_01.json", {{"imu_data", nlohmann::json::array()}});

    DatasetCatalog catalog((dir.path() / "gt").string(), (dir.path() / "conv").string());

    ASSERT_EQ(catalog.pairs().size(), 3u);
    EXPECT_EQ(catalog.pairs()[0].name, "GNSS_01.json");
    EXPECT_EQ(catalog.pairs()[0].category, SensorCategory::Gnss);
    EXPECT_EQ(catalog.pairs()[1].name, "gnss_02.json");
    EXPECT_EQ(catalog.pairs()[2].name, "imu_01.json");
    EXPECT_EQ(catalog.pairs()[2].category, SensorCategory::Imu);

    EXPECT_EQ(catalog.groundTruthFiles(SensorCategory::Imu).size(), 2u);
}

TEST(DatasetCatalog, CategoryFromFileName)
{
    EXPECT_EQ(DatasetCatalog::categoryOf("run_GNSS.json"), SensorCategory::Gnss);
    EXPECT_EQ(DatasetCatalog::categoryOf("imu_fast.json"), SensorCategory::Imu);
    EXPECT_EQ(DatasetCatalog::categoryOf("gnss_imu.json"), SensorCategory::Gnss);
    EXPECT_FALSE(DatasetCatalog::categoryOf("lidar.json").has_value());
}

TEST(DatasetCatalog, MissingDirectory)
{
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "gt");
    EXPECT_THROW(DatasetCatalog((dir.path() / "gt").string(), (dir.path() / "missing").string()),
                 nav_eval::FileException);
}

// ---------------------------------------------------------------------------
// BenchmarkResults
// ---------------------------------------------------------------------------

TEST(BenchmarkResults, WriteThenRead)
{
    TempDir dir;
    BenchmarkResults results;
    results.timestamp = "2024-01-01T00:00:00";
    results.inputFiles = {{"raw/gnss.nmea", 1024}};
    results.totalTimeSeconds = 2.0;
    results.averageTimePerFileSeconds = 2.0;
    results.peakMemoryUsageMb = 12.5;
    results.averageCpuPercent = 80.0;

    const auto path = (dir.path() / "benchmark_results.json").string();
    BenchmarkResultsIO::write(results, path);
    auto back = BenchmarkResultsIO::read(path);

    EXPECT_EQ(back.timestamp, results.timestamp);
    EXPECT_EQ(back.inputFiles, results.inputFiles);
    EXPECT_DOUBLE_EQ(back.peakMemoryUsageMb, 12.5);
    EXPECT_DOUBLE_EQ(back.averageCpuPercent, 80.0);
    EXPECT_EQ(back.exitCode, 0);
}

TEST(BenchmarkResults, MissingRequiredKey)
{
    TempDir dir;
    const auto path = dir.writeJson("b.json", {{"total_time_seconds", 1.0}});
    EXPECT_THROW(BenchmarkResultsIO::read(path.string()), nav_eval::DataException);
    EXPECT_THROW(BenchmarkResultsIO::read((dir.path() / "absent.json").string()), nav_eval::FileException);

    const auto overflow = dir.write("c.json", "{\"total_time_seconds\": 1e400}");
    EXPECT_THROW(BenchmarkResultsIO::read(overflow.string()), nav_eval::DataException);
}
