#include <gtest/gtest.h>

#include "metrics/structural_metrics.h"
#include "test_helpers.h"

using test_helpers::gnssRecord;
using test_helpers::makeDataset;

namespace {

nlohmann::json withHdop(double t, double hdop)
{
    auto r = gnssRecord(t, 22, 114, 10);
    r["dop"] = {{"hdop", hdop}};
    return r;
}

} // namespace

TEST(StructuralMetrics, MissingRequiredFieldGivesZeroCompliance)
{
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 10)});

    auto r = StructuralMetrics::schemaCompliance(conv, {"dop.hdop"});
    ASSERT_TRUE(r.complianceScore.has_value());
    EXPECT_DOUBLE_EQ(*r.complianceScore, 0.0);
    EXPECT_EQ(r.compliantFields, 0u);
    EXPECT_EQ(r.totalFields, 2u);
}

TEST(StructuralMetrics, ComplianceCountsRecordFieldCells)
{
    auto conv = makeDataset(SensorCategory::Gnss, {withHdop(0, 0.9), gnssRecord(1, 22, 114, 10)});

    auto r = StructuralMetrics::schemaCompliance(conv, {"position_lla.latitude_deg", "dop.hdop"});
    EXPECT_EQ(r.totalFields, 4u);
    EXPECT_EQ(r.compliantFields, 3u);
    EXPECT_DOUBLE_EQ(*r.complianceScore, 75.0);
}

TEST(StructuralMetrics, NonNumericValueIsNotCompliant)
{
    nlohmann::json stringHdop = gnssRecord(0, 22, 114, 10);
    stringHdop["dop"] = {{"hdop", "0.9"}};
    auto conv = makeDataset(SensorCategory::Gnss, {stringHdop});

    auto r = StructuralMetrics::schemaCompliance(conv, {"dop.hdop"});
    EXPECT_EQ(r.compliantFields, 0u);
}

TEST(StructuralMetrics, EmptyInputsHaveNoScore)
{
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10)});

    auto noFields = StructuralMetrics::schemaCompliance(conv, {});
    EXPECT_EQ(noFields.totalFields, 0u);
    EXPECT_FALSE(noFields.complianceScore.has_value());

    auto noRecords = StructuralMetrics::schemaCompliance(Dataset(), {"dop.hdop"});
    EXPECT_EQ(noRecords.totalFields, 0u);
    EXPECT_FALSE(noRecords.complianceScore.has_value());
}

TEST(StructuralMetrics, FieldMappingAgainstAnyRecord)
{
    auto gt = makeDataset(SensorCategory::Gnss, {withHdop(0, 0.9), withHdop(1, 1.1)});
    // hdop 只出现在第二条
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), withHdop(1, 1.0)});

    auto full = StructuralMetrics::fieldMapping(gt, conv);
    EXPECT_EQ(full.totalFields, 5u);
    EXPECT_EQ(full.mappedFields, 5u);
    EXPECT_DOUBLE_EQ(full.mappingAccuracy, 100.0);

    auto partial = StructuralMetrics::fieldMapping(gt, makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10)}));
    EXPECT_EQ(partial.mappedFields, 4u);
    EXPECT_DOUBLE_EQ(partial.mappingAccuracy, 80.0);
}

TEST(StructuralMetrics, FieldMappingEmptyGroundTruth)
{
    auto r = StructuralMetrics::fieldMapping(Dataset(), makeDataset(SensorCategory::Gnss, {gnssRecord(0, 0, 0, 0)}));
    EXPECT_EQ(r.totalFields, 0u);
    EXPECT_DOUBLE_EQ(r.mappingAccuracy, 0.0);
}

TEST(StructuralMetrics, ObservedFieldsIsUnionOverRecords)
{
    auto d = makeDataset(SensorCategory::Gnss, {{{"time_unix", 0.0}, {"a", 1}},
                                                {{"time_unix", 1.0}, {"b", {{"c", 2.5}, {"flag", false}}}}});

    const std::set<std::string> expected = {"time_unix", "a", "b.c"};
    EXPECT_EQ(StructuralMetrics::observedFields(d), expected);
}
