#include "structural_metrics.h"

#include "measurement/field_extractor.h"

SchemaCompliance StructuralMetrics::schemaCompliance(const Dataset &converted,
                                                     const std::vector<std::string> &requiredFields)
{
    SchemaCompliance result;
    for (const auto &record : converted.records)
    {
        for (const auto &field : requiredFields)
        {
            ++result.totalFields;
            if (FieldExtractor::resolve(record, field)) ++result.compliantFields;
        }
    }

    if (result.totalFields > 0)
    {
        result.complianceScore = static_cast<double>(result.compliantFields) /
                                 static_cast<double>(result.totalFields) * 100.0;
    }
    return result;
}

bool StructuralMetrics::existsInAny(const Dataset &dataset, const std::string &field)
{
    for (const auto &record : dataset.records)
    {
        if (FieldExtractor::resolve(record, field)) return true;
    }
    return false;
}

FieldMapping StructuralMetrics::fieldMapping(const Dataset &groundTruth, const Dataset &converted)
{
    FieldMapping result;
    for (const auto &field : observedFields(groundTruth))
    {
        ++result.totalFields;
        if (existsInAny(converted, field)) ++result.mappedFields;
    }

    if (result.totalFields > 0)
    {
        result.mappingAccuracy = static_cast<double>(result.mappedFields) /
                                 static_cast<double>(result.totalFields) * 100.0;
    }
    return result;
}

std::set<std::string> StructuralMetrics::observedFields(const Dataset &dataset)
{
    std::set<std::string> fields;
    collectObservedFields(dataset, fields);
    return fields;
}

void StructuralMetrics::collectObservedFields(const Dataset &dataset, std::set<std::string> &fields)
{
    for (const auto &record : dataset.records)
    {
        FieldExtractor::collectNumericFields(record.raw, "", fields);
    }
}
