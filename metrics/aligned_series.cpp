#include "aligned_series.h"

#include "measurement/field_extractor.h"

AlignedSeries AlignedSeries::collect(const Dataset &groundTruth, const Dataset &converted,
                                     const std::vector<TimeAligner::AlignedPair> &pairs,
                                     const std::string &field)
{
    AlignedSeries series;
    series.groundTruth.reserve(pairs.size());
    series.converted.reserve(pairs.size());

    for (const auto &p : pairs)
    {
        auto gtValue = FieldExtractor::resolve(groundTruth.records[p.gtIndex], field);
        auto convValue = FieldExtractor::resolve(converted.records[p.convIndex], field);
        if (gtValue && convValue)
        {
            series.groundTruth.push_back(*gtValue);
            series.converted.push_back(*convValue);
        }
    }
    return series;
}

std::vector<double> AlignedSeries::values(const Dataset &dataset, const std::string &field)
{
    std::vector<double> result;
    result.reserve(dataset.size());
    for (const auto &r : dataset.records)
    {
        if (auto v = FieldExtractor::resolve(r, field)) result.push_back(*v);
    }
    return result;
}
