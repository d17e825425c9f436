#include "SeriesWindower.hpp"

#include <algorithm>
#include <iterator>

namespace ventcast::forecast {

QDateTime truncateToBucket(const QDateTime& value, std::chrono::seconds bucket)
{
    const QDateTime civil = civilDateTime(value);
    if (!civil.isValid() || bucket.count() <= 0)
        return civil;

    const qint64 bucketMs = std::chrono::duration_cast<std::chrono::milliseconds>(bucket).count();
    const qint64 msecs = civil.toMSecsSinceEpoch();
    qint64 remainder = msecs % bucketMs;
    if (remainder < 0)
        remainder += bucketMs;
    return QDateTime::fromMSecsSinceEpoch(msecs - remainder, Qt::UTC);
}

QVector<ForecastSample> windowSeries(const QVector<ForecastSample>& samples,
                                     std::chrono::seconds bucket,
                                     int step,
                                     int count,
                                     const QDateTime& referenceNow)
{
    QVector<ForecastSample> selected;
    if (count <= 0 || samples.isEmpty())
        return selected;
    step = std::max(step, 1);

    const QDateTime threshold = truncateToBucket(referenceNow, bucket);
    const auto first = std::find_if(samples.cbegin(), samples.cend(), [&threshold](const ForecastSample& sample) {
        return !(civilDateTime(sample.timestamp) < threshold);
    });

    const qsizetype start = std::distance(samples.cbegin(), first);
    const qsizetype remaining = samples.size() - start;
    selected.reserve(std::min<qsizetype>(count, remaining > 0 ? (remaining - 1) / step + 1 : 0));
    for (qsizetype i = start; i < samples.size() && selected.size() < count; i += step) {
        selected.append(samples.at(i));
        if (step > samples.size() - i)
            break;
    }
    return selected;
}

} // namespace ventcast::forecast
