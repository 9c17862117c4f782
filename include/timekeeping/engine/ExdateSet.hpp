#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace timekeeping {
namespace engine {

// Token-by-token outcome of a lenient EXDATE read.
struct ExdateInspection
{
    std::vector<qint64> valid; // sorted, unique, in range
    QStringList invalidFormat;
    std::vector<qint64> outOfRange;
    int duplicates = 0;

    bool isClean() const { return invalidFormat.isEmpty() && outOfRange.empty() && duplicates == 0; }
    /// Empty when no valid instant remains.
    std::optional<QString> canonical() const;
};

// Absolute UTC instants excluded from a series.
class ExdateSet
{
public:
    ExdateSet() = default;

    /// Throws E_EXDATE_INVALID_FORMAT naming the first token that is not a
    /// `Z`-terminated instant. Empty tokens are ignored.
    static ExdateSet parse(const QString &text);
    static ExdateSet fromInstants(const std::vector<qint64> &instants);

    /// Never throws; sorts every token into one bucket of the inspection.
    static ExdateInspection inspect(const QString &text, qint64 firstUtc, const std::optional<qint64> &lastUtc);

    /// Throws E_EXDATE_OUT_OF_RANGE for the first instant outside
    /// [firstUtc, lastUtc]. An absent @p lastUtc leaves the top open.
    void checkRange(qint64 firstUtc, const std::optional<qint64> &lastUtc) const;

    bool contains(qint64 utcMs) const { return m_instants.contains(utcMs); }
    bool isEmpty() const { return m_instants.isEmpty(); }
    int size() const { return m_instants.size(); }
    std::vector<qint64> values() const;
    QString canonical() const;

private:
    QSet<qint64> m_instants;
};

QString joinUtcInstants(const std::vector<qint64> &instants);

} // namespace engine
} // namespace timekeeping
