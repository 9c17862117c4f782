#pragma once

#include <QJsonValue>
#include <QString>
#include <optional>
#include <variant>

namespace timekeeping {
namespace data {

// A temporal column as it was found in storage. Rows written before the
// epoch-millisecond schema carry ISO strings or epoch seconds; only Missing
// and EpochMillis are canonical.
class StoredTimestamp
{
public:
    struct EpochMillis
    {
        qint64 value = 0;
    };
    struct EpochSeconds
    {
        qint64 value = 0;
    };
    struct IsoText
    {
        QString value;
    };

    enum class Encoding
    {
        Missing,
        EpochMillis,
        EpochSeconds,
        IsoText,
    };

    using Value = std::variant<std::monostate, EpochMillis, EpochSeconds, IsoText>;

    StoredTimestamp() = default;

    static StoredTimestamp millis(qint64 value);
    static StoredTimestamp seconds(qint64 value);
    static StoredTimestamp iso(QString value);
    static StoredTimestamp fromOptional(const std::optional<qint64> &millisValue);

    // JSON numbers below this magnitude are legacy epoch seconds.
    static constexpr qint64 SecondsThreshold = 100000000000LL;
    static StoredTimestamp fromJson(const QJsonValue &value);
    QJsonValue toJson() const;

    Encoding encoding() const;
    const Value &value() const { return m_value; }
    bool isMissing() const;
    bool isCanonical() const;
    std::optional<qint64> canonicalMillis() const;
    QString describe() const;

    bool operator==(const StoredTimestamp &other) const;
    bool operator!=(const StoredTimestamp &other) const { return !(*this == other); }

private:
    explicit StoredTimestamp(Value value);

    Value m_value;
};

} // namespace data
} // namespace timekeeping
