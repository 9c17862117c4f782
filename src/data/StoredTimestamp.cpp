#include "timekeeping/data/StoredTimestamp.hpp"

#include <cmath>
#include <cstdlib>
#include <type_traits>

namespace timekeeping {
namespace data {

StoredTimestamp::StoredTimestamp(Value value)
    : m_value(std::move(value))
{
}

StoredTimestamp StoredTimestamp::millis(qint64 value)
{
    return StoredTimestamp(EpochMillis{ value });
}

StoredTimestamp StoredTimestamp::seconds(qint64 value)
{
    return StoredTimestamp(EpochSeconds{ value });
}

StoredTimestamp StoredTimestamp::iso(QString value)
{
    return StoredTimestamp(IsoText{ std::move(value) });
}

StoredTimestamp StoredTimestamp::fromOptional(const std::optional<qint64> &millisValue)
{
    if (!millisValue) {
        return StoredTimestamp();
    }
    return millis(*millisValue);
}

StoredTimestamp StoredTimestamp::fromJson(const QJsonValue &value)
{
    if (value.isDouble()) {
        const double raw = value.toDouble();
        const auto integral = static_cast<qint64>(std::llround(raw));
        if (std::llabs(integral) < SecondsThreshold) {
            return seconds(integral);
        }
        return millis(integral);
    }
    if (value.isString()) {
        const QString text = value.toString().trimmed();
        if (text.isEmpty()) {
            return StoredTimestamp();
        }
        return iso(text);
    }
    return StoredTimestamp();
}

QJsonValue StoredTimestamp::toJson() const
{
    return std::visit([](const auto &held) -> QJsonValue {
        using T = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<T, EpochMillis> || std::is_same_v<T, EpochSeconds>) {
            return QJsonValue(static_cast<double>(held.value));
        } else if constexpr (std::is_same_v<T, IsoText>) {
            return QJsonValue(held.value);
        } else {
            return QJsonValue(QJsonValue::Null);
        }
    }, m_value);
}

StoredTimestamp::Encoding StoredTimestamp::encoding() const
{
    switch (m_value.index()) {
    case 1:
        return Encoding::EpochMillis;
    case 2:
        return Encoding::EpochSeconds;
    case 3:
        return Encoding::IsoText;
    case 0:
    default:
        return Encoding::Missing;
    }
}

bool StoredTimestamp::isMissing() const
{
    return std::holds_alternative<std::monostate>(m_value);
}

bool StoredTimestamp::isCanonical() const
{
    return isMissing() || std::holds_alternative<EpochMillis>(m_value);
}

std::optional<qint64> StoredTimestamp::canonicalMillis() const
{
    if (const auto *held = std::get_if<EpochMillis>(&m_value)) {
        return held->value;
    }
    return std::nullopt;
}

QString StoredTimestamp::describe() const
{
    switch (encoding()) {
    case Encoding::EpochMillis:
        return QStringLiteral("ms:%1").arg(std::get<EpochMillis>(m_value).value);
    case Encoding::EpochSeconds:
        return QStringLiteral("s:%1").arg(std::get<EpochSeconds>(m_value).value);
    case Encoding::IsoText:
        return QStringLiteral("iso:%1").arg(std::get<IsoText>(m_value).value);
    case Encoding::Missing:
    default:
        return QStringLiteral("<missing>");
    }
}

bool StoredTimestamp::operator==(const StoredTimestamp &other) const
{
    if (m_value.index() != other.m_value.index()) {
        return false;
    }
    switch (encoding()) {
    case Encoding::EpochMillis:
        return std::get<EpochMillis>(m_value).value == std::get<EpochMillis>(other.m_value).value;
    case Encoding::EpochSeconds:
        return std::get<EpochSeconds>(m_value).value == std::get<EpochSeconds>(other.m_value).value;
    case Encoding::IsoText:
        return std::get<IsoText>(m_value).value == std::get<IsoText>(other.m_value).value;
    case Encoding::Missing:
    default:
        return true;
    }
}

} // namespace data
} // namespace timekeeping
