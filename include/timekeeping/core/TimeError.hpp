#pragma once

#include <QString>
#include <stdexcept>

namespace timekeeping {
namespace core {

// Stable taxonomy of timekeeping failures. The string form of each code is
// matched by the presentation layer and must never change.
enum class TimeErrorCode
{
    ExdateInvalidFormat,
    ExdateOutOfRange,
    RruleParse,
    RruleUnsupportedField,
    TimezoneUnknown,
    TimezoneDriftDetected,
    RangeInvalid,
};

const char *timeErrorCodeString(TimeErrorCode code);
QString timeErrorDeveloperMessage(TimeErrorCode code);
QString timeErrorUserMessage(TimeErrorCode code);

class TimeError : public std::runtime_error
{
public:
    /// @p subject names the offending input (rule key, EXDATE token, zone id).
    TimeError(TimeErrorCode code, const QString &detail, const QString &subject = QString());

    TimeErrorCode code() const { return m_code; }
    QString codeString() const;
    const QString &detail() const { return m_detail; }
    const QString &subject() const { return m_subject; }

private:
    TimeErrorCode m_code;
    QString m_detail;
    QString m_subject;
};

} // namespace core
} // namespace timekeeping
