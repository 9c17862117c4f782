#include "timekeeping/core/TimeError.hpp"

#include <QObject>

namespace timekeeping {
namespace core {

namespace {

std::string composeWhat(TimeErrorCode code, const QString &detail, const QString &subject)
{
    QString text = QString::fromLatin1(timeErrorCodeString(code));
    if (!detail.isEmpty()) {
        text += QStringLiteral(": ") + detail;
    }
    if (!subject.isEmpty()) {
        text += QStringLiteral(" [%1]").arg(subject);
    }
    return text.toStdString();
}

} // namespace

const char *timeErrorCodeString(TimeErrorCode code)
{
    switch (code) {
    case TimeErrorCode::ExdateInvalidFormat:
        return "E_EXDATE_INVALID_FORMAT";
    case TimeErrorCode::ExdateOutOfRange:
        return "E_EXDATE_OUT_OF_RANGE";
    case TimeErrorCode::RruleParse:
        return "E_RRULE_PARSE";
    case TimeErrorCode::RruleUnsupportedField:
        return "E_RRULE_UNSUPPORTED_FIELD";
    case TimeErrorCode::TimezoneUnknown:
        return "E_TZ_UNKNOWN";
    case TimeErrorCode::TimezoneDriftDetected:
        return "E_TZ_DRIFT_DETECTED";
    case TimeErrorCode::RangeInvalid:
    default:
        return "E_RANGE_INVALID";
    }
}

QString timeErrorDeveloperMessage(TimeErrorCode code)
{
    switch (code) {
    case TimeErrorCode::ExdateInvalidFormat:
        return QStringLiteral("Excluded dates must use ISO-8601 UTC format (YYYY-MM-DDTHH:MM:SSZ).");
    case TimeErrorCode::ExdateOutOfRange:
        return QStringLiteral("Excluded dates must fall within the recurrence window.");
    case TimeErrorCode::RruleParse:
        return QStringLiteral("Recurrence rule could not be parsed.");
    case TimeErrorCode::RruleUnsupportedField:
        return QStringLiteral("Recurrence rule contains fields that are not supported.");
    case TimeErrorCode::TimezoneUnknown:
        return QStringLiteral("Timezone identifier could not be resolved to a known location.");
    case TimeErrorCode::TimezoneDriftDetected:
        return QStringLiteral("Stored event timestamps drifted away from their timezone offsets.");
    case TimeErrorCode::RangeInvalid:
    default:
        return QStringLiteral("The requested time range is invalid. Start must be before end.");
    }
}

QString timeErrorUserMessage(TimeErrorCode code)
{
    switch (code) {
    case TimeErrorCode::ExdateInvalidFormat:
        return QObject::tr("One or more excluded dates are invalid. Please check the format.");
    case TimeErrorCode::ExdateOutOfRange:
        return QObject::tr("Excluded dates must fall within the recurrence window.");
    case TimeErrorCode::RruleParse:
        return QObject::tr("We couldn't read that repeat pattern. Please check the format.");
    case TimeErrorCode::RruleUnsupportedField:
        return QObject::tr("This repeat pattern is not yet supported.");
    case TimeErrorCode::TimezoneUnknown:
        return QObject::tr("This event has an unrecognised timezone. Please edit and select a valid timezone.");
    case TimeErrorCode::TimezoneDriftDetected:
        return QObject::tr("Some event times no longer match their timezone. "
                           "Review the affected items before continuing.");
    case TimeErrorCode::RangeInvalid:
    default:
        return QObject::tr("Calendar queries need the start to come before the end.");
    }
}

TimeError::TimeError(TimeErrorCode code, const QString &detail, const QString &subject)
    : std::runtime_error(composeWhat(code, detail, subject))
    , m_code(code)
    , m_detail(detail)
    , m_subject(subject)
{
}

QString TimeError::codeString() const
{
    return QString::fromLatin1(timeErrorCodeString(m_code));
}

} // namespace core
} // namespace timekeeping
