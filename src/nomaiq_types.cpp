#include "nomaiq_types.h"

namespace phicore::nomaiq {

const char *failureKindName(FailureKind kind)
{
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::Auth:
        return "auth";
    case FailureKind::AuthExpiring:
        return "auth-expiring";
    case FailureKind::Transport:
        return "transport";
    case FailureKind::Command:
        return "command";
    case FailureKind::Timeout:
        return "timeout";
    case FailureKind::InvalidData:
        return "invalid-data";
    }
    return "unknown";
}

void setFailure(Failure *failure, FailureKind kind, const QString &message)
{
    if (!failure)
        return;
    failure->kind = kind;
    failure->message = message;
}

std::optional<bool> propertyAsBool(const std::optional<PropertyValue> &value)
{
    if (!value.has_value())
        return std::nullopt;
    if (const auto *b = std::get_if<bool>(&*value))
        return *b;
    if (const auto *i = std::get_if<std::int64_t>(&*value))
        return *i != 0;
    if (const auto *s = std::get_if<QString>(&*value)) {
        const QString text = s->trimmed().toLower();
        if (text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("0") || text == QLatin1String("false") || text == QLatin1String("off"))
            return false;
    }
    return std::nullopt;
}

std::optional<std::int64_t> propertyAsInt(const std::optional<PropertyValue> &value)
{
    if (!value.has_value())
        return std::nullopt;
    if (const auto *i = std::get_if<std::int64_t>(&*value))
        return *i;
    if (const auto *b = std::get_if<bool>(&*value))
        return *b ? 1 : 0;
    if (const auto *s = std::get_if<QString>(&*value)) {
        bool ok = false;
        const qlonglong parsed = s->trimmed().toLongLong(&ok);
        if (ok)
            return static_cast<std::int64_t>(parsed);
    }
    return std::nullopt;
}

std::optional<QString> propertyAsString(const std::optional<PropertyValue> &value)
{
    if (!value.has_value())
        return std::nullopt;
    if (const auto *s = std::get_if<QString>(&*value))
        return *s;
    return std::nullopt;
}

bool propertyMatches(const PropertyValue &confirmed, const PropertyValue &intended)
{
    if (confirmed.index() == intended.index())
        return confirmed == intended;

    const bool confirmedIsString = std::holds_alternative<QString>(confirmed);
    const bool intendedIsString = std::holds_alternative<QString>(intended);
    if (confirmedIsString || intendedIsString)
        return false;

    return propertyAsInt(confirmed) == propertyAsInt(intended);
}

QString propertyToString(const PropertyValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? QStringLiteral("true") : QStringLiteral("false");
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return QString::number(*i);
    return std::get<QString>(value);
}

} // namespace phicore::nomaiq
