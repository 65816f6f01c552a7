#include "nomaiq_schema.h"

#include <initializer_list>
#include <utility>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "nomaiq_config.h"

namespace phicore::nomaiq {

namespace {

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray flagList(std::initializer_list<const char *> names)
{
    QJsonArray out;
    for (const char *name : names)
        out.append(QString::fromLatin1(name));
    return out;
}

QJsonArray accountFields()
{
    QJsonArray fields;

    fields.append(field(QStringLiteral("username"),
                        QStringLiteral("String"),
                        QStringLiteral("Email"),
                        QStringLiteral("E-mail address of the NomaIQ app account."),
                        QJsonValue(),
                        flagList({"Required"})));

    fields.append(field(QStringLiteral("password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Password of the NomaIQ app account."),
                        QJsonValue(),
                        flagList({"Required", "Secret"})));

    fields.append(field(QStringLiteral("clientId"),
                        QStringLiteral("String"),
                        QStringLiteral("Client ID"),
                        QStringLiteral("Ayla application id used by the NomaIQ app."),
                        QJsonValue(),
                        flagList({"Required"})));

    fields.append(field(QStringLiteral("clientSecret"),
                        QStringLiteral("Password"),
                        QStringLiteral("Client secret"),
                        QStringLiteral("Ayla application secret used by the NomaIQ app."),
                        QJsonValue(),
                        flagList({"Required", "Secret"})));

    QJsonObject regionField = field(QStringLiteral("region"),
                                    QStringLiteral("Select"),
                                    QStringLiteral("Region"),
                                    QStringLiteral("Ayla cloud region of the account."),
                                    QJsonValue(QStringLiteral("us")));
    QJsonArray options;
    const std::pair<const char *, const char *> regions[] = {
        {"us", "North America"},
        {"eu", "Europe"},
        {"cn", "China"},
    };
    for (const auto &region : regions) {
        QJsonObject option;
        option.insert(QStringLiteral("value"), QString::fromLatin1(region.first));
        option.insert(QStringLiteral("label"), QString::fromLatin1(region.second));
        options.append(option);
    }
    regionField.insert(QStringLiteral("options"), options);
    fields.append(regionField);

    fields.append(field(QStringLiteral("pollIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Refresh interval while no device is changing state."),
                        QJsonValue(kDefaultPollIntervalMs)));

    fields.append(field(QStringLiteral("transitionIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Transition poll interval"),
                        QStringLiteral("Refresh interval while a light or door is changing state."),
                        QJsonValue(kDefaultTransitionIntervalMs)));

    fields.append(field(QStringLiteral("retryIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Retry interval"),
                        QStringLiteral("Upper bound of the backoff while the Ayla cloud is unreachable."),
                        QJsonValue(kDefaultRetryIntervalMs)));

    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "NomaIQ";
}

phicore::adapter::v1::Utf8String description()
{
    return "Provides NomaIQ lights and garage door openers through the Ayla cloud";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"NomaIQ\">"
        "<circle cx=\"12\" cy=\"12\" r=\"10\" fill=\"none\" stroke=\"#E4002B\" stroke-width=\"2\"/>"
        "<text x=\"12\" y=\"15.5\" text-anchor=\"middle\" font-family=\"'Geist','Inter','Arial',sans-serif\" font-weight=\"700\" font-size=\"9\" fill=\"#E4002B\">IQ</text>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.required = v1::AdapterRequirement::UsesRetryInterval;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::RequiresPolling;

    v1::AdapterActionDescriptor probe;
    probe.id = "probe";
    probe.label = "Test sign-in";
    probe.description = "Sign in to the Ayla cloud with the entered credentials";
    probe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.factoryActions.push_back(probe);
    caps.instanceActions.push_back(probe);

    v1::AdapterActionDescriptor refresh;
    refresh.id = "refresh";
    refresh.label = "Refresh now";
    refresh.description = "Poll every light and garage door without waiting for the next interval";
    refresh.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.instanceActions.push_back(refresh);

    caps.defaultsJson = R"({"region":"us","pollIntervalMs":30000,"transitionIntervalMs":2000,"retryIntervalMs":300000})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    const QJsonArray fields = accountFields();

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("NomaIQ account"),
                          QStringLiteral("Sign in with the account used in the NomaIQ app."),
                          fields));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("NomaIQ account"),
                          QStringLiteral("Sign in with the account used in the NomaIQ app."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::nomaiq
