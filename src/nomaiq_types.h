#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include <QHash>
#include <QMetaType>
#include <QString>

namespace phicore::nomaiq {

// Ayla property names used by NomaIQ lights and garage-door openers.
namespace props {
inline constexpr char kPower[] = "power";
inline constexpr char kBrightness[] = "brightness";
inline constexpr char kColorTemp[] = "color_temp";
inline constexpr char kColorSelect[] = "color_select";
inline constexpr char kColorSaturation[] = "color_saturation";
inline constexpr char kMode[] = "mode";
inline constexpr char kVoiceData[] = "voice_data";
inline constexpr char kDoorStatus[] = "door_status";
inline constexpr char kDoorToggle[] = "door_toggle";
} // namespace props

enum class FailureKind {
    None,
    Auth,          // credentials rejected, needs operator action
    AuthExpiring,  // token close to expiry, a refresh call recovers
    Transport,     // network or cloud API failure
    Command,       // a single property write failed
    Timeout,       // tick exceeded its time budget
    InvalidData    // unparsable cloud payload
};

struct Failure {
    FailureKind kind = FailureKind::None;
    QString message;

    bool isSet() const noexcept { return kind != FailureKind::None; }
};

const char *failureKindName(FailureKind kind);
void setFailure(Failure *failure, FailureKind kind, const QString &message);

// Protocol-defined property value. Ayla "boolean" properties arrive as 0/1
// integers and are kept as such.
using PropertyValue = std::variant<bool, std::int64_t, QString>;
using PropertyMap = QHash<QString, PropertyValue>;

std::optional<bool> propertyAsBool(const std::optional<PropertyValue> &value);
std::optional<std::int64_t> propertyAsInt(const std::optional<PropertyValue> &value);
std::optional<QString> propertyAsString(const std::optional<PropertyValue> &value);

// Exact comparison, except that bool and integer compare as 0/1.
bool propertyMatches(const PropertyValue &confirmed, const PropertyValue &intended);

QString propertyToString(const PropertyValue &value);

} // namespace phicore::nomaiq

Q_DECLARE_METATYPE(phicore::nomaiq::Failure)
