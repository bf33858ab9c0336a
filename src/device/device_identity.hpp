#ifndef KEYWARD_DEVICE_DEVICE_IDENTITY_HPP
#define KEYWARD_DEVICE_DEVICE_IDENTITY_HPP

#include <map>
#include <optional>
#include <string>

namespace keyward {
namespace device {

/**
 * @brief How this device presents itself in its device record
 */
struct DeviceIdentity {
    std::string name;                                  ///< Shown to approvers; matched case-insensitively
    std::string platform;                              ///< linux, macos, windows, android, ios, web, unknown
    std::map<std::string, std::string> details;        ///< manufacturer, model, os_version, ...
};

/**
 * @brief Probe the running host
 *
 * Reads /etc/os-release, uname and the host name where available. Every
 * detection is best-effort; missing values are left out of details.
 * @param name_override replaces the detected name
 */
DeviceIdentity detect_local_device(const std::optional<std::string>& name_override = std::nullopt);

/**
 * @brief Parse os-release(5) KEY=value lines, unquoting values
 */
std::map<std::string, std::string> parse_os_release(const std::string& text);

} // namespace device
} // namespace keyward

#endif // KEYWARD_DEVICE_DEVICE_IDENTITY_HPP
