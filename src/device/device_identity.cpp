#include "device_identity.hpp"
#include "../keyward_config.hpp"

#include <fstream>
#include <sstream>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace keyward {
namespace device {

std::map<std::string, std::string> parse_os_release(const std::string& text) {
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        out[key] = value;
    }
    return out;
}

namespace {

std::string read_file(const char* path) {
    std::ifstream f(path);
    if (!f) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string host_name() {
#if defined(__unix__) || defined(__APPLE__)
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) == 0) return buf;
#endif
    return {};
}

} // namespace

DeviceIdentity detect_local_device(const std::optional<std::string>& name_override) {
    DeviceIdentity id;
    id.platform = KEYWARD_PLATFORM_NAME;

#if defined(__linux__)
    id.details["manufacturer"] = "Linux";
    auto os = parse_os_release(read_file("/etc/os-release"));
    if (os.count("NAME")) id.details["distribution"] = os["NAME"];
    if (os.count("VERSION_ID")) {
        id.details["os_version"] = os["VERSION_ID"];
    } else if (os.count("VERSION")) {
        id.details["os_version"] = os["VERSION"];
    }
    if (os.count("PRETTY_NAME")) id.details["pretty_name"] = os["PRETTY_NAME"];
#elif defined(__APPLE__)
    id.details["manufacturer"] = "Apple";
#elif defined(_WIN32)
    id.details["manufacturer"] = "Microsoft";
#endif

#if defined(__unix__) || defined(__APPLE__)
    struct utsname uts;
    if (uname(&uts) == 0) {
        id.details["model"] = uts.machine;
        id.details["kernel"] = std::string(uts.sysname) + " " + uts.release;
    }
#endif

    std::string host = host_name();
    if (!host.empty()) id.details["host_name"] = host;

    if (name_override && !name_override->empty()) {
        id.name = *name_override;
    } else if (!host.empty()) {
        id.name = host;
    } else if (id.details.count("pretty_name")) {
        id.name = id.details["pretty_name"];
    } else {
        id.name = "Unknown Device";
    }
    return id;
}

} // namespace device
} // namespace keyward
