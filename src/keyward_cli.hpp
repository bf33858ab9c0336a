#ifndef KEYWARD_CLI_HPP
#define KEYWARD_CLI_HPP

#include "core/settings.hpp"

#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace keyward {
namespace cli {

/**
 * @brief Parsed command line
 */
struct Options {
    std::filesystem::path state_dir;             ///< Local store, one per simulated device
    std::filesystem::path remote_file;           ///< Shared document store snapshot
    std::string account;
    std::string command;
    std::vector<std::string> positional;         ///< Arguments after the command
    std::map<std::string, std::string> values;   ///< --name value
    std::set<std::string> switches;              ///< --name

    bool has(const std::string& name) const { return switches.count(name) != 0; }
    std::optional<std::string> value(const std::string& name) const;

    /**
     * @throws KeywardError if the option is missing
     */
    std::string require(const std::string& name) const;
};

/**
 * @brief Parse argv (argv[0] is skipped)
 *
 * Defaults: state dir from settings or $HOME/.keyward, remote file
 * <state>/remote.json, account from KEYWARD_ACCOUNT or "local".
 * @throws KeywardError on an unknown option, a missing value or no command
 */
Options parse_arguments(int argc, const char* const* argv, const CustodySettings& settings);

void usage(std::ostream& out);

/**
 * @brief Run one command; errors print "ERROR: <message>" and return 1
 */
int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

std::vector<uint8_t> read_all(const std::filesystem::path& path);
void write_all(const std::filesystem::path& path, const std::vector<uint8_t>& data);

} // namespace cli
} // namespace keyward

#endif // KEYWARD_CLI_HPP
