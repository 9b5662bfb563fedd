#ifndef PVSIGNAL_SETTINGS_READER_HPP
#define PVSIGNAL_SETTINGS_READER_HPP

#include <istream>
#include <map>
#include <string>

namespace pvsignal {

/**
 * @brief Parse "key value" lines into a flat settings map
 *
 * Blank lines and everything after '#' are ignored. A later line
 * overrides an earlier one with the same key.
 *
 * @param input Stream to read
 * @param source_name Name used in error messages
 * @return Parsed settings
 * @throws InvalidConfigurationException on a malformed line
 */
std::map<std::string, double> readSettings(std::istream& input, const std::string& source_name = "<stream>");

/**
 * @brief Read a settings file such as data/configuration/signal_settings.txt
 * @throws InvalidConfigurationException if the file cannot be opened or parsed
 */
std::map<std::string, double> readSettingsFile(const std::string& filepath);

} // namespace pvsignal

#endif // PVSIGNAL_SETTINGS_READER_HPP
