#include "pvsignal/config/SettingsReader.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"
#include "pvsignal/utils/Logger.hpp"

#include <fstream>
#include <sstream>

namespace pvsignal {

std::map<std::string, double> readSettings(std::istream& input, const std::string& source_name) {
    std::map<std::string, double> settings;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) {
            continue;
        }

        double value = 0.0;
        std::string trailing;
        if (!(iss >> value) || (iss >> trailing)) {
            PVSIGNAL_THROW_INVALID_CONFIG("SettingsReader",
                source_name + ":" + std::to_string(line_number) + ": expected '<key> <number>'");
        }
        settings[key] = value;
    }
    return settings;
}

std::map<std::string, double> readSettingsFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        PVSIGNAL_THROW_INVALID_CONFIG("SettingsReader", "cannot open settings file: " + filepath);
    }
    auto settings = readSettings(file, filepath);
    Logger::getInstance().info("SettingsReader",
        "Loaded " + std::to_string(settings.size()) + " setting(s) from " + filepath);
    return settings;
}

} // namespace pvsignal
