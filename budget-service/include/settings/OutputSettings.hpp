#pragma once

#include "settings/IOutputSettings.hpp"
#include <cstdlib>
#include <filesystem>

namespace budget::settings {

/**
 * @brief Настройки вывода в файлы
 *
 * Читает из ENV:
 * - YNAB_OUTPUT_DIR (default: "/tmp/ynab-mcp")
 */
class OutputSettings : public IOutputSettings {
public:
    OutputSettings() {
        if (const char* dir = std::getenv("YNAB_OUTPUT_DIR")) {
            outputDir_ = dir;
        }
    }

    std::filesystem::path getOutputDir() const override { return outputDir_; }

private:
    std::filesystem::path outputDir_ = "/tmp/ynab-mcp";
};

} // namespace budget::settings
