#pragma once

#include <filesystem>

namespace budget::settings {

class IOutputSettings {
public:
    virtual ~IOutputSettings() = default;

    /**
     * @brief Директория для файлов с результатами без явного output_path
     */
    virtual std::filesystem::path getOutputDir() const = 0;
};

} // namespace budget::settings
