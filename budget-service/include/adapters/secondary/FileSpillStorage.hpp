#pragma once

#include "ports/output/ISpillStorage.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace budget::adapters::secondary {

/**
 * @brief Запись файлов с результатами на локальный диск
 *
 * Недостающие родительские директории создаются. Файлы не читаются
 * обратно и не удаляются.
 */
class FileSpillStorage : public ports::output::ISpillStorage {
public:
    FileSpillStorage() {
        std::cout << "[FileSpillStorage] Created" << std::endl;
    }

    void write(const std::filesystem::path& path, const std::string& content) override {
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw domain::PersistenceError(
                    "Cannot create directory " + path.parent_path().string() + ": " + ec.message());
            }
        }

        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out) {
            throw domain::PersistenceError("Cannot open " + path.string() + " for writing");
        }

        out << content;
        out.flush();
        if (!out) {
            throw domain::PersistenceError("Failed to write " + path.string());
        }

        std::cout << "[FileSpillStorage] Wrote " << content.size() << " bytes to " << path.string() << std::endl;
    }
};

} // namespace budget::adapters::secondary
