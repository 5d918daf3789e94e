#pragma once

#include "ports/output/ISpillStorage.hpp"
#include "settings/IOutputSettings.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <map>
#include <string>

namespace budget::tests {

/**
 * @brief ISpillStorage в памяти: запоминает записанные файлы
 */
class InMemorySpillStorage : public ports::output::ISpillStorage {
public:
    void write(const std::filesystem::path& path, const std::string& content) override {
        ++writeCount_;
        if (failing_) {
            throw domain::PersistenceError("Cannot open " + path.string() + " for writing");
        }
        files_[path.string()] = content;
    }

    void setFailing(bool failing) { failing_ = failing; }

    int writeCount() const { return writeCount_; }

    const std::map<std::string, std::string>& files() const { return files_; }

private:
    std::map<std::string, std::string> files_;
    bool failing_ = false;
    int writeCount_ = 0;
};

/**
 * @brief IOutputSettings с фиксированной директорией
 */
class MockOutputSettings : public settings::IOutputSettings {
public:
    explicit MockOutputSettings(std::filesystem::path dir = "/tmp/budget-tests") : dir_(std::move(dir)) {}

    std::filesystem::path getOutputDir() const override { return dir_; }

private:
    std::filesystem::path dir_;
};

} // namespace budget::tests
