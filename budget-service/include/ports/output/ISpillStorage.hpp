#pragma once

#include <filesystem>
#include <string>

namespace budget::ports::output {

/**
 * @brief Хранилище файлов с результатами, не поместившимися в ответ
 */
class ISpillStorage {
public:
    virtual ~ISpillStorage() = default;

    /**
     * @brief Записать content в path, создав недостающие директории
     * @throws domain::PersistenceError при ошибке файловой системы
     */
    virtual void write(const std::filesystem::path& path, const std::string& content) = 0;
};

} // namespace budget::ports::output
