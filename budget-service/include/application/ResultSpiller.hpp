#pragma once

#include "domain/Timestamp.hpp"
#include "domain/TransactionQuery.hpp"
#include "domain/TransactionSummary.hpp"
#include "ports/output/ISpillStorage.hpp"
#include "settings/IOutputSettings.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace budget::application {

/**
 * @brief Доставка коллекции транзакций: в ответе или через файл
 *
 * - outputToFile: полный документ пишется в файл, в ответе только подтверждение
 * - иначе документ возвращается целиком, если он не длиннее CHARACTER_LIMIT;
 *   более длинный документ тоже уходит в файл
 *
 * Файл: outputPath, если задан, иначе <outputDir>/<prefix>_<YYYYmmdd_HHMMSS>.json.
 * Ошибки записи пробрасываются как domain::PersistenceError.
 */
class ResultSpiller {
public:
    static constexpr size_t CHARACTER_LIMIT = 25000;

    ResultSpiller(
        std::shared_ptr<ports::output::ISpillStorage> storage,
        std::shared_ptr<settings::IOutputSettings> settings
    ) : storage_(std::move(storage))
      , settings_(std::move(settings))
    {
        std::cout << "[ResultSpiller] Created, output dir: "
                  << settings_->getOutputDir().string() << std::endl;
    }

    std::string deliver(
        const domain::TransactionSummary& summary,
        const domain::OutputOptions& options,
        const std::string& prefix) const
    {
        auto document = summary.document();

        if (options.outputToFile) {
            auto path = spill(document, options, prefix);
            std::string message = summary.query
                ? "Found " + std::to_string(summary.count()) + " matching transactions. Wrote to " + path
                : "Wrote " + std::to_string(summary.count()) + " transactions to " + path;
            return acknowledge(summary, path, message);
        }

        auto inlined = serialize(document);
        auto length = characterCount(inlined);
        if (length <= CHARACTER_LIMIT) {
            return inlined;
        }

        std::cout << "[ResultSpiller] Response of " << length << " chars exceeds limit, spilling" << std::endl;
        auto path = spill(document, options, prefix);
        return acknowledge(summary, path,
            "Response too large (" + std::to_string(length) + " chars). Wrote to " + path);
    }

    /**
     * @brief Длина документа в символах при ASCII-экранировании JSON
     *
     * ASCII-символ считается за один, символ из BMP за шесть (\uXXXX),
     * символ вне BMP за двенадцать (суррогатная пара).
     */
    static size_t characterCount(const std::string& text) {
        size_t count = 0;
        for (unsigned char c : text) {
            if (c < 0x80) {
                count += 1;
            } else if (c >= 0xF0) {
                count += 12;
            } else if (c >= 0xC0) {
                count += 6;
            }
        }
        return count;
    }

private:
    std::shared_ptr<ports::output::ISpillStorage> storage_;
    std::shared_ptr<settings::IOutputSettings> settings_;

    static std::string serialize(const nlohmann::ordered_json& document) {
        return document.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    std::string spill(
        const nlohmann::ordered_json& document,
        const domain::OutputOptions& options,
        const std::string& prefix) const
    {
        std::filesystem::path path;
        if (options.outputPath && !options.outputPath->empty()) {
            path = *options.outputPath;
        } else {
            path = settings_->getOutputDir() / (prefix + "_" + domain::Timestamp::now().toFileStamp() + ".json");
        }

        storage_->write(path, serialize(document));
        return path.string();
    }

    static std::string acknowledge(
        const domain::TransactionSummary& summary,
        const std::string& path,
        const std::string& message)
    {
        auto ack = summary.header();
        ack["output_file"] = path;
        ack["message"] = message;
        return serialize(ack);
    }
};

} // namespace budget::application
