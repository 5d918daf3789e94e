#pragma once

#include "settings/IYnabClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace budget::settings {

/**
 * @brief Настройки подключения к YNAB API
 *
 * Читает из ENV:
 * - YNAB_API_HOST (default: "api.ynab.com")
 * - YNAB_API_PORT (default: 443)
 * - YNAB_API_BASE_PATH (default: "/v1")
 * - YNAB_API_KEY (без значения по умолчанию, читается при каждом запросе)
 */
class YnabClientSettings : public IYnabClientSettings {
public:
    YnabClientSettings() {
        if (const char* host = std::getenv("YNAB_API_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("YNAB_API_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* basePath = std::getenv("YNAB_API_BASE_PATH")) {
            basePath_ = basePath;
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }
    std::string getBasePath() const override { return basePath_; }

    std::optional<std::string> getAccessToken() const override {
        const char* token = std::getenv("YNAB_API_KEY");
        if (!token || std::string(token).empty()) {
            return std::nullopt;
        }
        return std::string(token);
    }

private:
    std::string host_ = "api.ynab.com";
    int port_ = 443;
    std::string basePath_ = "/v1";
};

} // namespace budget::settings
