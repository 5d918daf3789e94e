#pragma once

#include <optional>
#include <string>

namespace budget::settings {

class IYnabClientSettings {
public:
    virtual ~IYnabClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getBasePath() const = 0;

    /**
     * @brief Personal access token; nullopt если не задан
     */
    virtual std::optional<std::string> getAccessToken() const = 0;
};

} // namespace budget::settings
