// include/BudgetApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/YnabClientSettings.hpp"
#include "settings/OutputSettings.hpp"

// Ports
#include "ports/input/IBudgetToolService.hpp"
#include "ports/output/IYnabGateway.hpp"
#include "ports/output/ISpillStorage.hpp"

// Application
#include "application/BudgetToolService.hpp"
#include "application/ResultSpiller.hpp"

// Secondary Adapters
#include "adapters/secondary/HttpYnabGateway.hpp"
#include "adapters/secondary/FileSpillStorage.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/McpHandler.hpp"
#include "adapters/primary/ToolRegistry.hpp"
#include "adapters/primary/ToolsHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace budget
{

    /**
     * @brief Budget Service Application
     *
     * Инструменты YNAB через MCP (POST /mcp) и REST (/api/v1/tools).
     * Данные берутся из YNAB API при каждом вызове, без кэша.
     */
    class BudgetApp : public BoostBeastApplication
    {
    public:
        BudgetApp() { std::cout << "[BudgetApp] Initializing..." << std::endl; }
        ~BudgetApp() override { std::cout << "[BudgetApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[BudgetApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[BudgetApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::IYnabClientSettings>().to<settings::YnabClientSettings>().in(di::singleton),
                di::bind<settings::IOutputSettings>().to<settings::OutputSettings>().in(di::singleton),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IYnabGateway>().to<adapters::secondary::HttpYnabGateway>().in(di::singleton),
                di::bind<ports::output::ISpillStorage>().to<adapters::secondary::FileSpillStorage>().in(di::singleton),

                di::bind<application::ResultSpiller>().in(di::singleton),
                di::bind<ports::input::IBudgetToolService>().to<application::BudgetToolService>().in(di::singleton),
                di::bind<adapters::primary::ToolRegistry>().in(di::singleton));

            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("POST", "/mcp")] = injector.create<std::shared_ptr<adapters::primary::McpHandler>>();

            auto toolsHandler = injector.create<std::shared_ptr<adapters::primary::ToolsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/tools")] = toolsHandler;
            handlers_[getHandlerKey("POST", "/api/v1/tools/*")] = toolsHandler;

            if (!injector.create<std::shared_ptr<settings::IYnabClientSettings>>()->getAccessToken()) {
                std::cerr << "[BudgetApp] YNAB_API_KEY is not set, tool calls will fail" << std::endl;
            }

            std::cout << "[BudgetApp] Ready" << std::endl;
        }
    };

} // namespace budget
