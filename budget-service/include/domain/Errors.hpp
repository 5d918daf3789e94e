#pragma once

#include <stdexcept>
#include <string>

namespace budget::domain {

/**
 * @brief Базовое исключение сервиса
 *
 * kindName() попадает в текст ошибки, который видит вызывающий инструмент.
 */
class BudgetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    virtual std::string kindName() const = 0;
};

/**
 * @brief Некорректные или противоречивые входные параметры
 *
 * Бросается до любого обращения к YNAB API.
 */
class ValidationError : public BudgetError {
public:
    using BudgetError::BudgetError;

    std::string kindName() const override { return "ValidationError"; }
};

/**
 * @brief YNAB API ответил статусом вне 2xx
 */
class UpstreamError : public BudgetError {
public:
    UpstreamError(int status, const std::string& reason)
        : BudgetError("YNAB API error " + std::to_string(status) + ": " + reason)
        , status_(status)
        , reason_(reason)
    {}

    int status() const { return status_; }
    const std::string& reason() const { return reason_; }

    std::string kindName() const override { return "UpstreamError"; }

private:
    int status_;
    std::string reason_;
};

/**
 * @brief Ошибка файловой системы при записи результата в файл
 */
class PersistenceError : public BudgetError {
public:
    using BudgetError::BudgetError;

    std::string kindName() const override { return "PersistenceError"; }
};

/**
 * @brief Не удалось доставить запрос до YNAB или разобрать ответ
 */
class TransportError : public BudgetError {
public:
    using BudgetError::BudgetError;

    std::string kindName() const override { return "TransportError"; }
};

/**
 * @brief Не хватает конфигурации процесса (например, YNAB_API_KEY)
 */
class ConfigurationError : public BudgetError {
public:
    using BudgetError::BudgetError;

    std::string kindName() const override { return "ConfigurationError"; }
};

} // namespace budget::domain
