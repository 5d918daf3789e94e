#pragma once

#include "Errors.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <string>

namespace budget::domain {

enum class FailureKind {
    VALIDATION,
    UPSTREAM,
    PERSISTENCE,
    TRANSPORT,
    CONFIGURATION,
    UNKNOWN
};

/**
 * @brief Классифицируемая ошибка как значение
 *
 * Исключения перехватываются на границе вызова инструмента и превращаются
 * в Failure; дальше с ней работает только ErrorClassifier.
 */
struct Failure {
    FailureKind kind = FailureKind::UNKNOWN;
    std::string kindName = "UnknownError";
    std::string description;
    int status = 0;          ///< HTTP статус (только UPSTREAM)
    std::string reason;      ///< Причина от YNAB (только UPSTREAM)

    static Failure upstream(int status, const std::string& reason) {
        Failure failure;
        failure.kind = FailureKind::UPSTREAM;
        failure.kindName = "UpstreamError";
        failure.description = "YNAB API error " + std::to_string(status) + ": " + reason;
        failure.status = status;
        failure.reason = reason;
        return failure;
    }

    static Failure local(FailureKind kind, const std::string& kindName, const std::string& description) {
        Failure failure;
        failure.kind = kind;
        failure.kindName = kindName;
        failure.description = description;
        return failure;
    }

    /**
     * @brief Перевести перехваченное исключение в Failure
     *
     * Вызывается из catch-блока с std::current_exception().
     */
    static Failure fromException(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const UpstreamError& e) {
            return upstream(e.status(), e.reason());
        } catch (const ValidationError& e) {
            return local(FailureKind::VALIDATION, e.kindName(), e.what());
        } catch (const PersistenceError& e) {
            return local(FailureKind::PERSISTENCE, e.kindName(), e.what());
        } catch (const TransportError& e) {
            return local(FailureKind::TRANSPORT, e.kindName(), e.what());
        } catch (const ConfigurationError& e) {
            return local(FailureKind::CONFIGURATION, e.kindName(), e.what());
        } catch (const BudgetError& e) {
            return local(FailureKind::UNKNOWN, e.kindName(), e.what());
        } catch (const nlohmann::json::exception& e) {
            return local(FailureKind::TRANSPORT, "ParseError", e.what());
        } catch (const std::exception& e) {
            return local(FailureKind::UNKNOWN, "UnknownError", e.what());
        }
    }
};

} // namespace budget::domain
