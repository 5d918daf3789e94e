#include <gtest/gtest.h>

#include "application/ErrorClassifier.hpp"
#include "domain/Errors.hpp"
#include "domain/Failure.hpp"
#include <nlohmann/json.hpp>

using namespace budget;
using namespace budget::application;

namespace {

template <typename E>
domain::Failure failureOf(const E& error) {
    try {
        throw error;
    } catch (const std::exception&) {
        return domain::Failure::fromException(std::current_exception());
    }
}

} // namespace

// ============================================================================
// ТЕСТЫ: ошибки YNAB
// ============================================================================

TEST(ErrorClassifierTest, Upstream401_InvalidApiKey) {
    EXPECT_EQ(ErrorClassifier::classify(domain::Failure::upstream(401, "Unauthorized")),
              "Error: Invalid API key. Check YNAB_API_KEY environment variable.");
}

TEST(ErrorClassifierTest, Upstream403_Forbidden) {
    EXPECT_EQ(ErrorClassifier::classify(domain::Failure::upstream(403, "Forbidden")),
              "Error: Access forbidden. You don't have permission for this resource.");
}

TEST(ErrorClassifierTest, Upstream404_NotFound) {
    EXPECT_EQ(ErrorClassifier::classify(domain::Failure::upstream(404, "Not Found")),
              "Error: Resource not found. Check the ID is correct.");
}

TEST(ErrorClassifierTest, Upstream429_RateLimit) {
    EXPECT_EQ(ErrorClassifier::classify(domain::Failure::upstream(429, "Too Many Requests")),
              "Error: Rate limit exceeded. Wait before making more requests.");
}

TEST(ErrorClassifierTest, UpstreamOther_StatusAndReason) {
    EXPECT_EQ(ErrorClassifier::classify(domain::Failure::upstream(500, "Internal Server Error")),
              "Error: YNAB API error 500: Internal Server Error");
}

// ============================================================================
// ТЕСТЫ: локальные ошибки
// ============================================================================

TEST(ErrorClassifierTest, Validation_KindAndDescription) {
    auto failure = failureOf(domain::ValidationError("Provide exactly one of amount_milliunits or amount_dollars"));

    EXPECT_EQ(failure.kind, domain::FailureKind::VALIDATION);
    EXPECT_EQ(ErrorClassifier::classify(failure),
              "Error: ValidationError: Provide exactly one of amount_milliunits or amount_dollars");
}

TEST(ErrorClassifierTest, Persistence_KindAndDescription) {
    auto failure = failureOf(domain::PersistenceError("Cannot open /x for writing"));

    EXPECT_EQ(ErrorClassifier::classify(failure), "Error: PersistenceError: Cannot open /x for writing");
}

TEST(ErrorClassifierTest, UpstreamException_KeepsStatus) {
    auto failure = failureOf(domain::UpstreamError(404, "Not Found"));

    EXPECT_EQ(failure.kind, domain::FailureKind::UPSTREAM);
    EXPECT_EQ(failure.status, 404);
    EXPECT_EQ(ErrorClassifier::classify(failure), "Error: Resource not found. Check the ID is correct.");
}

TEST(ErrorClassifierTest, UnknownException_UnknownError) {
    auto failure = failureOf(std::runtime_error("boom"));

    EXPECT_EQ(ErrorClassifier::classify(failure), "Error: UnknownError: boom");
}

TEST(ErrorClassifierTest, IsErrorMessage) {
    EXPECT_TRUE(ErrorClassifier::isErrorMessage("Error: anything"));
    EXPECT_FALSE(ErrorClassifier::isErrorMessage("# Accounts"));
    EXPECT_FALSE(ErrorClassifier::isErrorMessage("{\"Error: \": 1}"));
}
