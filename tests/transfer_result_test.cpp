#include "rangeget/transfer_result.hpp"

#include <catch2/catch.hpp>

#include <string>

using rangeget::TransferOutcome;
using rangeget::TransferResult;

TEST_CASE("Outcomes have stable names", "[result]") {
    CHECK(std::string(rangeget::toString(TransferOutcome::Completed)) == "completed");
    CHECK(std::string(rangeget::toString(TransferOutcome::Failed)) == "failed");
    CHECK(std::string(rangeget::toString(TransferOutcome::Cancelled)) == "cancelled");
}

TEST_CASE("Only a completed transfer is ok", "[result]") {
    TransferResult result;
    CHECK(result.outcome == TransferOutcome::Failed);
    CHECK_FALSE(result.ok());

    result.outcome = TransferOutcome::Cancelled;
    CHECK_FALSE(result.ok());

    result.outcome = TransferOutcome::Completed;
    CHECK(result.ok());
}
