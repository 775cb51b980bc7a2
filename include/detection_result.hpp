#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct RiskVerdict {
    std::string signature;
    std::string mint;
    std::string creator;
    std::vector<std::string> good_signs;
    std::vector<std::string> red_flags;
    bool high_risk = false;

    bool operator==(const RiskVerdict&) const = default;
};

enum class LaunchError {
    Transport,
    Timeout,
    NotFound,
    MintNotIdentified,
    Decode,
    Unexpected
};

const char* toString(LaunchError error);

// Result of one pipeline pass: a verdict, or the reason the launch was skipped
struct LaunchOutcome {
    std::string signature;
    std::optional<RiskVerdict> verdict;
    LaunchError error = LaunchError::Unexpected;
    std::string detail;

    bool ok() const { return verdict.has_value(); }

    static LaunchOutcome success(RiskVerdict verdict) {
        LaunchOutcome outcome;
        outcome.signature = verdict.signature;
        outcome.verdict = std::move(verdict);
        return outcome;
    }

    static LaunchOutcome failure(std::string signature, LaunchError error,
                                 std::string detail) {
        LaunchOutcome outcome;
        outcome.signature = std::move(signature);
        outcome.error = error;
        outcome.detail = std::move(detail);
        return outcome;
    }
};
