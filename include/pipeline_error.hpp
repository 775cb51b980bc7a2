#pragma once
#include <stdexcept>
#include <string>

#include "detection_result.hpp"

class PipelineError : public std::runtime_error {
public:
    PipelineError(LaunchError kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    LaunchError kind() const noexcept { return kind_; }

private:
    LaunchError kind_;
};
