#include "launch_pipeline.hpp"
#include "pipeline_error.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

const char* toString(LaunchError error) {
    switch (error) {
    case LaunchError::Transport:
        return "transport";
    case LaunchError::Timeout:
        return "timeout";
    case LaunchError::NotFound:
        return "not_found";
    case LaunchError::MintNotIdentified:
        return "mint_not_identified";
    case LaunchError::Decode:
        return "decode";
    case LaunchError::Unexpected:
        return "unexpected";
    }
    return "unknown";
}

LaunchOutcome LaunchPipeline::process(const LaunchEvent& event) const {
    try {
        auto launch = resolver_.resolve(event.signature);
        return LaunchOutcome::success(evaluator_.evaluate(launch, event.log_lines));
    } catch (const PipelineError& e) {
        return LaunchOutcome::failure(event.signature, e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        return LaunchOutcome::failure(event.signature, LaunchError::Decode, e.what());
    } catch (const std::exception& e) {
        return LaunchOutcome::failure(event.signature, LaunchError::Unexpected, e.what());
    }
}
