#include "mender/pipeline.hpp"

#include <spdlog/spdlog.h>

namespace mender {

Pipeline::Pipeline(std::shared_ptr<Architect> architect,
                   std::shared_ptr<Developer> developer,
                   std::shared_ptr<QA> qa,
                   std::shared_ptr<Fixer> fixer,
                   LoopConfig config)
    : architect_(std::move(architect)),
      loop_(std::move(developer), std::move(qa), std::move(fixer), config),
      timeout_(config.collaborator_timeout) {}

RepairResult Pipeline::build(const std::string& request) {
    definition_.reset();

    spdlog::info("Phase: Architecture");
    auto architect = architect_;
    InFlightCalls in_flight;
    auto defined = call_with_timeout<AppDefinition>(
        [architect, request]() { return architect->propose_schemas(request); },
        timeout_, "architect", in_flight);
    in_flight.wait();

    if (defined.isErr()) {
        RepairResult result;
        result.state = LoopState::Abandoned;
        result.reason = "architect failed: " + defined.error().toString();
        spdlog::error("Abandoned: {}", result.reason);
        return result;
    }

    definition_ = defined.value();
    spdlog::info("  -> Defined: {}", definition_->name);
    return loop_.run(*definition_);
}

} // namespace mender
