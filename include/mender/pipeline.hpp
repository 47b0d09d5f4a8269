#pragma once

#include "mender/collaborators.hpp"
#include "mender/repair_loop.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mender {

/**
 * @brief Architecture followed by the repair loop
 *
 * The Architect turns the request into an AppDefinition once. Its failure
 * ends the build Abandoned before any attempt is made.
 */
class Pipeline {
public:
    Pipeline(std::shared_ptr<Architect> architect,
             std::shared_ptr<Developer> developer,
             std::shared_ptr<QA> qa,
             std::shared_ptr<Fixer> fixer,
             LoopConfig config = get_builtin_config());

    RepairResult build(const std::string& request);

    // The definition produced by the last build, if the Architect answered
    const std::optional<AppDefinition>& definition() const { return definition_; }

private:
    std::shared_ptr<Architect> architect_;
    RepairLoop loop_;
    std::chrono::milliseconds timeout_;
    std::optional<AppDefinition> definition_;
};

} // namespace mender
