#pragma once

#include "avatar/avatar_fallback_controller.h"
#include "pipeline/stage.h"
#include <memory>

namespace parley {
namespace stages {

/**
 * @brief Routes speech (or text) to the avatar while it is Active
 *
 * Consumed frames stop here and the avatar's own audio/video re-enters
 * the pipeline from the controller's receiver threads. Anything the
 * controller declines passes straight through, which is how a degraded
 * avatar turns the session into plain audio. Text always continues
 * downstream. Participant images are offered to the avatar and never
 * forwarded.
 */
class AvatarStage : public pipeline::Stage {
public:
    explicit AvatarStage(std::shared_ptr<AvatarFallbackController> controller);

    void process(Frame frame, Direction direction) override;
    void interrupt() override;
    void cancel() override;
    void cleanup() override;

private:
    std::shared_ptr<AvatarFallbackController> controller_;
};

} // namespace stages
} // namespace parley
