/**
 * Enrollment.hpp - Voice and face enrollment flows
 *
 * Both flows average several normalized embeddings into one profile and
 * persist it through ProfileStore.
 */

#pragma once

#include "aegis/audio/CommandRecorder.hpp"
#include "aegis/camera/FrameSource.hpp"
#include "aegis/identity/Embedder.hpp"
#include "aegis/identity/ProfileStore.hpp"
#include "aegis/resource/ResourceGuard.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace aegis::identity {

// Called before each voice clip with (1-based index, total), e.g. to prompt the user.
using EnrollPrompt = std::function<void(int, int)>;

class Enrollment {
public:
    Enrollment(ProfileStore& store,
               VoiceEmbedder& voice,
               FaceEmbedder& face,
               resource::ResourceGuard& camera,
               camera::FrameSource& frames);

    /**
     * Record `samples` clips (each under its own Exclusive mic lease), embed,
     * average and save. Clips without an embedding are skipped.
     * @return the saved profile, nullopt if nothing usable was collected
     */
    std::optional<VoiceProfile> enrollVoice(audio::CommandRecorder& recorder,
                                            int samples,
                                            std::chrono::milliseconds duration,
                                            const EnrollPrompt& prompt = {});

    /**
     * Read frames under an Exclusive camera lease until `frames` faces were
     * collected or `max_reads` reads were made.
     */
    std::optional<FaceProfile> enrollFace(int frames,
                                          int max_reads,
                                          std::chrono::milliseconds frame_timeout);

    const std::string& lastError() const { return last_error_; }

private:
    ProfileStore& store_;
    VoiceEmbedder& voice_;
    FaceEmbedder& face_;
    resource::ResourceGuard& camera_;
    camera::FrameSource& frames_;
    std::string last_error_;
};

} // namespace aegis::identity
