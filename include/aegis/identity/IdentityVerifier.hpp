/**
 * IdentityVerifier.hpp - Voice and face verification against stored profiles
 *
 * Stateless between calls. The face path borrows the camera with an
 * Exclusive lease, which preempts CameraMonitor for its duration.
 */

#pragma once

#include "aegis/camera/FrameSource.hpp"
#include "aegis/identity/Biometrics.hpp"
#include "aegis/identity/Embedder.hpp"
#include "aegis/resource/ResourceGuard.hpp"

#include <chrono>
#include <vector>

namespace aegis::identity {

struct VerifierConfig {
    float voice_threshold = 0.75f;
    float face_threshold = 0.8f;
};

class IdentityVerifier {
public:
    IdentityVerifier(VoiceEmbedder& voice,
                     FaceEmbedder& face,
                     resource::ResourceGuard& camera,
                     camera::FrameSource& frames,
                     const VerifierConfig& config = {});
    virtual ~IdentityVerifier() = default;

    /**
     * Embed the recording and compare with the voice profile.
     * Throws CollaboratorError if the embedder fails.
     */
    virtual VerificationResult verifyVoice(const std::vector<float>& samples,
                                           int sample_rate,
                                           const VoiceProfile& profile);

    /**
     * Examine up to max_attempts frames, comparing the largest face in each
     * with the profile; stops at the first match. Returns evaluated=false
     * when the camera is busy or cannot be opened, or no face was seen.
     */
    virtual VerificationResult verifyFace(const FaceProfile& profile,
                                          std::chrono::milliseconds frame_timeout,
                                          int max_attempts);

    const VerifierConfig& config() const { return config_; }

private:
    VoiceEmbedder& voice_;
    FaceEmbedder& face_;
    resource::ResourceGuard& camera_;
    camera::FrameSource& frames_;
    VerifierConfig config_;
};

} // namespace aegis::identity
