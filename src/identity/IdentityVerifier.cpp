/**
 * IdentityVerifier.cpp - Voice and face verification
 */

#include "aegis/identity/IdentityVerifier.hpp"

#include <iomanip>
#include <iostream>

namespace aegis::identity {

const DetectedFace* largestFace(const std::vector<DetectedFace>& faces) {
    const DetectedFace* best = nullptr;
    for (const auto& face : faces) {
        if (!best || face.box.area() > best->box.area()) {
            best = &face;
        }
    }
    return best;
}

IdentityVerifier::IdentityVerifier(VoiceEmbedder& voice,
                                   FaceEmbedder& face,
                                   resource::ResourceGuard& camera,
                                   camera::FrameSource& frames,
                                   const VerifierConfig& config)
    : voice_(voice)
    , face_(face)
    , camera_(camera)
    , frames_(frames)
    , config_(config) {
}

VerificationResult IdentityVerifier::verifyVoice(const std::vector<float>& samples,
                                                 int sample_rate,
                                                 const VoiceProfile& profile) {
    VerificationResult result;
    result.modality = Modality::Voice;
    result.attempts = 1;

    auto embedding = voice_.embedVoice(samples, sample_rate);
    if (!embedding) {
        std::cerr << "[IdentityVerifier] No voice embedding extracted" << std::endl;
        return result;
    }

    result.evaluated = true;
    result.similarity = cosineSimilarity(*embedding, profile.embedding);
    result.matched = result.similarity >= config_.voice_threshold;

    std::cout << "[IdentityVerifier] Voice similarity " << std::fixed << std::setprecision(3)
              << result.similarity << " (threshold " << config_.voice_threshold << ") -> "
              << (result.matched ? "match" : "no match") << std::endl;
    return result;
}

VerificationResult IdentityVerifier::verifyFace(const FaceProfile& profile,
                                                std::chrono::milliseconds frame_timeout,
                                                int max_attempts) {
    VerificationResult result;
    result.modality = Modality::Face;

    // Preempts CameraMonitor; released on every exit path
    auto acquired = camera_.acquireExclusive("identity_verifier");
    if (!acquired.granted()) {
        std::cerr << "[IdentityVerifier] Camera not available: "
                  << resource::toString(acquired.status) << std::endl;
        return result;
    }

    camera::ScopedFrameSource device(frames_);
    if (!device.isOpen()) {
        std::cerr << "[IdentityVerifier] Camera could not be opened" << std::endl;
        return result;
    }

    std::cout << "[IdentityVerifier] Face check (up to " << max_attempts << " frames)..." << std::endl;

    camera::Frame frame;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        result.attempts++;

        if (!device->read(frame, frame_timeout)) {
            continue;
        }

        auto faces = face_.detectFaces(frame);
        const DetectedFace* face = largestFace(faces);
        if (!face) {
            continue;
        }

        float similarity = cosineSimilarity(face->embedding, profile.embedding);
        result.evaluated = true;
        if (similarity > result.similarity) {
            result.similarity = similarity;
        }
        if (similarity >= config_.face_threshold) {
            result.matched = true;
            break;
        }
    }

    std::cout << "[IdentityVerifier] Face similarity " << std::fixed << std::setprecision(3)
              << result.similarity << " after " << result.attempts << " frames -> "
              << (result.matched ? "match" : "no match") << std::endl;
    return result;
}

} // namespace aegis::identity
