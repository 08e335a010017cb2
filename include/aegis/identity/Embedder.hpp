/**
 * Embedder.hpp - Voice and face embedding seams
 */

#pragma once

#include "aegis/camera/Frame.hpp"
#include "aegis/identity/Biometrics.hpp"

#include <optional>
#include <vector>

namespace aegis::identity {

struct FaceBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    long area() const { return static_cast<long>(width) * height; }
};

struct DetectedFace {
    FaceBox box;
    Embedding embedding;
};

class VoiceEmbedder {
public:
    virtual ~VoiceEmbedder() = default;

    // nullopt when no embedding could be extracted. Throws CollaboratorError
    // on transport or model failure.
    virtual std::optional<Embedding> embedVoice(const std::vector<float>& samples,
                                                int sample_rate) = 0;
};

class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;

    // Every face found in the frame, possibly none.
    virtual std::vector<DetectedFace> detectFaces(const camera::Frame& frame) = 0;
};

// Largest face by box area, nullptr if none.
const DetectedFace* largestFace(const std::vector<DetectedFace>& faces);

} // namespace aegis::identity
