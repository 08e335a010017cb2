/**
 * Biometrics.hpp - Embeddings, profiles and verification results
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace aegis::identity {

using Embedding = std::vector<float>;

enum class Modality { Voice, Face };

const char* toString(Modality modality);

// L2-normalize; a zero vector is returned unchanged.
Embedding normalize(const Embedding& v);

/**
 * Cosine similarity of two embeddings (normalized internally).
 * Throws CollaboratorError on dimension mismatch or empty input.
 */
float cosineSimilarity(const Embedding& a, const Embedding& b);

// Mean of normalized embeddings, renormalized. Empty input gives empty output.
Embedding averageEmbeddings(const std::vector<Embedding>& embeddings);

struct VerificationResult {
    Modality modality = Modality::Voice;
    float similarity = -1.0f;   // best similarity seen, -1 when nothing compared
    bool matched = false;
    bool evaluated = false;     // false: no face / no embedding / camera unavailable
    int attempts = 0;           // frames examined (face path)
};

struct BiometricProfile {
    Modality modality = Modality::Voice;
    Embedding embedding;        // L2-normalized
    int samples = 0;
    std::string created;        // ISO-8601
};

using VoiceProfile = BiometricProfile;
using FaceProfile = BiometricProfile;

struct ProfileSet {
    std::optional<VoiceProfile> voice;
    std::optional<FaceProfile> face;

    bool empty() const { return !voice && !face; }
};

} // namespace aegis::identity
