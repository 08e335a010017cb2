/**
 * test_identity_verifier.cpp - Voice and face verification tests
 */

#include "aegis/identity/IdentityVerifier.hpp"
#include "common/Fakes.hpp"

#include <cassert>
#include <iostream>

using namespace aegis;
using namespace aegis::identity;
using namespace aegis::testing;

const VoiceProfile OWNER_VOICE{Modality::Voice, {1.0f, 0.0f}, 5, "2026-01-01T00:00:00Z"};
const FaceProfile OWNER_FACE{Modality::Face, {1.0f, 0.0f}, 10, "2026-01-01T00:00:00Z"};

struct Rig {
    FakeVoiceEmbedder voice;
    FakeFaceEmbedder face;
    resource::ResourceGuard camera{resource::ResourceKind::Camera};
    FakeFrameSource frames;
    IdentityVerifier verifier{voice, face, camera, frames, VerifierConfig{0.75f, 0.8f}};
    std::vector<float> clip = std::vector<float>(16000, 0.1f);
};

void test_voice_match_and_mismatch() {
    Rig rig;

    rig.voice.set(embeddingAt(0.9f));
    auto ok = rig.verifier.verifyVoice(rig.clip, 16000, OWNER_VOICE);
    assert(ok.evaluated && ok.matched);
    assert(ok.modality == Modality::Voice);
    assert(std::fabs(ok.similarity - 0.9f) < 1e-4f);

    rig.voice.set(embeddingAt(0.60f));
    auto bad = rig.verifier.verifyVoice(rig.clip, 16000, OWNER_VOICE);
    assert(bad.evaluated && !bad.matched);
    assert(std::fabs(bad.similarity - 0.60f) < 1e-4f);

    rig.voice.set(embeddingAt(0.76f));
    assert(rig.verifier.verifyVoice(rig.clip, 16000, OWNER_VOICE).matched);

    std::cout << "[PASS] test_voice_match_and_mismatch" << std::endl;
}

void test_voice_without_embedding() {
    Rig rig;
    rig.voice.set(std::nullopt);

    auto r = rig.verifier.verifyVoice(rig.clip, 16000, OWNER_VOICE);
    assert(!r.evaluated);
    assert(!r.matched);
    assert(r.similarity == -1.0f);

    rig.voice.fail = true;
    bool threw = false;
    try {
        rig.verifier.verifyVoice(rig.clip, 16000, OWNER_VOICE);
    } catch (const CollaboratorError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_voice_without_embedding" << std::endl;
}

void test_face_match_stops_early() {
    Rig rig;
    rig.face.set(embeddingAt(0.85f));

    auto r = rig.verifier.verifyFace(OWNER_FACE, 50ms, 10);
    assert(r.evaluated && r.matched);
    assert(r.modality == Modality::Face);
    assert(r.attempts == 1);
    assert(std::fabs(r.similarity - 0.85f) < 1e-4f);

    // Camera handed back
    assert(!rig.camera.exclusiveHeld());
    assert(!rig.frames.isOpen());

    std::cout << "[PASS] test_face_match_stops_early" << std::endl;
}

void test_face_mismatch_uses_all_attempts() {
    Rig rig;
    rig.face.set(embeddingAt(0.5f));

    auto r = rig.verifier.verifyFace(OWNER_FACE, 50ms, 4);
    assert(r.evaluated && !r.matched);
    assert(r.attempts == 4);
    assert(rig.face.calls == 4);

    std::cout << "[PASS] test_face_mismatch_uses_all_attempts" << std::endl;
}

void test_face_unavailable() {
    Rig rig;

    // No face in view
    rig.face.set(std::nullopt);
    auto none = rig.verifier.verifyFace(OWNER_FACE, 10ms, 3);
    assert(!none.evaluated && !none.matched);
    assert(none.attempts == 3);

    // Camera busy
    {
        auto busy = rig.camera.acquireExclusive("someone");
        auto r = rig.verifier.verifyFace(OWNER_FACE, 10ms, 3);
        assert(!r.evaluated && r.attempts == 0);
    }

    // Camera cannot be opened
    rig.frames.openable = false;
    auto closed = rig.verifier.verifyFace(OWNER_FACE, 10ms, 3);
    assert(!closed.evaluated);
    assert(!rig.camera.exclusiveHeld());

    std::cout << "[PASS] test_face_unavailable" << std::endl;
}

void test_face_error_releases_camera() {
    Rig rig;
    rig.face.fail = true;

    bool threw = false;
    try {
        rig.verifier.verifyFace(OWNER_FACE, 10ms, 3);
    } catch (const CollaboratorError&) {
        threw = true;
    }
    assert(threw);
    assert(!rig.camera.exclusiveHeld());
    assert(!rig.frames.isOpen());

    std::cout << "[PASS] test_face_error_releases_camera" << std::endl;
}

void test_largest_face() {
    std::vector<DetectedFace> faces(3);
    faces[0].box = {0, 0, 10, 10};
    faces[1].box = {0, 0, 30, 20};
    faces[2].box = {0, 0, 5, 50};
    assert(largestFace(faces) == &faces[1]);
    assert(largestFace({}) == nullptr);

    std::cout << "[PASS] test_largest_face" << std::endl;
}

int main() {
    std::cout << "=== IdentityVerifier Tests ===" << std::endl;

    test_voice_match_and_mismatch();
    test_voice_without_embedding();
    test_face_match_stops_early();
    test_face_mismatch_uses_all_attempts();
    test_face_unavailable();
    test_face_error_releases_camera();
    test_largest_face();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
