/**
 * test_biometrics.cpp - Embedding math tests
 */

#include "aegis/Errors.hpp"
#include "aegis/identity/Biometrics.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace aegis;
using namespace aegis::identity;

constexpr float EPS = 1e-5f;

Embedding randomEmbedding(std::mt19937& rng, size_t dim) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    Embedding e(dim);
    for (auto& x : e) x = dist(rng);
    return e;
}

void test_normalize() {
    auto n = normalize({3.0f, 4.0f});
    assert(std::fabs(n[0] - 0.6f) < EPS);
    assert(std::fabs(n[1] - 0.8f) < EPS);

    // Zero vector comes back unchanged
    auto z = normalize({0.0f, 0.0f, 0.0f});
    assert(z == Embedding({0.0f, 0.0f, 0.0f}));

    std::cout << "[PASS] test_normalize" << std::endl;
}

void test_cosine_similarity() {
    assert(std::fabs(cosineSimilarity({1, 0}, {1, 0}) - 1.0f) < EPS);
    assert(std::fabs(cosineSimilarity({1, 0}, {0, 1})) < EPS);
    assert(std::fabs(cosineSimilarity({1, 0}, {-1, 0}) + 1.0f) < EPS);
    // Scale-invariant
    assert(std::fabs(cosineSimilarity({2, 0}, {0.6f, 0.8f}) - 0.6f) < EPS);

    std::cout << "[PASS] test_cosine_similarity" << std::endl;
}

void test_cosine_rejects_bad_input() {
    bool threw = false;
    try {
        cosineSimilarity({1, 0, 0}, {1, 0});
    } catch (const CollaboratorError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        cosineSimilarity({}, {});
    } catch (const CollaboratorError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_cosine_rejects_bad_input" << std::endl;
}

// An averaged profile compared with itself is ~1
void test_averaged_profile_self_similarity() {
    std::mt19937 rng(42);
    for (int round = 0; round < 20; ++round) {
        std::vector<Embedding> clips;
        for (int i = 0; i < 5; ++i) {
            clips.push_back(normalize(randomEmbedding(rng, 192)));
        }
        Embedding profile = averageEmbeddings(clips);
        assert(profile.size() == 192);

        double norm = 0.0;
        for (float x : profile) norm += static_cast<double>(x) * x;
        assert(std::fabs(norm - 1.0) < 1e-4);

        assert(std::fabs(cosineSimilarity(profile, profile) - 1.0f) < 1e-5f);
    }

    std::cout << "[PASS] test_averaged_profile_self_similarity" << std::endl;
}

void test_average_is_closer_than_outlier() {
    std::vector<Embedding> clips = {{1.0f, 0.1f}, {1.0f, -0.1f}, {0.9f, 0.0f}};
    Embedding profile = averageEmbeddings(clips);
    assert(cosineSimilarity(profile, {1.0f, 0.0f}) > 0.99f);
    assert(cosineSimilarity(profile, {0.0f, 1.0f}) < 0.1f);

    assert(averageEmbeddings({}).empty());

    bool threw = false;
    try {
        averageEmbeddings({{1.0f, 0.0f}, {1.0f}});
    } catch (const CollaboratorError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_average_is_closer_than_outlier" << std::endl;
}

void test_profile_set() {
    ProfileSet set;
    assert(set.empty());
    set.face = FaceProfile{Modality::Face, {1.0f, 0.0f}, 3, "2026-01-01T00:00:00Z"};
    assert(!set.empty());
    assert(std::string(toString(Modality::Face)) == "face");
    assert(std::string(toString(Modality::Voice)) == "voice");

    std::cout << "[PASS] test_profile_set" << std::endl;
}

int main() {
    std::cout << "=== Biometrics Tests ===" << std::endl;

    test_normalize();
    test_cosine_similarity();
    test_cosine_rejects_bad_input();
    test_averaged_profile_self_similarity();
    test_average_is_closer_than_outlier();
    test_profile_set();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
