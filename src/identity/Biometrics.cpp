/**
 * Biometrics.cpp - Embedding math
 */

#include "aegis/identity/Biometrics.hpp"
#include "aegis/Errors.hpp"

#include <cmath>

namespace aegis::identity {

constexpr double NORM_EPSILON = 1e-9;

const char* toString(Modality modality) {
    return modality == Modality::Face ? "face" : "voice";
}

Embedding normalize(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    double norm = std::sqrt(sum);
    if (norm < NORM_EPSILON) {
        return v;
    }

    Embedding out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(v[i] / norm);
    }
    return out;
}

float cosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty()) {
        throw CollaboratorError("empty embedding");
    }
    if (a.size() != b.size()) {
        throw CollaboratorError("embedding dimension mismatch: " +
                                std::to_string(a.size()) + " vs " + std::to_string(b.size()));
    }

    Embedding na = normalize(a);
    Embedding nb = normalize(b);

    double dot = 0.0;
    for (size_t i = 0; i < na.size(); ++i) {
        dot += static_cast<double>(na[i]) * nb[i];
    }
    if (dot > 1.0) dot = 1.0;
    if (dot < -1.0) dot = -1.0;
    return static_cast<float>(dot);
}

Embedding averageEmbeddings(const std::vector<Embedding>& embeddings) {
    if (embeddings.empty()) {
        return {};
    }

    const size_t dim = embeddings.front().size();
    std::vector<double> sum(dim, 0.0);
    size_t used = 0;

    for (const auto& e : embeddings) {
        if (e.size() != dim) {
            throw CollaboratorError("embedding dimension mismatch while averaging");
        }
        Embedding n = normalize(e);
        for (size_t i = 0; i < dim; ++i) {
            sum[i] += n[i];
        }
        used++;
    }

    Embedding mean(dim);
    for (size_t i = 0; i < dim; ++i) {
        mean[i] = static_cast<float>(sum[i] / used);
    }
    return normalize(mean);
}

} // namespace aegis::identity
