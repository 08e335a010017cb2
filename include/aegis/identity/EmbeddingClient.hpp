/**
 * EmbeddingClient.hpp - HTTP client for the speaker/face embedding server
 *
 * POST /embed/voice  {"sample_rate", "samples"}      -> {"embedding"}
 * POST /embed/face   JPEG body                       -> {"faces": [{"bbox", "embedding"}]}
 * GET  /health
 */

#pragma once

#include "aegis/identity/Embedder.hpp"

#include <memory>
#include <string>

namespace aegis::identity {

class EmbeddingClient : public VoiceEmbedder, public FaceEmbedder {
public:
    explicit EmbeddingClient(const std::string& base_url = "http://localhost:8090",
                             int timeout_ms = 10000);
    ~EmbeddingClient() override;

    EmbeddingClient(const EmbeddingClient&) = delete;
    EmbeddingClient& operator=(const EmbeddingClient&) = delete;

    bool isHealthy();

    std::optional<Embedding> embedVoice(const std::vector<float>& samples,
                                        int sample_rate) override;

    std::vector<DetectedFace> detectFaces(const camera::Frame& frame) override;

    const std::string& baseUrl() const { return base_url_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string base_url_;
};

} // namespace aegis::identity
