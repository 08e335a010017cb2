/**
 * EmbeddingClient.cpp - HTTP client for the embedding server
 *
 * Uses cpp-httplib for transport and nlohmann/json for payloads; frames are
 * JPEG-encoded with OpenCV before upload.
 */

#include "aegis/identity/EmbeddingClient.hpp"
#include "aegis/Errors.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using json = nlohmann::json;

namespace aegis::identity {

struct EmbeddingClient::Impl {
    std::unique_ptr<httplib::Client> client;

    Impl(const std::string& url, int timeout_ms) {
        client = std::make_unique<httplib::Client>(url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }

    json post(const std::string& path, const std::string& body, const std::string& type) {
        auto res = client->Post(path, body, type);
        if (!res) {
            throw CollaboratorError("embedding server unreachable: " +
                                    httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            throw CollaboratorError("embedding server " + path + " returned " +
                                    std::to_string(res->status));
        }
        try {
            return json::parse(res->body);
        } catch (const std::exception& e) {
            throw CollaboratorError(std::string("embedding server sent bad JSON: ") + e.what());
        }
    }
};

EmbeddingClient::EmbeddingClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(base_url, timeout_ms))
    , base_url_(base_url) {
}

EmbeddingClient::~EmbeddingClient() = default;

bool EmbeddingClient::isHealthy() {
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

std::optional<Embedding> EmbeddingClient::embedVoice(const std::vector<float>& samples,
                                                     int sample_rate) {
    if (samples.empty()) {
        return std::nullopt;
    }

    json req_json = {
        {"sample_rate", sample_rate},
        {"samples", samples}
    };

    json res_json = impl_->post("/embed/voice", req_json.dump(), "application/json");

    try {
        auto it = res_json.find("embedding");
        if (it == res_json.end() || it->is_null()) {
            return std::nullopt;
        }
        Embedding embedding = it->get<Embedding>();
        if (embedding.empty()) {
            return std::nullopt;
        }
        return normalize(embedding);
    } catch (const json::exception& e) {
        throw CollaboratorError(std::string("malformed voice embedding: ") + e.what());
    }
}

std::vector<DetectedFace> EmbeddingClient::detectFaces(const camera::Frame& frame) {
    std::vector<DetectedFace> faces;
    if (frame.empty()) {
        return faces;
    }

    int type = frame.channels == 1 ? CV_8UC1 : CV_8UC3;
    cv::Mat mat(frame.height, frame.width, type,
                const_cast<uint8_t*>(frame.pixels.data()));

    std::vector<uchar> jpeg;
    if (!cv::imencode(".jpg", mat, jpeg)) {
        throw CollaboratorError("JPEG encoding failed");
    }

    json res_json = impl_->post("/embed/face",
                                std::string(jpeg.begin(), jpeg.end()),
                                "image/jpeg");

    try {
        for (const auto& face : res_json.value("faces", json::array())) {
            DetectedFace detected;
            auto bbox = face.at("bbox").get<std::vector<int>>();
            if (bbox.size() != 4) {
                std::cerr << "[EmbeddingClient] Ignoring face with bad bbox" << std::endl;
                continue;
            }
            detected.box = FaceBox{bbox[0], bbox[1], bbox[2], bbox[3]};
            detected.embedding = normalize(face.at("embedding").get<Embedding>());
            if (detected.embedding.empty()) {
                continue;
            }
            faces.push_back(std::move(detected));
        }
    } catch (const json::exception& e) {
        throw CollaboratorError(std::string("malformed face response: ") + e.what());
    }

    return faces;
}

} // namespace aegis::identity
