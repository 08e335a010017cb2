/**
 * Enrollment.cpp - Profile enrollment
 */

#include "aegis/identity/Enrollment.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace aegis::identity {

Enrollment::Enrollment(ProfileStore& store,
                       VoiceEmbedder& voice,
                       FaceEmbedder& face,
                       resource::ResourceGuard& camera,
                       camera::FrameSource& frames)
    : store_(store)
    , voice_(voice)
    , face_(face)
    , camera_(camera)
    , frames_(frames) {
}

std::optional<VoiceProfile> Enrollment::enrollVoice(audio::CommandRecorder& recorder,
                                                    int samples,
                                                    std::chrono::milliseconds duration,
                                                    const EnrollPrompt& prompt) {
    last_error_.clear();
    std::vector<Embedding> collected;

    for (int i = 0; i < samples; ++i) {
        if (prompt) {
            prompt(i + 1, samples);
        }

        auto rec = recorder.record(duration);
        if (!rec.ok()) {
            std::cerr << "[Enrollment] Clip " << (i + 1) << " not recorded: "
                      << toString(rec.error) << std::endl;
            continue;
        }

        try {
            auto embedding = voice_.embedVoice(rec.samples, rec.sample_rate);
            if (!embedding) {
                std::cerr << "[Enrollment] Clip " << (i + 1) << " gave no embedding" << std::endl;
                continue;
            }
            collected.push_back(std::move(*embedding));
            std::cout << "[Enrollment] Voice clip " << (i + 1) << "/" << samples << " ok" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Enrollment] Voice embedding failed: " << e.what() << std::endl;
        }
    }

    if (collected.empty()) {
        last_error_ = "no usable voice samples";
        std::cerr << "[Enrollment] " << last_error_ << std::endl;
        return std::nullopt;
    }

    VoiceProfile profile;
    profile.modality = Modality::Voice;
    profile.samples = static_cast<int>(collected.size());
    try {
        profile.embedding = averageEmbeddings(collected);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        std::cerr << "[Enrollment] " << last_error_ << std::endl;
        return std::nullopt;
    }
    profile.created = isoTimestamp();

    if (!store_.save(profile)) {
        last_error_ = "could not save voice profile";
        return std::nullopt;
    }
    return profile;
}

std::optional<FaceProfile> Enrollment::enrollFace(int frames,
                                                  int max_reads,
                                                  std::chrono::milliseconds frame_timeout) {
    last_error_.clear();

    auto acquired = camera_.acquireExclusive("enrollment");
    if (!acquired.granted()) {
        last_error_ = std::string("camera ") + resource::toString(acquired.status);
        std::cerr << "[Enrollment] " << last_error_ << std::endl;
        return std::nullopt;
    }

    std::vector<Embedding> collected;
    {
        camera::ScopedFrameSource device(frames_);
        if (!device.isOpen()) {
            last_error_ = "camera could not be opened";
            std::cerr << "[Enrollment] " << last_error_ << std::endl;
            return std::nullopt;
        }

        camera::Frame frame;
        for (int reads = 0; reads < max_reads && static_cast<int>(collected.size()) < frames; ++reads) {
            if (!device->read(frame, frame_timeout)) {
                continue;
            }
            try {
                auto faces = face_.detectFaces(frame);
                const DetectedFace* face = largestFace(faces);
                if (!face) {
                    continue;
                }
                collected.push_back(face->embedding);
                std::cout << "[Enrollment] Face " << collected.size() << "/" << frames << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[Enrollment] Face embedding failed: " << e.what() << std::endl;
            }
        }
    }

    if (collected.empty()) {
        last_error_ = "no face detected";
        std::cerr << "[Enrollment] " << last_error_ << std::endl;
        return std::nullopt;
    }

    FaceProfile profile;
    profile.modality = Modality::Face;
    profile.samples = static_cast<int>(collected.size());
    try {
        profile.embedding = averageEmbeddings(collected);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        std::cerr << "[Enrollment] " << last_error_ << std::endl;
        return std::nullopt;
    }
    profile.created = isoTimestamp();

    if (!store_.save(profile)) {
        last_error_ = "could not save face profile";
        return std::nullopt;
    }
    return profile;
}

} // namespace aegis::identity
