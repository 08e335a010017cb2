/**
 * ProfileStore.cpp - JSON profile files
 */

#include "aegis/identity/ProfileStore.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace aegis::identity {

std::string isoTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

ProfileStore::ProfileStore(std::string directory)
    : directory_(std::move(directory)) {
}

std::string ProfileStore::pathFor(Modality modality) const {
    const char* name = modality == Modality::Face ? "faceprint.json" : "voiceprint.json";
    return (fs::path(directory_) / name).string();
}

bool ProfileStore::exists(Modality modality) const {
    std::error_code ec;
    return fs::exists(pathFor(modality), ec);
}

std::optional<BiometricProfile> ProfileStore::load(Modality modality) const {
    const std::string path = pathFor(modality);
    if (!exists(modality)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("cannot read profile " + path);
    }

    BiometricProfile profile;
    profile.modality = modality;

    try {
        json j = json::parse(file);
        std::string stored = j.at("modality").get<std::string>();
        if (stored != toString(modality)) {
            throw std::runtime_error("profile " + path + " holds modality '" + stored + "'");
        }
        profile.embedding = j.at("embedding").get<Embedding>();
        profile.samples = j.value("samples", 0);
        profile.created = j.value("created", "");

        size_t dimension = j.value("dimension", profile.embedding.size());
        if (profile.embedding.empty() || dimension != profile.embedding.size()) {
            throw std::runtime_error("profile " + path + " has inconsistent dimension");
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("malformed profile " + path + ": " + e.what());
    }

    profile.embedding = normalize(profile.embedding);
    return profile;
}

ProfileSet ProfileStore::loadAll() const {
    ProfileSet set;
    set.voice = load(Modality::Voice);
    set.face = load(Modality::Face);

    std::cout << "[ProfileStore] Voice profile: " << (set.voice ? "enrolled" : "none")
              << ", face profile: " << (set.face ? "enrolled" : "none") << std::endl;
    return set;
}

bool ProfileStore::save(const BiometricProfile& profile) const {
    if (profile.embedding.empty()) {
        std::cerr << "[ProfileStore] Refusing to save empty embedding" << std::endl;
        return false;
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        std::cerr << "[ProfileStore] Cannot create " << directory_ << ": "
                  << ec.message() << std::endl;
        return false;
    }

    Embedding embedding = normalize(profile.embedding);
    json j = {
        {"modality", toString(profile.modality)},
        {"dimension", embedding.size()},
        {"samples", profile.samples},
        {"created", profile.created.empty() ? isoTimestamp() : profile.created},
        {"embedding", embedding}
    };

    // Write-then-rename so a crash never leaves a half-written profile
    const std::string path = pathFor(profile.modality);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp);
        if (!file.good()) {
            std::cerr << "[ProfileStore] Cannot write " << tmp << std::endl;
            return false;
        }
        file << j.dump(2) << std::endl;
        if (!file.good()) {
            std::cerr << "[ProfileStore] Write failed: " << tmp << std::endl;
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "[ProfileStore] Cannot replace " << path << ": " << ec.message() << std::endl;
        return false;
    }

    std::cout << "[ProfileStore] Saved " << toString(profile.modality) << " profile ("
              << embedding.size() << " dims, " << profile.samples << " samples)" << std::endl;
    return true;
}

bool ProfileStore::remove(Modality modality) const {
    std::error_code ec;
    return fs::remove(pathFor(modality), ec);
}

} // namespace aegis::identity
