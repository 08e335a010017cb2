/**
 * ProfileStore.hpp - Voice/face profile persistence
 *
 * <dir>/voiceprint.json and <dir>/faceprint.json:
 *   {"modality": "voice", "dimension": N, "samples": k,
 *    "created": "<ISO-8601>", "embedding": [...]}
 * A missing file means "not enrolled".
 */

#pragma once

#include "aegis/identity/Biometrics.hpp"

#include <optional>
#include <string>

namespace aegis::identity {

class ProfileStore {
public:
    explicit ProfileStore(std::string directory);

    /**
     * @return nullopt when not enrolled
     * @throws std::runtime_error when the file exists but is malformed
     */
    std::optional<BiometricProfile> load(Modality modality) const;

    ProfileSet loadAll() const;

    // Normalizes the embedding and stamps `created` if empty.
    bool save(const BiometricProfile& profile) const;

    bool exists(Modality modality) const;
    bool remove(Modality modality) const;

    std::string pathFor(Modality modality) const;
    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string isoTimestamp();

} // namespace aegis::identity
