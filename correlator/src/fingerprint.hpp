#pragma once

#include "types.hpp"
#include <string>

// Stable identity of an incident for deduplication. The digest covers the
// normalized source, category, resource type, resource id and title.
class FingerprintGenerator {
public:
    std::string fingerprint(const Incident& incident) const;

    // Delimited, normalized input fed to the digest
    static std::string canonical_form(const Incident& incident);

private:
    static constexpr char FIELD_DELIMITER = '\x1f';
};
