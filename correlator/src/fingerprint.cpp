#include "fingerprint.hpp"
#include "util.hpp"

std::string FingerprintGenerator::fingerprint(const Incident& incident) const {
    return util::sha256_hex(canonical_form(incident));
}

std::string FingerprintGenerator::canonical_form(const Incident& incident) {
    std::string canonical;
    canonical.reserve(incident.source.size() + incident.category.size() +
                      incident.resource.type.size() + incident.resource.id.size() +
                      incident.title.size() + 5);

    canonical += util::to_lower(util::trim(incident.source));
    canonical += FIELD_DELIMITER;
    canonical += util::to_lower(util::trim(incident.category));
    canonical += FIELD_DELIMITER;
    canonical += util::to_lower(util::trim(incident.resource.type));
    canonical += FIELD_DELIMITER;
    canonical += util::to_lower(util::trim(incident.resource.id));
    canonical += FIELD_DELIMITER;
    canonical += util::normalize_text(incident.title);
    return canonical;
}
