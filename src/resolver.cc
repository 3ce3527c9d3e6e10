#include <stdexcept>

#include <spdlog/spdlog.h>

#include "resolver.h"
#include "utils.h"
#include "version.h"

namespace {

std::optional<SemanticVersion> MaxVersion(const std::vector<std::string>& tags,
                                          const std::string& prefix,
                                          const std::string& exclude) {
    std::optional<SemanticVersion> highest;
    for (const auto& tag : tags) {
        if (tag == exclude || !StartsWith(tag, prefix)) continue;

        auto v = SemanticVersion::TryParseTag(tag);
        if (!v) {
            spdlog::debug("Skipping tag {}: not a semantic version", tag);
            continue;
        }
        if (!highest || *highest < *v) {
            highest = v;
        }
    }
    return highest;
}

bool IsLatestTag(const SemanticVersion& self,
                 const std::optional<SemanticVersion>& prior) {
    int prior_major = prior ? prior->major : 0;
    if (self.major < prior_major) return false;
    if (self.minor != 0 || self.patch != 0) return true;
    // A bare X.0.0 only counts once something older exists to supersede.
    return prior && *prior < self;
}

}  // namespace

std::optional<SemanticVersion> LatestPriorVersion(const std::vector<std::string>& tags,
                                                  const std::string& exclude) {
    return MaxVersion(tags, kVersionMarker, exclude);
}

std::optional<SemanticVersion> LatestLineVersion(const std::vector<std::string>& tags,
                                                 const std::string& release_ref,
                                                 const std::string& trunk) {
    if (release_ref == trunk) {
        auto latest = MaxVersion(tags, kVersionMarker, "");
        if (!latest) {
            spdlog::debug("No version tags on {}, using default v0.1.0", trunk);
            return SemanticVersion{0, 1, 0};
        }
        return latest;
    }
    return MaxVersion(tags, kVersionMarker + release_ref, "");
}

Resolution Resolve(const ResolverInput& input, const std::vector<std::string>& tags) {
    Resolution r;
    r.release_kind = input.release_kind;

    r.is_version_tag = input.ref_type == RefType::kTag &&
                       StartsWith(input.ref_name, kVersionMarker);

    if (r.is_version_tag) {
        auto self = SemanticVersion::TryParseTag(input.ref_name);
        if (!self) {
            throw ResolveError("Tag " + input.ref_name +
                               " looks like a version tag but is not vX.Y.Z");
        }
        auto prior = LatestPriorVersion(tags, input.ref_name);
        spdlog::debug("Latest version tag besides {}: {}", input.ref_name,
                      prior ? prior->ToTag() : "<none>");

        r.is_latest_tag = IsLatestTag(*self, prior);
        r.docker_tag = self->ToString();
    }

    r.release_ref = input.base_ref.empty() ? input.ref_name : input.base_ref;
    if (r.release_ref.empty()) {
        throw ResolveError("Release ref is empty: neither base ref nor ref name is set");
    }

    if (r.release_kind == ReleaseKind::kNoRelease) {
        spdlog::debug("No release requested for {}", r.release_ref);
        return r;
    }

    r.latest_version = LatestLineVersion(tags, r.release_ref, input.trunk);
    if (!r.latest_version) {
        throw ResolveError("No version tag found for release line " + r.release_ref);
    }

    try {
        r.new_version = ComputeNextVersion(*r.latest_version, r.release_kind);
    } catch (const std::overflow_error& err) {
        throw ResolveError(err.what());
    }
    if (!r.new_version) {
        throw ResolveError("Cannot compute new version from " +
                           r.latest_version->ToString());
    }

    spdlog::debug("{} release on {}: {} -> {}", ReleaseKindNames().at(r.release_kind),
                  r.release_ref, r.latest_version->ToString(),
                  r.new_version->ToString());
    return r;
}
