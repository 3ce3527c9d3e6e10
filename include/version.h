#ifndef RELVER_VERSION_H_
#define RELVER_VERSION_H_

#include <map>
#include <optional>
#include <string>

// Literal marker that prefixes a semantic version when used as a git tag.
const std::string kVersionMarker = "v";

enum class ReleaseKind {
    kPatch,
    kMinor,
    kMajor,
    kNoRelease,
};

enum class RefType {
    kBranch,
    kTag,
};

const std::map<ReleaseKind, std::string>& ReleaseKindNames();

// Both throw std::invalid_argument on an empty or unknown name.
ReleaseKind ParseReleaseKind(const std::string& name);
RefType ParseRefType(const std::string& name);

struct SemanticVersion {
    int major = 0;
    int minor = 1;
    int patch = 0;

    // "X.Y.Z", the form used for docker tags and release outputs.
    std::string ToString() const;
    // "vX.Y.Z", the form used for git tags.
    std::string ToTag() const;

    static SemanticVersion Parse(const std::string& str);
    static std::optional<SemanticVersion> TryParseTag(const std::string& tag);

    bool operator==(const SemanticVersion& o) const;
    bool operator!=(const SemanticVersion& o) const { return !(*this == o); }
    bool operator<(const SemanticVersion& o) const;
};

// Compute the next version from a base, given the requested release kind.
//
// - major: +1 MAJOR (resets minor + patch)
// - minor: +1 MINOR (resets patch)
// - patch: +1 PATCH
// - no_release: no version
//
// Throws std::overflow_error when the bumped component would overflow.
std::optional<SemanticVersion> ComputeNextVersion(const SemanticVersion& base,
                                                  ReleaseKind kind);

#endif  // RELVER_VERSION_H_
