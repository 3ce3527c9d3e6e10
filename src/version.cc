#include <limits>
#include <regex>
#include <stdexcept>

#include "version.h"

namespace {

int Increment(int component, const SemanticVersion& base) {
    if (component == std::numeric_limits<int>::max()) {
        throw std::overflow_error("Cannot increment version " + base.ToString());
    }
    return component + 1;
}

std::optional<SemanticVersion> MatchVersion(const std::string& str,
                                            const std::regex& re) {
    std::smatch m;
    if (!std::regex_match(str, m, re)) {
        return std::nullopt;
    }
    SemanticVersion v;
    int* parts[] = {&v.major, &v.minor, &v.patch};
    for (int i = 0; i < 3; ++i) {
        // \d+ can still overflow int; such a tag is not a version.
        if (m[i + 1].length() > 10) return std::nullopt;
        long long n = std::stoll(m[i + 1].str());
        if (n > std::numeric_limits<int>::max()) return std::nullopt;
        *parts[i] = static_cast<int>(n);
    }
    return v;
}

}  // namespace

const std::map<ReleaseKind, std::string>& ReleaseKindNames() {
    static const std::map<ReleaseKind, std::string> names = {
        {ReleaseKind::kPatch, "patch"},
        {ReleaseKind::kMinor, "minor"},
        {ReleaseKind::kMajor, "major"},
        {ReleaseKind::kNoRelease, "no_release"},
    };
    return names;
}

ReleaseKind ParseReleaseKind(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Release kind is empty");
    }
    for (const auto& [kind, kind_name] : ReleaseKindNames()) {
        if (kind_name == name) return kind;
    }
    throw std::invalid_argument("Unknown release kind: " + name +
                                " (expected patch, minor, major or no_release)");
}

RefType ParseRefType(const std::string& name) {
    if (name == "branch") return RefType::kBranch;
    if (name == "tag") return RefType::kTag;
    throw std::invalid_argument("Unknown ref type: '" + name +
                                "' (expected branch or tag)");
}

std::string SemanticVersion::ToString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch);
}

std::string SemanticVersion::ToTag() const { return kVersionMarker + ToString(); }

SemanticVersion SemanticVersion::Parse(const std::string& str) {
    static const std::regex re(R"(^v?(\d+)\.(\d+)\.(\d+)$)");
    auto v = MatchVersion(str, re);
    if (!v) {
        throw std::runtime_error("Invalid version string: " + str);
    }
    return *v;
}

std::optional<SemanticVersion> SemanticVersion::TryParseTag(const std::string& tag) {
    static const std::regex re(R"(^v(\d+)\.(\d+)\.(\d+)$)");
    return MatchVersion(tag, re);
}

bool SemanticVersion::operator==(const SemanticVersion& o) const {
    return major == o.major && minor == o.minor && patch == o.patch;
}

bool SemanticVersion::operator<(const SemanticVersion& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    return patch < o.patch;
}

std::optional<SemanticVersion> ComputeNextVersion(const SemanticVersion& base,
                                                  ReleaseKind kind) {
    SemanticVersion v = base;

    switch (kind) {
        case ReleaseKind::kMajor:
            v.major = Increment(v.major, base);
            v.minor = 0;
            v.patch = 0;
            return v;
        case ReleaseKind::kMinor:
            v.minor = Increment(v.minor, base);
            v.patch = 0;
            return v;
        case ReleaseKind::kPatch:
            v.patch = Increment(v.patch, base);
            return v;
        case ReleaseKind::kNoRelease:
            break;
    }

    return std::nullopt;
}
