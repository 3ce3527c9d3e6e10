#ifndef RELVER_RESOLVER_H_
#define RELVER_RESOLVER_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "version.h"

const std::string kDefaultTrunk = "main";
const std::string kEdgeDockerTag = "edge";

class ResolveError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

struct ResolverInput {
    RefType ref_type = RefType::kBranch;
    std::string ref_name;
    // Set in pull-request context; overrides ref_name as the release line.
    std::string base_ref;
    ReleaseKind release_kind = ReleaseKind::kNoRelease;
    std::string trunk = kDefaultTrunk;
};

struct Resolution {
    bool is_version_tag = false;
    bool is_latest_tag = false;
    std::string docker_tag = kEdgeDockerTag;
    ReleaseKind release_kind = ReleaseKind::kNoRelease;
    std::string release_ref;
    std::optional<SemanticVersion> latest_version;
    std::optional<SemanticVersion> new_version;
};

// Highest well-formed version tag in `tags`, skipping the tag named
// `exclude`. Tags that are not "vX.Y.Z" are ignored.
std::optional<SemanticVersion> LatestPriorVersion(const std::vector<std::string>& tags,
                                                  const std::string& exclude);

// Highest version of a release line. On the trunk every version tag counts;
// on any other line only tags starting with "v<release_ref>". Defaults to
// 0.1.0 on the trunk when nothing matches.
std::optional<SemanticVersion> LatestLineVersion(const std::vector<std::string>& tags,
                                                 const std::string& release_ref,
                                                 const std::string& trunk);

// Throws ResolveError on the first failed check.
Resolution Resolve(const ResolverInput& input, const std::vector<std::string>& tags);

#endif  // RELVER_RESOLVER_H_
