#include <memory>
#include <stdexcept>

#include <git2.h>
#include <spdlog/spdlog.h>

#include "repository.h"
#include "utils.h"

namespace {

struct GitRemoteDeleter {
    void operator()(git_remote* r) const { git_remote_free(r); }
};

struct GitStrarrayDeleter {
    void operator()(git_strarray* a) const { git_strarray_dispose(a); }
};

using UniqueRemote = std::unique_ptr<git_remote, GitRemoteDeleter>;
using UniqueStrarray = std::unique_ptr<git_strarray, GitStrarrayDeleter>;

struct LibGit2Init {
    LibGit2Init() { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};

static LibGit2Init g_libgit2_init;

#define _CHECK_GIT2(error, msg)                                       \
    if (error < 0) {                                                  \
        const git_error* e = git_error_last();                        \
        throw std::runtime_error(std::string(msg) + ": " +            \
                                 (e ? e->message : "unknown error")); \
    }

}  // namespace

std::string SSH2HTTPS(const std::string& url) {
    if (!StartsWith(url, kSSHPrefix)) {
        return url;
    }
    std::string path = url.substr(kSSHPrefix.length());
    if (EndsWith(path, kGitSuffix)) {
        path.resize(path.length() - kGitSuffix.length());
    }
    return kHTTPSPrefix + path;
}

std::string ProjectNameFromUrl(const std::string& url) {
    std::vector<std::string> comps = split(SSH2HTTPS(url), "/");
    if (comps.empty()) {
        return "";
    }
    std::string name = comps[comps.size() - 1];
    if (EndsWith(name, kGitSuffix)) {
        name.resize(name.length() - kGitSuffix.length());
    }
    return name;
}

Repository::Repository(const std::string& path) : path_(path) {
    _CHECK_GIT2(git_repository_open(&repo_, path_.c_str()),
                "Failed to open repository at " + path_);
}

Repository::~Repository() {
    if (repo_) {
        git_repository_free(repo_);
    }
}

std::vector<std::string> Repository::ListTags() const {
    git_strarray tags = {};
    _CHECK_GIT2(git_tag_list(&tags, repo_), "Failed to list tags");
    UniqueStrarray guard(&tags);

    std::vector<std::string> names;
    names.reserve(tags.count);
    for (size_t i = 0; i < tags.count; ++i) {
        names.emplace_back(tags.strings[i]);
    }

    spdlog::debug("Found {} tags in {}", names.size(), path_);
    return names;
}

std::string Repository::ProjectName() const {
    git_remote* remote_raw = nullptr;
    int e = git_remote_lookup(&remote_raw, repo_, "origin");
    UniqueRemote remote(remote_raw);
    if (e == 0) {
        const char* url = git_remote_url(remote.get());
        if (url) {
            return ProjectNameFromUrl(url);
        }
    } else if (e != GIT_ENOTFOUND) {
        _CHECK_GIT2(e, "Failed to look up remote origin");
    }

    const char* workdir = git_repository_workdir(repo_);
    std::string dir = workdir ? workdir : git_repository_path(repo_);
    spdlog::debug("No origin remote, deriving project name from {}", dir);
    return ProjectNameFromUrl(dir);
}
