#ifndef RELVER_REPOSITORY_H_
#define RELVER_REPOSITORY_H_

#include <string>
#include <vector>

#include <git2.h>

const std::string kSSHPrefix = "git@github.com:";
const std::string kGitSuffix = ".git";
const std::string kHTTPSPrefix = "https://github.com/";

// Short project name ("owner/name.git" -> "name") of a remote URL or an
// "owner/name" repository slug.
std::string ProjectNameFromUrl(const std::string& url);

std::string SSH2HTTPS(const std::string& url);

class Repository {
   public:
    explicit Repository(const std::string& path);
    ~Repository();

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    std::vector<std::string> ListTags() const;

    // Derived from the "origin" remote, or the working directory name when
    // there is none.
    std::string ProjectName() const;

   private:
    std::string path_;
    git_repository* repo_ = nullptr;
};

#endif  // RELVER_REPOSITORY_H_
