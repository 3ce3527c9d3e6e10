/**
 * @file test_repository.cc
 * @brief Tag listing and project naming against a scratch git repository
 */

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <git2.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include "repository.h"

namespace fs = std::filesystem;

class RepositoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        git_libgit2_init();
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        dir_ = fs::temp_directory_path() /
               ("relver_repo_" + name + "_" + std::to_string(::getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        ASSERT_EQ(git_repository_init(&repo_, dir_.c_str(), 0), 0);
    }

    void TearDown() override
    {
        git_repository_free(repo_);
        fs::remove_all(dir_);
        git_libgit2_shutdown();
    }

    // Empty-tree commit on HEAD.
    git_oid Commit()
    {
        git_index* index = nullptr;
        EXPECT_EQ(git_repository_index(&index, repo_), 0);
        git_oid tree_id;
        EXPECT_EQ(git_index_write_tree(&tree_id, index), 0);
        git_index_free(index);

        git_tree* tree = nullptr;
        EXPECT_EQ(git_tree_lookup(&tree, repo_, &tree_id), 0);
        git_signature* sig = nullptr;
        EXPECT_EQ(git_signature_new(&sig, "relver", "relver@example.com", 1700000000, 0), 0);

        git_oid commit_id;
        EXPECT_EQ(git_commit_create_v(&commit_id, repo_, "HEAD", sig, sig, nullptr,
                                      "initial", tree, 0),
                  0);
        git_signature_free(sig);
        git_tree_free(tree);
        return commit_id;
    }

    void Tag(const std::string& name, const git_oid& target)
    {
        git_object* obj = nullptr;
        ASSERT_EQ(git_object_lookup(&obj, repo_, &target, GIT_OBJECT_COMMIT), 0);
        git_oid tag_id;
        EXPECT_EQ(git_tag_create_lightweight(&tag_id, repo_, name.c_str(), obj, 0), 0);
        git_object_free(obj);
    }

    void AddOrigin(const std::string& url)
    {
        git_remote* remote = nullptr;
        ASSERT_EQ(git_remote_create(&remote, repo_, "origin", url.c_str()), 0);
        git_remote_free(remote);
    }

    fs::path dir_;
    git_repository* repo_ = nullptr;
};

TEST_F(RepositoryTest, ListsAllTags)
{
    git_oid head = Commit();
    Tag("v1.0.0", head);
    Tag("v1.10.0", head);
    Tag("nightly", head);

    Repository repo(dir_.string());
    std::vector<std::string> tags = repo.ListTags();
    std::sort(tags.begin(), tags.end());
    EXPECT_EQ(tags, (std::vector<std::string>{"nightly", "v1.0.0", "v1.10.0"}));
}

TEST_F(RepositoryTest, NoTags)
{
    Commit();
    Repository repo(dir_.string());
    EXPECT_TRUE(repo.ListTags().empty());
}

TEST_F(RepositoryTest, ProjectNameFromOrigin)
{
    AddOrigin("git@github.com:greenbone/openvas-scanner.git");
    Repository repo(dir_.string());
    EXPECT_EQ(repo.ProjectName(), "openvas-scanner");
}

TEST_F(RepositoryTest, ProjectNameFallsBackToDirectory)
{
    Repository repo(dir_.string());
    EXPECT_EQ(repo.ProjectName(), dir_.filename().string());
}

TEST(Repository, OpenMissingPathThrows)
{
    EXPECT_THROW(Repository("/nonexistent-dir/relver-repo"), std::runtime_error);
}

TEST(ProjectNameFromUrl, RemoteAndSlugForms)
{
    EXPECT_EQ(ProjectNameFromUrl("git@github.com:greenbone/openvas-scanner.git"),
              "openvas-scanner");
    EXPECT_EQ(ProjectNameFromUrl("https://github.com/greenbone/openvas-scanner"),
              "openvas-scanner");
    EXPECT_EQ(ProjectNameFromUrl("https://gitlab.example.com/group/tool.git"), "tool");
    EXPECT_EQ(ProjectNameFromUrl("greenbone/openvas-scanner"), "openvas-scanner");
    EXPECT_EQ(ProjectNameFromUrl(""), "");
}

TEST(SSH2HTTPS, ConvertsGitHubSshUrls)
{
    EXPECT_EQ(SSH2HTTPS("git@github.com:greenbone/gvmd.git"),
              "https://github.com/greenbone/gvmd");
    EXPECT_EQ(SSH2HTTPS("https://github.com/a/b"), "https://github.com/a/b");
}
