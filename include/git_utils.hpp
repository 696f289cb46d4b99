#pragma once

#include <git2.h>
#include <string>
#include <vector>
#include <utility>

// Owns libgit2 initialisation and the repository handle for the current directory.
class GitRepository {
public:
    GitRepository();
    ~GitRepository();

    GitRepository(const GitRepository&) = delete;
    GitRepository& operator=(const GitRepository&) = delete;

    bool is_open() const { return repo_ != nullptr; }
    git_repository* get();
    std::string get_repo_root() const;

private:
    git_repository* repo_;
};

class GitUtils {
public:
    explicit GitUtils(GitRepository& repo);

    bool has_staged_changes();
    // Returns {short hash, summary line}.
    std::pair<std::string, std::string> commit_with_output(const std::string& message);
    // Newest first. An empty range walks everything reachable from HEAD.
    std::vector<std::string> get_commit_messages(const std::string& rev_range = "");

private:
    GitRepository& repo_;
};
