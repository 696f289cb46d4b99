#include "git_utils.hpp"
#include <memory>
#include <stdexcept>

namespace {

template <typename T>
using GitHandle = std::unique_ptr<T, void (*)(T*)>;

std::string last_error(const std::string& what) {
    const git_error* err = git_error_last();
    if (err && err->message) {
        return what + ": " + err->message;
    }
    return what;
}

GitHandle<git_index> open_index(git_repository* repo) {
    git_index* index = nullptr;
    if (git_repository_index(&index, repo) != 0) {
        throw std::runtime_error(last_error("Failed to read index"));
    }
    return GitHandle<git_index>(index, git_index_free);
}

// Null on an unborn branch, i.e. before the first commit.
GitHandle<git_commit> head_commit(git_repository* repo) {
    int unborn = git_repository_head_unborn(repo);
    if (unborn < 0) {
        throw std::runtime_error(last_error("Failed to resolve HEAD"));
    }
    if (unborn == 1) {
        return GitHandle<git_commit>(nullptr, git_commit_free);
    }

    git_reference* head_ref = nullptr;
    if (git_repository_head(&head_ref, repo) != 0) {
        throw std::runtime_error(last_error("Failed to resolve HEAD"));
    }
    GitHandle<git_reference> head(head_ref, git_reference_free);

    git_object* peeled = nullptr;
    if (git_reference_peel(&peeled, head.get(), GIT_OBJECT_COMMIT) != 0) {
        throw std::runtime_error(last_error("HEAD does not point to a commit"));
    }
    return GitHandle<git_commit>(reinterpret_cast<git_commit*>(peeled), git_commit_free);
}

}

GitRepository::GitRepository() : repo_(nullptr) {
    git_libgit2_init();
    if (git_repository_open_ext(&repo_, ".", 0, nullptr) != 0) {
        repo_ = nullptr;
    }
}

GitRepository::~GitRepository() {
    if (repo_) {
        git_repository_free(repo_);
    }
    git_libgit2_shutdown();
}

git_repository* GitRepository::get() {
    if (!repo_) {
        throw std::runtime_error("Not in a git repository");
    }
    return repo_;
}

std::string GitRepository::get_repo_root() const {
    if (!repo_) return "";
    const char* workdir = git_repository_workdir(repo_);
    return workdir ? workdir : "";
}

GitUtils::GitUtils(GitRepository& repo) : repo_(repo) {}

bool GitUtils::has_staged_changes() {
    git_repository* repo = repo_.get();
    auto index = open_index(repo);
    auto parent = head_commit(repo);

    git_tree* tree = nullptr;
    if (parent && git_commit_tree(&tree, parent.get()) != 0) {
        throw std::runtime_error(last_error("Failed to read HEAD tree"));
    }
    GitHandle<git_tree> head_tree(tree, git_tree_free);

    git_diff* diff = nullptr;
    if (git_diff_tree_to_index(&diff, repo, head_tree.get(), index.get(), nullptr) != 0) {
        throw std::runtime_error(last_error("Failed to create diff"));
    }
    GitHandle<git_diff> staged(diff, git_diff_free);
    return git_diff_num_deltas(staged.get()) > 0;
}

std::pair<std::string, std::string> GitUtils::commit_with_output(const std::string& message) {
    git_repository* repo = repo_.get();
    auto index = open_index(repo);

    git_oid tree_oid;
    if (git_index_write_tree(&tree_oid, index.get()) != 0) {
        throw std::runtime_error(last_error("Failed to write tree"));
    }
    git_tree* tree_ptr = nullptr;
    if (git_tree_lookup(&tree_ptr, repo, &tree_oid) != 0) {
        throw std::runtime_error(last_error("Failed to look up tree"));
    }
    GitHandle<git_tree> tree(tree_ptr, git_tree_free);

    auto parent = head_commit(repo);
    const git_commit* parents[] = {parent.get()};
    size_t parent_count = parent ? 1 : 0;

    git_signature* author_ptr = nullptr;
    if (git_signature_default(&author_ptr, repo) != 0) {
        throw std::runtime_error(last_error("No author configured (set user.name and user.email)"));
    }
    GitHandle<git_signature> author(author_ptr, git_signature_free);

    git_oid commit_oid;
    if (git_commit_create(&commit_oid, repo, "HEAD", author.get(), author.get(), "UTF-8",
                          message.c_str(), tree.get(), parent_count, parents) != 0) {
        throw std::runtime_error(last_error("Git commit failed"));
    }

    char hash_str[8];
    git_oid_tostr(hash_str, sizeof(hash_str), &commit_oid);
    std::string summary = message.substr(0, message.find('\n'));
    return {hash_str, summary};
}

std::vector<std::string> GitUtils::get_commit_messages(const std::string& rev_range) {
    git_repository* repo = repo_.get();

    git_revwalk* walk_ptr = nullptr;
    if (git_revwalk_new(&walk_ptr, repo) != 0) {
        throw std::runtime_error(last_error("Failed to create revision walker"));
    }
    GitHandle<git_revwalk> walk(walk_ptr, git_revwalk_free);
    git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME);

    int error = 0;
    if (rev_range.empty()) {
        error = git_revwalk_push_head(walk.get());
    } else if (rev_range.find("..") != std::string::npos) {
        error = git_revwalk_push_range(walk.get(), rev_range.c_str());
    } else {
        git_object* obj = nullptr;
        error = git_revparse_single(&obj, repo, rev_range.c_str());
        if (error == 0) {
            GitHandle<git_object> target(obj, git_object_free);
            error = git_revwalk_push(walk.get(), git_object_id(target.get()));
        }
    }
    if (error != 0) {
        throw std::runtime_error(last_error("Invalid revision range '" + rev_range + "'"));
    }

    std::vector<std::string> messages;
    git_oid oid;
    while (git_revwalk_next(&oid, walk.get()) == 0) {
        git_commit* commit_ptr = nullptr;
        if (git_commit_lookup(&commit_ptr, repo, &oid) != 0) {
            throw std::runtime_error(last_error("Failed to look up commit"));
        }
        GitHandle<git_commit> commit(commit_ptr, git_commit_free);
        const char* message = git_commit_message(commit.get());
        messages.push_back(message ? message : "");
    }
    return messages;
}
