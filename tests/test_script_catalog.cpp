#include <gtest/gtest.h>
#include <managers/script_catalog.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fstream>

class ScriptCatalogTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path scripts_dir;
    fs::path repos_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("jobcast_catalog_test_" + generate_uuid());
        scripts_dir = test_dir / "scripts";
        repos_dir = test_dir / "repos";
        fs::create_directories(scripts_dir);
        fs::create_directories(repos_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& full, const std::string& content = "") {
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }
};

TEST_F(ScriptCatalogTest, ListsRunnableScripts) {
    write_file(scripts_dir / "b.sh");
    write_file(scripts_dir / "a.py");
    write_file(scripts_dir / "_helper.py");
    write_file(scripts_dir / "readme.txt");
    fs::create_directories(scripts_dir / "sub.py");

    ScriptCatalog catalog(scripts_dir, repos_dir);
    EXPECT_EQ(catalog.list_scripts(), (std::vector<std::string>{"a.py", "b.sh"}));
}

TEST_F(ScriptCatalogTest, MissingDirectoryListsNothing) {
    ScriptCatalog catalog(test_dir / "absent", test_dir / "absent2");
    EXPECT_TRUE(catalog.list_scripts().empty());
    EXPECT_TRUE(catalog.list_repos().empty());
}

TEST_F(ScriptCatalogTest, ResolvesExistingScript) {
    write_file(scripts_dir / "hello.py", "print('hi')\n");
    ScriptCatalog catalog(scripts_dir, repos_dir);

    auto p = catalog.resolve_script("hello.py");
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_EQ(p.value, fs::canonical(scripts_dir / "hello.py"));
}

TEST_F(ScriptCatalogTest, RejectsUnsafeOrMissingNames) {
    write_file(test_dir / "outside.py");
    write_file(scripts_dir / "notes.txt");
    ScriptCatalog catalog(scripts_dir, repos_dir);

    EXPECT_EQ(catalog.resolve_script("missing.py").error, "script not found");
    EXPECT_TRUE(catalog.resolve_script("../outside.py").is_err());
    EXPECT_TRUE(catalog.resolve_script("/etc/passwd").is_err());
    EXPECT_TRUE(catalog.resolve_script("notes.txt").is_err());
    EXPECT_TRUE(catalog.resolve_script("").is_err());
    EXPECT_TRUE(catalog.resolve_script("a b.py").is_err());
}

TEST_F(ScriptCatalogTest, RejectsSymlinkEscape) {
    write_file(test_dir / "outside.sh", "echo no\n");
    fs::create_symlink(test_dir / "outside.sh", scripts_dir / "link.sh");
    ScriptCatalog catalog(scripts_dir, repos_dir);
    EXPECT_TRUE(catalog.resolve_script("link.sh").is_err());
}

TEST_F(ScriptCatalogTest, SafeNamePattern) {
    EXPECT_TRUE(ScriptCatalog::is_safe_script_name("train-v2.py"));
    EXPECT_TRUE(ScriptCatalog::is_safe_script_name("setup_env.sh"));
    EXPECT_FALSE(ScriptCatalog::is_safe_script_name("dir/x.py"));
    EXPECT_FALSE(ScriptCatalog::is_safe_script_name("x.pyc"));
    EXPECT_FALSE(ScriptCatalog::is_safe_script_name("x;rm.sh "));
}

TEST_F(ScriptCatalogTest, ListsAndResolvesRepos) {
    fs::create_directories(repos_dir / "repo-0123abcd");
    fs::create_directories(repos_dir / "repo-XYZ");
    fs::create_directories(repos_dir / "other");
    ScriptCatalog catalog(scripts_dir, repos_dir);

    EXPECT_EQ(catalog.list_repos(), (std::vector<std::string>{"repo-0123abcd"}));
    EXPECT_TRUE(catalog.resolve_repo("repo-0123abcd").is_ok());
    EXPECT_EQ(catalog.resolve_repo("repo-ffffffff").error, "repo not found");
    EXPECT_TRUE(catalog.resolve_repo("../scripts").is_err());
}

TEST_F(ScriptCatalogTest, ListsRepoFiles) {
    fs::path repo = repos_dir / "repo-0123abcd";
    write_file(repo / "main.py");
    write_file(repo / "tools" / "build.sh");
    write_file(repo / "tools" / "data.csv");
    write_file(repo / ".hidden.py");
    ScriptCatalog catalog(scripts_dir, repos_dir);

    auto files = catalog.list_repo_files("repo-0123abcd");
    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(files.value, (std::vector<std::string>{"main.py", "tools/build.sh"}));
    EXPECT_TRUE(catalog.list_repo_files("repo-deadbeef").is_err());
}

TEST_F(ScriptCatalogTest, UnreadableSubdirectoryDoesNotHideOthers) {
    fs::path repo = repos_dir / "repo-0123abcd";
    write_file(repo / "main.py");
    write_file(repo / "b_locked" / "inner.sh");
    write_file(repo / "c_tools" / "run.sh");
    write_file(repo / "d_more" / "deep" / "x.py");
    fs::permissions(repo / "b_locked", fs::perms::none);

    ScriptCatalog catalog(scripts_dir, repos_dir);
    auto files = catalog.list_repo_files("repo-0123abcd");
    fs::permissions(repo / "b_locked", fs::perms::owner_all);

    ASSERT_TRUE(files.is_ok());
    auto has = [&files](const std::string& rel) {
        return std::find(files.value.begin(), files.value.end(), rel) != files.value.end();
    };
    EXPECT_TRUE(has("main.py"));
    EXPECT_TRUE(has("c_tools/run.sh"));
    EXPECT_TRUE(has("d_more/deep/x.py"));
}

TEST_F(ScriptCatalogTest, RepoFileResolutionStaysInside) {
    fs::path repo = repos_dir / "repo-0123abcd";
    write_file(repo / "tools" / "build.sh");
    write_file(scripts_dir / "x.sh");
    ScriptCatalog catalog(scripts_dir, repos_dir);

    EXPECT_TRUE(catalog.resolve_repo_file("repo-0123abcd", "tools/build.sh").is_ok());
    EXPECT_TRUE(catalog.resolve_repo_file("repo-0123abcd", "../../scripts/x.sh").is_err());
    EXPECT_TRUE(catalog.resolve_repo_file("repo-0123abcd", "/etc/passwd").is_err());
    EXPECT_TRUE(catalog.resolve_repo_file("repo-0123abcd", "").is_err());
    EXPECT_EQ(catalog.resolve_repo_file("repo-0123abcd", "missing.py").error,
              "repo file not found");
}

TEST_F(ScriptCatalogTest, BuildsRunRequests) {
    write_file(scripts_dir / "hello.py");
    write_file(repos_dir / "repo-0123abcd" / "tools" / "build.sh");
    ScriptCatalog catalog(scripts_dir, repos_dir);

    auto local = make_script_request(catalog, "hello.py", {"a"});
    ASSERT_TRUE(local.is_ok());
    EXPECT_EQ(local.value.script_ref, "hello.py");
    EXPECT_FALSE(local.value.working_dir.has_value());
    EXPECT_EQ(local.value.input_vars, (std::vector<std::string>{"a"}));

    auto repo = make_repo_request(catalog, "repo-0123abcd", "tools/build.sh", {});
    ASSERT_TRUE(repo.is_ok());
    EXPECT_EQ(repo.value.script_ref, "repo-0123abcd:tools/build.sh");
    ASSERT_TRUE(repo.value.working_dir.has_value());
    EXPECT_EQ(fs::path(*repo.value.working_dir), fs::canonical(repos_dir / "repo-0123abcd"));

    EXPECT_TRUE(make_script_request(catalog, "nope.py", {}).is_err());
}
