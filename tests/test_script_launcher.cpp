#include <gtest/gtest.h>
#include <managers/script_launcher.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ScriptLauncherTest : public ::testing::Test {
protected:
    fs::path test_dir;
    InterpreterConfig interps;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("jobcast_launcher_test_" + generate_uuid());
        fs::create_directories(test_dir);
        interps.shell = "/bin/sh";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_script(const std::string& name, const std::string& content) {
        auto full = test_dir / name;
        std::ofstream(full) << content;
        return full.string();
    }

    static std::string read_all(platform::ProcessHandle& proc) {
        std::string out, chunk;
        while (proc.read_output(chunk)) out += chunk;
        return out;
    }
};

TEST(ResolveInterpreterTest, PicksBySuffix) {
    InterpreterConfig interps;
    interps.python = "python3";
    interps.shell = "/bin/bash";

    auto py = resolve_interpreter("/s/a.py", interps);
    ASSERT_TRUE(py.is_ok());
    ASSERT_EQ(py.value.size(), 2u);
    EXPECT_EQ(py.value[0], "python3");
    EXPECT_EQ(py.value[1], "/s/a.py");

    auto sh = resolve_interpreter("/s/b.sh", interps);
    ASSERT_TRUE(sh.is_ok());
    EXPECT_EQ(sh.value[0], "/bin/bash");
}

TEST(ResolveInterpreterTest, RejectsOtherSuffixes) {
    InterpreterConfig interps;
    EXPECT_TRUE(resolve_interpreter("/s/notes.txt", interps).is_err());
    EXPECT_TRUE(resolve_interpreter("/s/run", interps).is_err());
    EXPECT_TRUE(resolve_interpreter("/s/x.PY", interps).is_err());
}

TEST(JoinInputPayloadTest, NewlineAfterEachValue) {
    EXPECT_EQ(join_input_payload({}), "");
    EXPECT_EQ(join_input_payload({"alice"}), "alice\n");
    EXPECT_EQ(join_input_payload({"alice", "3"}), "alice\n3\n");
    EXPECT_EQ(join_input_payload({""}), "\n");
}

TEST_F(ScriptLauncherTest, DeliversInputsOnStdin) {
    auto script = write_script("greet.sh",
        "read name\nread count\necho \"hello $name x$count\"\n");
    ScriptLauncher launcher(interps);

    auto proc = launcher.launch(script, {}, std::nullopt, {"alice", "3"});
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    EXPECT_EQ(read_all(proc.value), "hello alice x3\n");
    EXPECT_EQ(proc.value.wait(), 0);
}

TEST_F(ScriptLauncherTest, ExtraReadsSeeEndOfInput) {
    auto script = write_script("eof.sh",
        "read a\nif read b; then echo \"more $b\"; else echo \"eof after $a\"; fi\n");
    ScriptLauncher launcher(interps);

    auto proc = launcher.launch(script, {}, std::nullopt, {"one"});
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    EXPECT_EQ(read_all(proc.value), "eof after one\n");
    EXPECT_EQ(proc.value.wait(), 0);
}

TEST_F(ScriptLauncherTest, PassesArgsAndWorkingDir) {
    auto script = write_script("where.sh", "echo \"$1 $2\"\npwd\n");
    fs::path work = test_dir / "work";
    fs::create_directories(work);
    ScriptLauncher launcher(interps);

    auto proc = launcher.launch(script, {"a", "b c"}, work.string(), {});
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    std::string out = read_all(proc.value);
    EXPECT_EQ(proc.value.wait(), 0);

    auto nl = out.find('\n');
    ASSERT_NE(nl, std::string::npos);
    EXPECT_EQ(out.substr(0, nl), "a b c");
    std::string pwd = out.substr(nl + 1);
    trim(pwd);
    EXPECT_EQ(fs::canonical(pwd), fs::canonical(work));
}

TEST_F(ScriptLauncherTest, MergesStderrAndReportsExitCode) {
    auto script = write_script("fail.sh", "echo out\necho err 1>&2\nexit 4\n");
    ScriptLauncher launcher(interps);

    auto proc = launcher.launch(script, {}, std::nullopt, {});
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    std::string out = read_all(proc.value);
    EXPECT_NE(out.find("out\n"), std::string::npos);
    EXPECT_NE(out.find("err\n"), std::string::npos);
    EXPECT_EQ(proc.value.wait(), 4);
}

TEST_F(ScriptLauncherTest, ScriptIgnoringLargeInputStillCompletes) {
    auto script = write_script("quick.sh", "echo bye\nexit 0\n");
    ScriptLauncher launcher(interps);

    std::vector<std::string> big(20000, std::string(20, 'x'));
    auto proc = launcher.launch(script, {}, std::nullopt, big);
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    EXPECT_EQ(read_all(proc.value), "bye\n");
    EXPECT_EQ(proc.value.wait(), 0);
}

TEST_F(ScriptLauncherTest, MissingInterpreterExits127) {
    interps.shell = (test_dir / "no-such-shell").string();
    auto script = write_script("x.sh", "echo hi\n");
    ScriptLauncher launcher(interps);

    auto proc = launcher.launch(script, {}, std::nullopt, {});
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    std::string out = read_all(proc.value);
    EXPECT_FALSE(out.empty());
    EXPECT_EQ(proc.value.wait(), 127);
}

TEST_F(ScriptLauncherTest, SignalDeathMapsTo128PlusSigno) {
    auto script = write_script("killself.sh", "kill -9 $$\n");
    ScriptLauncher launcher(interps);

    auto proc = launcher.launch(script, {}, std::nullopt, {});
    ASSERT_TRUE(proc.is_ok()) << proc.error;
    read_all(proc.value);
    EXPECT_EQ(proc.value.wait(), 128 + 9);
}
