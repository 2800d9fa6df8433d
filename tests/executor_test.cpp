#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "executor/executor.hpp"
#include "test_support.hpp"

namespace {

using runbox::executor::CancellationToken;
using runbox::executor::CancelledError;
using runbox::executor::ExecutionError;
using runbox::executor::RawResult;
using runbox::executor::Status;
using runbox::job::ComputeContext;
using runbox::job::Program;
using runbox::testing::ExitWith;
using runbox::testing::MakeProgram;
using runbox::testing::StubExecutor;

namespace fs = std::filesystem;

class ExecutorTest : public runbox::testing::TempRootTest {
protected:
    ComputeContext context_{"sh"};
};

std::string ReadAll(const fs::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

TEST_F(ExecutorTest, ExitCode137IsMemoryLimitExceeded) {
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(137);
    });
    const auto result = executor.Run(MakeProgram("main.sh", "exit 137"), context_);
    EXPECT_EQ(result.status, Status::kMemoryLimitExceeded);
}

TEST_F(ExecutorTest, ClassifiesEveryTableRow) {
    int next_code = 0;
    StubExecutor executor(root_, [&next_code](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(next_code);
    });
    const std::vector<std::pair<int, Status>> rows = {
        {0, Status::kOk},
        {1, Status::kRuntimeError},
        {2, Status::kOk},
        {124, Status::kTimeLimitExceeded},
        {137, Status::kMemoryLimitExceeded},
    };
    for (const auto& [code, status] : rows) {
        next_code = code;
        EXPECT_EQ(executor.Run(MakeProgram("main.sh", ""), context_).status, status) << code;
    }
}

TEST_F(ExecutorTest, StagesFilesBeforeExecutionAndRemovesThemAfter) {
    fs::path seen;
    std::string staged_entry;
    std::string staged_helper;
    fs::perms entry_perms = fs::perms::none;
    fs::perms helper_perms = fs::perms::none;
    StubExecutor executor(root_, [&](const Program&, const fs::path& cwd, const CancellationToken&) {
        seen = cwd;
        staged_entry = ReadAll(cwd / "main.sh");
        staged_helper = ReadAll(cwd / "lib" / "helper.sh");
        entry_perms = fs::status(cwd / "main.sh").permissions();
        helper_perms = fs::status(cwd / "lib" / "helper.sh").permissions();
        return ExitWith(0, "out", "err");
    });
    Program program("main.sh", {{"main.sh", "echo hi"}, {"lib/helper.sh", "true"}});
    const auto result = executor.Run(program, context_);

    EXPECT_EQ(seen.parent_path(), root_);
    EXPECT_EQ(staged_entry, "echo hi");
    EXPECT_EQ(staged_helper, "true");
    EXPECT_NE(entry_perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_NE(entry_perms & fs::perms::owner_read, fs::perms::none);
    EXPECT_NE(entry_perms & fs::perms::owner_write, fs::perms::none);
    EXPECT_EQ(helper_perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_FALSE(fs::exists(seen));
    EXPECT_EQ(result.std_out, "out");
    EXPECT_EQ(result.std_err, "err");
}

TEST_F(ExecutorTest, RemovesWorkingDirectoryWhenBackendThrows) {
    StubExecutor executor(root_, [](const Program&, const fs::path& cwd, const CancellationToken&) -> RawResult {
        EXPECT_TRUE(fs::exists(cwd / "main.sh"));
        throw ExecutionError("backend failed to launch");
    });
    EXPECT_THROW(executor.Run(MakeProgram("main.sh", "exit 0"), context_), ExecutionError);
    ASSERT_EQ(executor.SeenDirs().size(), 1u);
    EXPECT_FALSE(fs::exists(executor.SeenDirs().front()));
    EXPECT_EQ(LeftoverEntries(), 0u);
}

TEST_F(ExecutorTest, RemovesWorkingDirectoryWhenCancelledMidRun) {
    CancellationToken cancel;
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken& token) -> RawResult {
        runbox::testing::SleepUnlessCancelled(std::chrono::seconds(5), token);
        return ExitWith(0);
    });
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.Cancel();
    });
    EXPECT_THROW(executor.Run(MakeProgram("main.sh", ""), context_, cancel), CancelledError);
    canceller.join();
    EXPECT_EQ(LeftoverEntries(), 0u);
}

TEST_F(ExecutorTest, DoesNotStartWhenAlreadyCancelled) {
    CancellationToken cancel;
    cancel.Cancel();
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(0);
    });
    EXPECT_THROW(executor.Run(MakeProgram("main.sh", ""), context_, cancel), CancelledError);
    EXPECT_TRUE(executor.SeenDirs().empty());
}

TEST_F(ExecutorTest, NonzeroExitIsAStatusNotAnError) {
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(1, "", "Traceback");
    });
    const auto result = executor.Run(MakeProgram("main.sh", ""), context_);
    EXPECT_EQ(result.status, Status::kRuntimeError);
    EXPECT_EQ(result.std_err, "Traceback");
}

TEST_F(ExecutorTest, EchoesTrackingFields) {
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(0, "hello\n");
    });
    const auto result = executor.Run(MakeProgram("main.sh", "", {{"testcase_id", 42}}), context_);
    const auto json = result.ToJson();
    EXPECT_EQ(json.at("testcase_id"), 42);
    EXPECT_EQ(json.at("status"), "OK");
    EXPECT_EQ(json.at("stdout"), "hello\n");
    EXPECT_EQ(json.at("stderr"), "");
}

TEST_F(ExecutorTest, DerivedFieldsWinOverTrackingFields) {
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(124, "real out", "real err");
    });
    const auto result = executor.Run(
        MakeProgram("main.sh", "", {{"status", "OK"}, {"stdout", "fake"}, {"stderr", "fake"}, {"keep", true}}),
        context_);
    EXPECT_FALSE(result.tracking_fields.contains("status"));
    const auto json = result.ToJson();
    EXPECT_EQ(json.at("status"), "TLE");
    EXPECT_EQ(json.at("stdout"), "real out");
    EXPECT_EQ(json.at("stderr"), "real err");
    EXPECT_EQ(json.at("keep"), true);
}

TEST_F(ExecutorTest, EachRunGetsItsOwnDirectory) {
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(0);
    });
    executor.Run(MakeProgram("main.sh", ""), context_);
    executor.Run(MakeProgram("main.sh", ""), context_);
    const auto dirs = executor.SeenDirs();
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_NE(dirs[0], dirs[1]);
}

// Backend that tries to stage outside its working directory.
class EscapingExecutor : public StubExecutor {
public:
    using StubExecutor::StubExecutor;

    runbox::executor::FilesystemMapping Stage(const Program& program,
                                              const ComputeContext& context) const override {
        auto mapping = StubExecutor::Stage(program, context);
        mapping.push_back({"../outside.txt", "x", false});
        return mapping;
    }
};

TEST_F(ExecutorTest, RejectsStagingOutsideWorkingDirectory) {
    EscapingExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(0);
    });
    EXPECT_THROW(executor.Run(MakeProgram("main.sh", ""), context_), runbox::job::ConfigError);
    EXPECT_FALSE(fs::exists(root_ / "outside.txt"));
    EXPECT_TRUE(executor.SeenDirs().empty());
    EXPECT_EQ(LeftoverEntries(), 0u);
}

// Backend that stages the entrypoint a second time with other content.
class DuplicatingExecutor : public StubExecutor {
public:
    using StubExecutor::StubExecutor;

    runbox::executor::FilesystemMapping Stage(const Program& program,
                                              const ComputeContext& context) const override {
        auto mapping = StubExecutor::Stage(program, context);
        mapping.push_back({"./" + program.Entrypoint(), "overwritten", true});
        return mapping;
    }
};

TEST_F(ExecutorTest, RejectsPathStagedTwice) {
    DuplicatingExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(0);
    });
    EXPECT_THROW(executor.Run(MakeProgram("main.sh", "echo hi"), context_), runbox::job::ConfigError);
    EXPECT_TRUE(executor.SeenDirs().empty());
    EXPECT_EQ(LeftoverEntries(), 0u);
}

TEST_F(ExecutorTest, RejectsFileThatIsAlsoADirectory) {
    StubExecutor executor(root_, [](const Program&, const fs::path&, const CancellationToken&) {
        return ExitWith(0);
    });
    Program program("main.sh", {{"main.sh", ""}, {"lib", "x"}, {"lib/helper.sh", "true"}});
    EXPECT_THROW(executor.Run(program, context_), runbox::job::ConfigError);
    EXPECT_TRUE(executor.SeenDirs().empty());
}

}  // namespace
