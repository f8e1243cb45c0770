#include "core/process_executor.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace pdfshrink {
namespace {

TEST(PosixProcessExecutor, ZeroExitIsSuccess) {
    PosixProcessExecutor executor;
    ExecResult r = executor.run({"/bin/sh", "-c", "exit 0"});
    EXPECT_TRUE(r.spawned);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.success());
}

TEST(PosixProcessExecutor, ReportsExitCode) {
    PosixProcessExecutor executor;
    ExecResult r = executor.run({"/bin/sh", "-c", "exit 3"});
    EXPECT_TRUE(r.spawned);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.term_signal, 0);
    EXPECT_FALSE(r.success());
}

TEST(PosixProcessExecutor, ArgumentsBypassTheShell) {
    PosixProcessExecutor executor;
    // $1 is the literal argument, not expanded or split
    ExecResult r = executor.run({"/bin/sh", "-c", "test \"$1\" = 'a b;$HOME'", "sh", "a b;$HOME"});
    EXPECT_TRUE(r.success());
}

TEST(PosixProcessExecutor, SearchesPath) {
    PosixProcessExecutor executor;
    EXPECT_TRUE(executor.run({"sh", "-c", "true"}).success());
}

TEST(PosixProcessExecutor, MissingProgramIsSpawnFailure) {
    PosixProcessExecutor executor;
    ExecResult r = executor.run({"/nonexistent/pdfshrink-engine", "-q"});
    EXPECT_FALSE(r.spawned);
    EXPECT_FALSE(r.success());
    EXPECT_FALSE(r.error.empty());
}

TEST(PosixProcessExecutor, EmptyCommandIsSpawnFailure) {
    PosixProcessExecutor executor;
    EXPECT_FALSE(executor.run({}).spawned);
    EXPECT_FALSE(executor.run({""}).spawned);
}

TEST(PosixProcessExecutor, SignalIsReportedAsFailure) {
    PosixProcessExecutor executor;
    ExecResult r = executor.run({"/bin/sh", "-c", "kill -TERM $$"});
    EXPECT_TRUE(r.spawned);
    EXPECT_EQ(r.term_signal, SIGTERM);
    EXPECT_EQ(r.exit_code, 128 + SIGTERM);
    EXPECT_FALSE(r.success());
}

}  // namespace
}  // namespace pdfshrink
