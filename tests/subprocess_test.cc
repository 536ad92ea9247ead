#include "pngshot/subprocess.h"

#include <gtest/gtest.h>

#include <string>

namespace pngshot {
namespace {

    TEST(Subprocess, CapturesOutputAndExitCode)
    {
        ProcessOptions options;
        options.executable = "/bin/sh";
        options.args = { "-c", "printf 'out\\n'; printf 'err\\n' >&2; exit 3" };

        const ProcessResult r = run_process(options);
        ASSERT_EQ(r.status, ProcessStatus::Ok);
        EXPECT_EQ(r.exit_code, 3);
        EXPECT_EQ(r.stdout_text, "out\n");
        EXPECT_EQ(r.stderr_text, "err\n");
    }


    TEST(Subprocess, ArgumentsAreNotShellExpanded)
    {
        ProcessOptions options;
        options.executable = "/bin/sh";
        options.args = { "-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME",
                         "*" };

        const ProcessResult r = run_process(options);
        ASSERT_EQ(r.status, ProcessStatus::Ok);
        EXPECT_EQ(r.exit_code, 0);
        EXPECT_EQ(r.stdout_text, "a b|$HOME|*|");
    }


    TEST(Subprocess, LargeOutputDoesNotDeadlock)
    {
        ProcessOptions options;
        options.executable = "/bin/sh";
        options.args       = { "-c",
                               "i=0; while [ $i -lt 4000 ]; do "
                               "echo 0123456789012345678901234567890123456789; "
                               "echo 0123456789012345678901234567890123456789 >&2; "
                               "i=$((i+1)); done" };

        const ProcessResult r = run_process(options);
        ASSERT_EQ(r.status, ProcessStatus::Ok);
        EXPECT_EQ(r.exit_code, 0);
        EXPECT_EQ(r.stdout_text.size(), 4000U * 41U);
        EXPECT_EQ(r.stderr_text.size(), 4000U * 41U);
    }


    TEST(Subprocess, NonZeroExit)
    {
        ProcessOptions options;
        options.executable = "false";
        const ProcessResult r = run_process(options);
        ASSERT_EQ(r.status, ProcessStatus::Ok);
        EXPECT_NE(r.exit_code, 0);
    }


    TEST(Subprocess, MissingExecutable)
    {
        ProcessOptions options;
        options.executable = "pngshot-no-such-program-7f3a";
        const ProcessResult r = run_process(options);
        EXPECT_EQ(r.status, ProcessStatus::NotFound);
        EXPECT_STREQ(process_status_name(r.status), "not_found");
    }


    TEST(Subprocess, Signaled)
    {
        ProcessOptions options;
        options.executable = "/bin/sh";
        options.args       = { "-c", "kill -TERM $$" };
        const ProcessResult r = run_process(options);
        EXPECT_EQ(r.status, ProcessStatus::Signaled);
        EXPECT_EQ(r.exit_code, 128 + 15);
    }

}  // namespace
}  // namespace pngshot
