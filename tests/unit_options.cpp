// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// unit_options.cpp
//
#undef NDEBUG

#include "options-and-output.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace replicator;

namespace
{
    class TestOptions : public OptionsAndOutput
    {
      public:
        explicit TestOptions(const std::vector<std::string> & args)
            : OptionsAndOutput(args)
        {}

        using OptionsAndOutput::options;
    };

    // every run is logfile free and silent unless it fails
    std::vector<std::string> withQuietArgs(std::vector<std::string> args)
    {
        args.insert(std::begin(args), { "--no-log", "--quiet" });
        return args;
    }

    bool isRejected(const std::vector<std::string> & args)
    {
        try
        {
            const TestOptions testOptions(withQuietArgs(args));
        }
        catch (const silent_runtime_error &)
        {
            return true;
        }

        return false;
    }

    struct Dirs
    {
        fs::path root;
        std::string src1;
        std::string src2;
        std::string dst1;
        std::string dst2;
        std::string file;
    };

    Dirs makeDirs()
    {
        Dirs dirs;
        dirs.root = fs::absolute(fs::path("unit_tmp") / "options");
        fs::remove_all(dirs.root);
        fs::create_directories(dirs.root / "photos");
        fs::create_directories(dirs.root / "music");
        fs::create_directories(dirs.root / "backup");

        std::ofstream(dirs.root / "plain.txt") << "not a directory";

        dirs.src1 = (dirs.root / "photos").string();
        dirs.src2 = (dirs.root / "music").string();
        dirs.dst1 = (dirs.root / "backup").string();
        dirs.dst2 = (dirs.root / "not_made_yet").string();
        dirs.file = (dirs.root / "plain.txt").string();
        return dirs;
    }
} // namespace

static void test_defaults()
{
    const Dirs dirs{ makeDirs() };
    const TestOptions testOptions(withQuietArgs({ dirs.src1, dirs.dst1 }));
    const Options & options{ testOptions.options() };

    assert(options.profiles.size() == 1);
    assert(options.profiles.front().name == L"photos");
    assert(options.profiles.front().source == fs::path(dirs.src1));
    assert(options.profiles.front().destination == fs::path(dirs.dst1));
    assert(options.profiles.front().source.is_absolute());

    assert(!options.dry_run);
    assert(!options.verbose);
    assert(options.quiet);
    assert(options.log_base.empty());
    assert(options.tick_period == TickDriver::default_tick_period);

    assert(options.thresholds.max_size_bytes == (10 * gibibyte));
    assert(options.thresholds.max_files == 50'000);
    assert(options.thresholds.max_depth == 5);
    assert(options.thresholds.min_size_bytes == (100 * mebibyte));

    assert(options.orchestrator.max_concurrent_jobs == 8);
    assert(options.orchestrator.max_retries == 3);
    assert(options.orchestrator.max_fatal_retries == 1);
    assert(options.orchestrator.job_timeout.count() == 0);
    assert(options.orchestrator.breaker.failure_threshold == 5);
}

static void test_every_value_option()
{
    const Dirs dirs{ makeDirs() };

    // clang-format off
    const std::vector<std::string> args{
        "--dry-run",
        "--max-size", "2G",
        "--min-size", "10m",
        "--max-files", "100",
        "--max-depth", "3",
        "--jobs", "16",
        "--retries", "5",
        "--fatal-retries", "2",
        "--retry-delay-ms", "1500",
        "--retry-backoff", "2.5",
        "--job-timeout-ms", "60000",
        "--breaker-threshold", "0",
        "--breaker-window-ms", "1000",
        "--breaker-cooldown-ms", "2000",
        "--tick-ms", "100",
        "--eta-window-ms", "5000",
        dirs.src1, dirs.dst1 };
    // clang-format on

    const TestOptions testOptions(withQuietArgs(args));

    const Options & options{ testOptions.options() };
    assert(options.dry_run);

    assert(options.thresholds.max_size_bytes == (2 * gibibyte));
    assert(options.thresholds.min_size_bytes == (10 * mebibyte));
    assert(options.thresholds.max_files == 100);
    assert(options.thresholds.max_depth == 3);

    const OrchestratorSettings & orch{ options.orchestrator };
    assert(orch.max_concurrent_jobs == 16);
    assert(orch.max_retries == 5);
    assert(orch.max_fatal_retries == 2);
    assert(orch.retry_delay == std::chrono::milliseconds(1500));
    assert(orch.retry_backoff > 2.49);
    assert(orch.retry_backoff < 2.51);
    assert(orch.job_timeout == std::chrono::seconds(60));
    assert(orch.breaker.failure_threshold == 0);
    assert(orch.breaker.window == std::chrono::seconds(1));
    assert(orch.breaker.cooldown == std::chrono::seconds(2));
    assert(orch.eta_window == std::chrono::seconds(5));
    assert(options.tick_period == std::chrono::milliseconds(100));
}

static void test_names_and_multiple_profiles()
{
    const Dirs dirs{ makeDirs() };

    const TestOptions testOptions(withQuietArgs(
        { "--name", "  holiday pics ", dirs.src1, dirs.dst1, (dirs.src2 + "/"), dirs.dst2 }));

    const Options & options{ testOptions.options() };
    assert(options.profiles.size() == 2);
    assert(options.profiles[0].name == L"holiday pics");
    assert(options.profiles[1].name == L"music");
    assert(options.profiles[1].source == fs::path(dirs.src2));
    assert(options.profiles[1].destination == fs::path(dirs.dst2));
}

static void test_verbose_wins_over_quiet()
{
    const Dirs dirs{ makeDirs() };
    const TestOptions testOptions(withQuietArgs({ "--verbose", dirs.src1, dirs.dst1 }));
    assert(testOptions.options().verbose);
    assert(!testOptions.options().quiet);
}

static void test_bad_args_are_rejected()
{
    const Dirs dirs{ makeDirs() };
    const std::string missing{ (dirs.root / "missing").string() };

    assert(isRejected({}));
    assert(isRejected({ "--help", dirs.src1, dirs.dst1 }));
    assert(isRejected({ dirs.src1 }));
    assert(isRejected({ dirs.src1, dirs.dst1, dirs.src2 }));
    assert(isRejected({ missing, dirs.dst1 }));
    assert(isRejected({ dirs.file, dirs.dst1 }));
    assert(isRejected({ dirs.src1, dirs.file }));
    assert(isRejected({ "--frobnicate", dirs.src1, dirs.dst1 }));
    assert(isRejected({ dirs.src1, dirs.dst1, "--name", "orphan" }));
    assert(isRejected({ "--name", "   ", dirs.src1, dirs.dst1 }));
    assert(isRejected({ dirs.src1, dirs.dst1, "--jobs" }));
    assert(isRejected({ "--jobs", "0", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--jobs", "65", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--jobs", "many", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--max-files", "0", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--max-size", "lots", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--retry-backoff", "0.5", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--tick-ms", "0", dirs.src1, dirs.dst1 }));
    assert(isRejected({ "--job-timeout-ms", "-5", dirs.src1, dirs.dst1 }));

    assert(!isRejected({ dirs.src1, dirs.dst1 }));
    assert(!isRejected({ "--max-depth", "0", dirs.src1, dirs.dst1 }));
}

int main()
{
    test_defaults();
    test_every_value_option();
    test_names_and_multiple_profiles();
    test_verbose_wins_over_quiet();
    test_bad_args_are_rejected();

    std::cout << "All options tests passed" << std::endl;
    return 0;
}
