// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_inotify_notifier.cpp
 * @brief Tests of InotifyChangeNotifier against a real directory
 *
 * Verifies the event mapping, the kind/path filter (events for sibling files
 * and kinds outside the filter are discarded), timeouts and cancellation.
 */

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <thread>
#include <catch2/catch_test_macros.hpp>
#include "ftail-internal/Exception.hpp"
#include "ftail-internal/InotifyChangeNotifier.hpp"
#include "ftail-internal/PathUtils.hpp"
#include "Utils.hpp"

using namespace ftail::lib;
using namespace std::chrono_literals;

namespace
{
    constexpr auto const WAIT = Duration{2'000'000'000LL};
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Create and write events for the watched path", "[inotify]")
{
    auto const target = makeTargetPath(directory / "target.bin");
    auto notifier = InotifyChangeNotifier{};
    notifier.watch(directory);

    ftail::tests::writeFile(directory / "sibling.bin", "noise");
    ftail::tests::writeFile(target, "signal");

    auto const created = notifier.waitForChange(ChangeKind::Create, target, WAIT);
    REQUIRE(created.status == WaitStatus::Event);
    REQUIRE(created.kinds == ChangeMask{ChangeKind::Create});

    auto const written = notifier.waitForChange(ChangeKind::Write, target, WAIT);
    REQUIRE(written.status == WaitStatus::Event);
    REQUIRE(written.kinds == ChangeMask{ChangeKind::Write});

    // Only sibling events are left, if anything.
    auto const nothing = notifier.waitForChange(ChangeKind::Create | ChangeKind::Write, target, Duration{50'000'000LL});
    REQUIRE(nothing.status == WaitStatus::Timeout);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Remove and rename events", "[inotify]")
{
    auto const target = makeTargetPath(directory / "target.bin");
    auto const renamed = makeTargetPath(directory / "target.bin.1");
    ftail::tests::writeFile(target, "data");

    auto notifier = InotifyChangeNotifier{};
    notifier.watch(directory);

    std::filesystem::rename(target, renamed);
    auto const moved = notifier.waitForChange(ChangeKind::Rename, target, WAIT);
    REQUIRE(moved.status == WaitStatus::Event);
    REQUIRE(moved.kinds.has(ChangeKind::Rename));

    // The new name was reported as a creation; the Remove filter skips it.
    std::filesystem::remove(renamed);
    auto const removed = notifier.waitForChange(ChangeKind::Remove, renamed, WAIT);
    REQUIRE(removed.status == WaitStatus::Event);
    REQUIRE(removed.kinds == ChangeMask{ChangeKind::Remove});
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Attribute changes are reported", "[inotify]")
{
    auto const target = makeTargetPath(directory / "target.bin");
    ftail::tests::writeFile(target, "data");

    auto notifier = InotifyChangeNotifier{};
    notifier.watch(directory);

    std::filesystem::permissions(target, std::filesystem::perms::owner_read, std::filesystem::perm_options::replace);
    auto const result = notifier.waitForChange(ChangeKind::AttributeChange, target, WAIT);
    REQUIRE(result.status == WaitStatus::Event);
    REQUIRE(result.kinds == ChangeMask{ChangeKind::AttributeChange});
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Relative paths match relative targets", "[inotify]")
{
    auto const previous = std::filesystem::current_path();
    std::filesystem::current_path(directory);

    auto notifier = InotifyChangeNotifier{};
    notifier.watch(makeWatchDirectory("relative.bin"));
    ftail::tests::writeFile("relative.bin", "x");
    auto const result = notifier.waitForChange(ChangeKind::Create, makeTargetPath("./relative.bin"), WAIT);

    std::filesystem::current_path(previous);
    REQUIRE(result.status == WaitStatus::Event);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Waiting times out", "[inotify]")
{
    auto notifier = InotifyChangeNotifier{};
    notifier.watch(directory);

    auto const timeout = Duration{100'000'000LL};
    auto const start = currentTime(Clock::Monotonic);
    auto const result = notifier.waitForChange(ChangeKind::Create, directory / "never.bin", timeout);
    REQUIRE(result.status == WaitStatus::Timeout);
    REQUIRE((currentTime(Clock::Monotonic) - start) >= timeout);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Cancellation", "[inotify]")
{
    auto notifier = InotifyChangeNotifier{};
    notifier.watch(directory);
    auto const target = directory / "never.bin";

    SECTION("is latched until the next wait")
    {
        notifier.cancel();
        notifier.cancel();
        REQUIRE(notifier.waitForChange(ChangeKind::Create, target, WAIT).status == WaitStatus::Cancelled);
        // Consumed by the previous wait.
        REQUIRE(notifier.waitForChange(ChangeKind::Create, target, Duration{10'000'000LL}).status == WaitStatus::Timeout);
    }

    SECTION("wakes up a blocked wait")
    {
        auto canceller = std::thread{[&]
            {
                std::this_thread::sleep_for(100ms);
                notifier.cancel();
            }};

        auto const result = notifier.waitForChange(ChangeKind::Create, target, Duration{});
        canceller.join();
        REQUIRE(result.status == WaitStatus::Cancelled);
    }

    SECTION("wakes up a wait with the largest timeout")
    {
        auto canceller = std::thread{[&]
            {
                std::this_thread::sleep_for(100ms);
                notifier.cancel();
            }};

        auto const start = currentTime(Clock::Monotonic);
        auto const result = notifier.waitForChange(ChangeKind::Create, target, Duration{std::numeric_limits<std::int64_t>::max()});
        auto const elapsed = currentTime(Clock::Monotonic) - start;
        canceller.join();
        REQUIRE(result.status == WaitStatus::Cancelled);
        REQUIRE(elapsed >= Duration{50'000'000LL});
    }
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "A removed watch fails every later wait", "[inotify]")
{
    auto const watched = directory / "watched";
    std::filesystem::create_directory(watched);
    auto const target = makeTargetPath(watched / "target.bin");

    auto notifier = InotifyChangeNotifier{};
    notifier.watch(watched);
    std::filesystem::remove(watched);

    auto const first = notifier.waitForChange(ChangeKind::Create, target, WAIT);
    REQUIRE(first.status == WaitStatus::Error);
    REQUIRE(first.error == ENOENT);

    // Nothing can arrive any more: later waits fail without blocking.
    auto const start = currentTime(Clock::Monotonic);
    auto const second = notifier.waitForChange(ChangeKind::Create, target, Duration{});
    REQUIRE(second.status == WaitStatus::Error);
    REQUIRE(second.error == ENOENT);
    REQUIRE((currentTime(Clock::Monotonic) - start) <= WAIT);

    // A new watch clears the error.
    notifier.watch(directory);
    auto const third = notifier.waitForChange(ChangeKind::Create, target, Duration{10'000'000LL});
    REQUIRE(third.status == WaitStatus::Timeout);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Setup and closed notifier", "[inotify]")
{
    auto notifier = InotifyChangeNotifier{};

    try
    {
        notifier.watch(directory / "missing-directory");
        FAIL("Watching a missing directory must fail");
    }
    catch (SystemException const& e)
    {
        REQUIRE(e.status() == FTAIL_ERR_SETUP);
        REQUIRE(e.error() == ENOENT);
    }

    notifier.watch(directory);
    notifier.close();
    notifier.close();

    auto const result = notifier.waitForChange(ChangeKind::Create, directory / "x", WAIT);
    REQUIRE(result.status == WaitStatus::Error);
    REQUIRE(result.error == EBADF);

    REQUIRE_THROWS_AS(notifier.watch(directory), Exception);
}
