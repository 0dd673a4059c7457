// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <filesystem>
#include <functional>
#include <vector>
#include "ftail-internal/ChangeNotifier.hpp"

namespace ftail::tests
{
    //
    // A ChangeNotifier that replays a script instead of watching the filesystem.
    //
    // Each call to waitForChange() consumes the next step: the step's action
    // runs first (typically modifying the tailed file), then its result is
    // returned.  An exhausted script times out.  Calls are recorded so tests
    // can check what the reader waited for.
    //
    class SyntheticChangeNotifier : public ftail::lib::ChangeNotifier
    {
    public:
        struct Step
        {
            std::function<void()> action;
            ftail::lib::WaitResult result;
        };

        struct Call
        {
            ftail::lib::ChangeMask kinds;
            std::filesystem::path path;
            ftail::lib::Duration timeout;
        };

        /// Shared view on the notifier, kept by the test after the reader took ownership.
        struct State
        {
            std::deque<Step> script;
            std::vector<Call> calls;
            std::filesystem::path watchedDirectory;
            bool failWatch{false};
            bool cancelled{false};
            bool closed{false};
        };

        explicit SyntheticChangeNotifier(State& state);

        void watch(std::filesystem::path const& directory) override;
        ftail::lib::WaitResult waitForChange(ftail::lib::ChangeMask kinds, std::filesystem::path const& path, ftail::lib::Duration timeout) override;
        void cancel() noexcept override;
        void close() noexcept override;

    private:
        State& _state;
    };

    // Script helpers
    SyntheticChangeNotifier::Step event(ftail::lib::ChangeMask kinds, std::function<void()> action = {});
    SyntheticChangeNotifier::Step timeout();
    SyntheticChangeNotifier::Step failure(int error);
}
