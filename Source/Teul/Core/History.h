#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace Teul::Core
{
    // Linear snapshot history. past is oldest first, future is nearest first.
    template <typename State>
    class History
    {
    public:
        explicit History(State initialState)
            : presentState(std::move(initialState))
        {
        }

        const State& present() const noexcept
        {
            return presentState;
        }

        const std::vector<State>& past() const noexcept
        {
            return pastStates;
        }

        std::vector<State> future() const
        {
            return { futureStates.rbegin(), futureStates.rend() };
        }

        // One completed edit: the old present becomes the newest past entry.
        void apply(State next)
        {
            pastStates.push_back(std::move(presentState));
            trimPast();

            presentState = std::move(next);
            futureStates.clear();
        }

        // Updates the present without recording a snapshot.
        void replacePresent(State next)
        {
            presentState = std::move(next);
        }

        bool hasPast() const noexcept
        {
            return !pastStates.empty();
        }

        bool hasFuture() const noexcept
        {
            return !futureStates.empty();
        }

        bool undo()
        {
            if (!hasPast())
                return false;

            futureStates.push_back(std::move(presentState));
            presentState = std::move(pastStates.back());
            pastStates.pop_back();
            return true;
        }

        bool redo()
        {
            if (!hasFuture())
                return false;

            pastStates.push_back(std::move(presentState));
            trimPast();

            presentState = std::move(futureStates.back());
            futureStates.pop_back();
            return true;
        }

        void reset(State state)
        {
            presentState = std::move(state);
            clear();
        }

        void clear()
        {
            pastStates.clear();
            futureStates.clear();
        }

        void setLimit(size_t limit) noexcept
        {
            historyLimit = std::max<size_t>(1, limit);
            trimPast();
        }

        size_t getLimit() const noexcept
        {
            return historyLimit;
        }

        size_t undoDepth() const noexcept
        {
            return pastStates.size();
        }

        size_t redoDepth() const noexcept
        {
            return futureStates.size();
        }

    private:
        void trimPast()
        {
            if (pastStates.size() <= historyLimit)
                return;

            const auto overflow = pastStates.size() - historyLimit;
            pastStates.erase(pastStates.begin(), pastStates.begin() + static_cast<std::ptrdiff_t>(overflow));
        }

        State presentState;
        std::vector<State> pastStates;
        std::vector<State> futureStates;  // back() is the nearest redo target
        size_t historyLimit = 256;
    };
}
