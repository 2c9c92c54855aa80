/*
 * InitSequence.h
 *
 * Purpose:
 *   Ordered, resumable initialization with a single ready gate.
 *   Each step reports Pending (try again next frame), Done (move on) or Failed (stop for good).
 *
 * Usage:
 *   - addStep() in execution order during setup.
 *   - advance() once per frame; it runs consecutive steps until one is Pending or Failed.
 *   - ready() becomes true only after every step returned Done.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

enum class StepStatus {
    Pending,
    Done,
    Failed
};

class InitSequence {
public:
    using Step = std::function<StepStatus()>;

    void addStep(std::string name, Step step);

    // Runs steps from the current position. Returns the status of the last step run.
    StepStatus advance();

    bool ready() const { return !m_failed && !m_steps.empty() && m_next == m_steps.size(); }
    bool failed() const { return m_failed; }

    std::size_t completedSteps() const { return m_next; }
    std::size_t stepCount() const { return m_steps.size(); }

    // Name of the step that will run next (or that failed); empty when ready.
    std::string currentStep() const;

private:
    struct Entry {
        std::string name;
        Step run;
    };

    std::vector<Entry> m_steps;
    std::size_t m_next = 0;
    bool m_failed = false;
};
