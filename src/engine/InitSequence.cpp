/*
 * InitSequence.cpp
 *
 * Purpose:
 *   Implements the ordered initialization pump.
 */

#include "engine/InitSequence.h"

#include <iostream>
#include <utility>

void InitSequence::addStep(std::string name, Step step) {
    m_steps.push_back(Entry{std::move(name), std::move(step)});
}

StepStatus InitSequence::advance() {
    if (m_failed) return StepStatus::Failed;

    while (m_next < m_steps.size()) {
        StepStatus s = m_steps[m_next].run ? m_steps[m_next].run() : StepStatus::Failed;
        if (s == StepStatus::Pending) return s;
        if (s == StepStatus::Failed) {
            m_failed = true;
            std::cerr << "[Init] step '" << m_steps[m_next].name << "' failed\n";
            return s;
        }
        ++m_next;
    }
    return StepStatus::Done;
}

std::string InitSequence::currentStep() const {
    if (m_next < m_steps.size()) return m_steps[m_next].name;
    return {};
}
