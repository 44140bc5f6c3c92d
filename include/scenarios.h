#pragma once

#include "common.h"
#include "interruption_classifier.h"
#include <ostream>
#include <string>
#include <vector>

namespace interrupt_filter {

/**
 * @brief One reference conversation moment and its expected decision
 */
struct Scenario {
    std::string name;
    std::string transcript;
    bool agent_speaking;
    Action expected;
    std::string description;
};

/**
 * @brief Reference scenarios for the default lexicon
 */
const std::vector<Scenario>& builtin_scenarios();

/**
 * @brief Classify every scenario (each with a fresh debounce state) and print a report
 * @param classifier Classifier under test
 * @param scenarios Scenarios to run
 * @param out Report destination
 * @return Number of scenarios whose action differed from the expected one
 */
int run_scenarios(const InterruptionClassifier& classifier,
                  const std::vector<Scenario>& scenarios,
                  std::ostream& out);

} // namespace interrupt_filter
