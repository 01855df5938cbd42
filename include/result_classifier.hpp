/*
 * Service Monitor - Result Classifier
 */

#pragma once

#include "probe_types.hpp"

namespace ResultClassifier {
    // UP if the status code is accepted, DOWN if not, ERROR if no status
    // code was obtained, the definition is invalid or the test accepts no
    // codes at all. Pure.
    ClassifiedResult classify(const TestDefinition& test, const ProbeOutcome& outcome);
}
