#pragma once

#include "model/config_documents.hpp"
#include "model/progress.hpp"
#include "model/task_graph.hpp"

namespace sprintgate {

// Everything one invocation reads from the state directory. Rebuilt from disk on every call.
struct SprintState {
    TaskGraph graph;
    ProgressTracker progress;
    DeferredFeatureList deferred;
    GuardrailConfig guardrails;
    ApprovedStack approved_stack;
};

}
