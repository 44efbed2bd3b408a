#pragma once

#include "SafetyValidator.h"

struct CleanupPlan;

struct ReviewDecision {
    enum class Action {
        Accept,        // keep the recommended keeper
        ChangeKeeper,  // keep members[keeperIndex] instead
        KeepAll        // exclude the group from deletion
    };

    Action action = Action::Accept;
    int keeperIndex = -1;

    static ReviewDecision accept() { return ReviewDecision{}; }
    static ReviewDecision keepAll() { return ReviewDecision{ Action::KeepAll, -1 }; }
    static ReviewDecision changeKeeper(int index) { return ReviewDecision{ Action::ChangeKeeper, index }; }
};

// The human in the loop for SmartCleanup. Nothing is deleted unless
// confirmDeletion() returns true for the final plan.
class ICleanupReviewer {
public:
    virtual ~ICleanupReviewer() = default;

    virtual ReviewDecision reviewGroup(const DuplicateGroup& group) = 0;
    virtual bool confirmDeletion(const CleanupPlan& plan) = 0;
};
