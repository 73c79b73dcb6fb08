/**
 * @file execution_result.cpp
 */

#include "engine/execution_result.h"

namespace tradegate {

std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Filled: return "filled";
        case ExecutionStatus::Submitted: return "submitted";
        case ExecutionStatus::NoPosition: return "no_position";
        case ExecutionStatus::Rejected: return "rejected";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace tradegate
