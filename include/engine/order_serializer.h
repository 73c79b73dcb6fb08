#pragma once

#include "engine/execution_result.h"
#include <string>

namespace tradegate {
namespace engine {

/**
 * @brief Serialize an execution result to a single-line JSON object
 *
 * Optional fields are omitted when unset; venueStatuses is embedded as JSON
 * when it parses, otherwise as a string.
 */
std::string serialize_execution_result(const ExecutionResult& result);

} // namespace engine
} // namespace tradegate
