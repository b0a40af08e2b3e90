/**
 * @file ids.hpp
 * @brief Unique identifier generation for actions, policies and nodes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <string>
#include <string_view>

namespace cluster_pilot {

/**
 * @brief Generate a process-unique identifier such as "act-5f0c3a91e2d4b817".
 *
 * Thread-safe. Identifiers combine a random per-process salt with a
 * monotonically increasing counter, so they never repeat within a process.
 */
[[nodiscard]] std::string generate_id(std::string_view prefix);

}  // namespace cluster_pilot
