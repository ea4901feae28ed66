#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Workspace snapshots are written with `nlohmann::json`, exposed as
 * `json`.
 */
using json = nlohmann::json;
