#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Both wire protocols are line-delimited JSON built on nlohmann::json.
 */
using json = nlohmann::json;
