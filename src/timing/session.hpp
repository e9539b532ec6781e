#pragma once

/// @file session.hpp
/// @brief State that outlives a single level

#include <string>

namespace costumemaster {

/// Owned by the application and handed to the tick evaluator by reference.
struct SessionContext {
    std::string last_saved_level; ///< Name of the last level completed or unloaded
    int levels_completed = 0;
};

} // namespace costumemaster
