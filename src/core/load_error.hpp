#pragma once

/// @file load_error.hpp
/// @brief Exception for conditions that make a level impossible to run

#include <stdexcept>
#include <string>
#include <utility>

namespace costumemaster {

/// Thrown while loading a level when it cannot be played at all.
/// `title` is the short alert heading, `what()` the explanation.
class LoadError : public std::runtime_error {
  public:
    LoadError(std::string title, const std::string& message)
        : std::runtime_error(message), title_(std::move(title)) {}

    [[nodiscard]] const std::string& title() const { return title_; }

  private:
    std::string title_;
};

} // namespace costumemaster
