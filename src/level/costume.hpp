#pragma once

/// @file costume.hpp
/// @brief Player costumes and the costume sets a level can unlock

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace costumemaster {

/// Costumes the player can wear. Computers only respond to specific costumes.
enum class Costume { Default, Bird, FlashDrive, Sorceress };

/// Returns the configuration-file name of a costume ("USB" for the flash drive)
[[nodiscard]] constexpr std::string_view costume_name(Costume costume) {
    switch (costume) {
    case Costume::Default:
        return "Default";
    case Costume::Bird:
        return "Bird";
    case Costume::FlashDrive:
        return "USB";
    case Costume::Sorceress:
        return "Sorceress";
    }
    return "Unknown";
}

/// Parses a costume name as written in level user data
[[nodiscard]] std::optional<Costume> parse_costume(std::string_view name);

/// The costumes unlocked by a level's `availableCostumes` id.
/// 0 = default only, 1 adds USB, 2 adds Bird, 3 or more unlocks every costume.
[[nodiscard]] std::vector<Costume> costume_set(int id);

/// Cycles through a costume set. The wardrobe never holds an empty set.
class Wardrobe {
  public:
    /// @throws std::invalid_argument if `available` is empty
    Wardrobe(std::vector<Costume> available, Costume starting);

    [[nodiscard]] Costume current() const { return available_[index_]; }
    [[nodiscard]] const std::vector<Costume>& available() const { return available_; }

    /// Returns false when `costume` is not in the set (current costume unchanged)
    bool wear(Costume costume);

    Costume next();
    Costume previous();

  private:
    std::vector<Costume> available_;
    size_t index_ = 0;
};

} // namespace costumemaster
