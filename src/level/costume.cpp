/// @file costume.cpp
/// @brief Costume parsing, costume sets and the wardrobe cycle

#include "level/costume.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace costumemaster {

std::optional<Costume> parse_costume(std::string_view name) {
    for (Costume costume : {Costume::Default, Costume::Bird, Costume::FlashDrive, Costume::Sorceress}) {
        if (costume_name(costume) == name) {
            return costume;
        }
    }
    return std::nullopt;
}

std::vector<Costume> costume_set(int id) {
    switch (id) {
    case 0:
        return {Costume::Default};
    case 1:
        return {Costume::Default, Costume::FlashDrive};
    case 2:
        return {Costume::Default, Costume::FlashDrive, Costume::Bird};
    default:
        break;
    }
    if (id < 0) {
        return {Costume::Default};
    }
    return {Costume::Default, Costume::FlashDrive, Costume::Bird, Costume::Sorceress};
}

Wardrobe::Wardrobe(std::vector<Costume> available, Costume starting) : available_(std::move(available)) {
    if (available_.empty()) {
        throw std::invalid_argument("Wardrobe requires at least one costume");
    }
    (void)wear(starting);
}

bool Wardrobe::wear(Costume costume) {
    auto it = std::find(available_.begin(), available_.end(), costume);
    if (it == available_.end()) {
        return false;
    }
    index_ = static_cast<size_t>(it - available_.begin());
    return true;
}

Costume Wardrobe::next() {
    index_ = (index_ + 1) % available_.size();
    return current();
}

Costume Wardrobe::previous() {
    index_ = (index_ + available_.size() - 1) % available_.size();
    return current();
}

} // namespace costumemaster
