#include "deck/deck_utils.hpp"
#include <algorithm> // Pour std::transform
#include <cctype>
#include <sstream>

namespace deck_sim {

std::string join_names(const std::vector<std::string>& names, const std::string& separator) {
    std::stringstream ss;
    for (size_t i = 0; i < names.size(); ++i) {
        ss << names[i];
        if (i < names.size() - 1) {
            ss << separator;
        }
    }
    return ss.str();
}

std::string deck_summary(const std::string& id, const Deck& deck) {
    std::stringstream ss;
    ss << "Deck '" << id << "' contains " << deck.remaining() << " of " << deck.total() << " cards";
    return ss.str();
}

std::string status_to_string(const DeckStatus& status) {
    std::string line = status.id + ": " + std::to_string(status.remaining) + "/" + std::to_string(status.total);
    if (status.reshuffle) {
        line += " (reshuffles)";
    }
    return line;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace deck_sim
