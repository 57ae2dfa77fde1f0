#include "TransferTypes.h"
#include <type_traits>

namespace FileCourier {

const char* selectorTag(const DestinationSelector& selector) {
    return std::visit([](const auto& choice) -> const char* {
        using T = std::decay_t<decltype(choice)>;
        if constexpr (std::is_same_v<T, DestinationPath>) {
            return "destination";
        } else if constexpr (std::is_same_v<T, DestinationUuid>) {
            return "uuid";
        } else {
            return "directory";
        }
    }, selector);
}

const std::string& selectorValue(const DestinationSelector& selector) {
    return std::visit([](const auto& choice) -> const std::string& {
        using T = std::decay_t<decltype(choice)>;
        if constexpr (std::is_same_v<T, DestinationUuid>) {
            return choice.id;
        } else {
            return choice.path;
        }
    }, selector);
}

} // namespace FileCourier
