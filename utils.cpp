#include <cstdlib>

#include "utils.hpp"


namespace Utils
{
    std::optional<std::string> environmentValue(const char* name)
    {
        const char* value = std::getenv(name);

        if (value == nullptr)
            return {};

        return std::string(value);
    }
}
