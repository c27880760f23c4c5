/***
 * Name: tether::rt::TypeTag
 * Purpose: Tags used by the runtime to identify heap object kinds.
 */
#pragma once

#include <cstdint>

namespace tether::rt {
    enum class TypeTag : uint32_t {
        Nothing = 0,
        Int = 1,
        Float = 2,
        Bool = 3,
        String = 4,
        List = 5,
        Exception = 6,
        Function = 7,
        Builtin = 8
    };

    // Display name used by render() and by MethodError messages.
    const char *type_name(TypeTag tag);
} // namespace tether::rt
