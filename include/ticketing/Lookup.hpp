#pragma once

#include <string>
#include <variant>

namespace ts::ticketing {

template<typename T>
struct Found {
    T value;
};

struct NotFound {};

struct Failed {
    std::string cause;
};

template<typename T>
using Lookup = std::variant<Found<T>, NotFound, Failed>;

template<typename T>
[[nodiscard]] const T* found(const Lookup<T>& l) {
    if (const auto* f = std::get_if<Found<T>>(&l)) return &f->value;
    return nullptr;
}

}
