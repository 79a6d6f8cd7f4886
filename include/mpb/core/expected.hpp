#pragma once

#include <expected>

#include "mpb/core/error.hpp"

namespace mpb {

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

}  // namespace mpb
