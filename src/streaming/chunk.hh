#pragma once

#include "definitions.hh"

#include <cstdint>

namespace stow {
/**
 * @brief A bounded slice of the object's bytes.
 * @details Ids are assigned 1, 2, 3, ... in write order. A chunk is owned by
 * exactly one party at a time: the writer until it is handed off, then the
 * worker that dequeued it.
 */
struct Chunk
{
    uint32_t id{ 0 };
    ByteVector data;
};
} // namespace stow
