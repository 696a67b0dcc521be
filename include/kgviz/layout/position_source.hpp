#pragma once

#include "kgviz/layout/vec.hpp"
#include <optional>
#include <string>

namespace kgviz {

/**
 * @brief Read access to the positions owned by a running simulation
 *
 * Consumers resolve positions by id on every use and must not keep
 * references across a dataset replacement. 2-D layouts report z = 0.
 */
class PositionSource {
public:
    virtual ~PositionSource() = default;

    /**
     * @brief Current position of a node, or nullopt if it is not laid out
     */
    virtual std::optional<Vec3> position_of(const std::string& node_id) const = 0;
};

} // namespace kgviz
