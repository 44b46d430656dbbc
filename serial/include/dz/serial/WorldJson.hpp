/**
 * @file WorldJson.hpp
 * @brief Best-effort JSON dump of a World for debugging and bug reports.
 *
 * The layout follows the in-memory model and is not a stable format; there
 * is no loader.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_SERIAL_WORLDJSON_HPP
    #define DZ_SERIAL_WORLDJSON_HPP

#include <dz/ecs/World.hpp>
#include <dz/core/Expected.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace dz::serial {

/**
 * @brief Fields of one component, keyed by name.
 *
 * Component types the dumper does not know are emitted as an empty object.
 */
[[nodiscard]] nlohmann::json componentToJson(const ecs::Component& component);

/**
 * @brief Snapshot of the whole world.
 *
 * @code
 * {
 *   "time": <simulated ms>,
 *   "entities": [{ "id", "name", "active", "createdAt", "lastModified",
 *                  "components": { "<Name>": {...} } }],
 *   "systems":  [{ "name", "priority", "active", "enabled", "query",
 *                  "entityCount", "performance" }],
 *   "stats":    { ...WorldStats }
 * }
 * @endcode
 */
[[nodiscard]] nlohmann::json toJson(const ecs::World& world);

/** @brief Writes toJson(@p world) to @p path. */
[[nodiscard]] core::Expected<void> dumpWorld(const ecs::World& world, const std::filesystem::path& path,
                                             int indent = 2);

} // namespace dz::serial

#endif // DZ_SERIAL_WORLDJSON_HPP
