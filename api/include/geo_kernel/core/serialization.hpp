#pragma once

#include <nlohmann/json.hpp>

#include "geo_kernel/core/debug.hpp"
#include "geo_kernel/core/math.hpp"
#include "geo_kernel/physics/ray.hpp"

// Vetores glm como arrays JSON: [x, y] / [x, y, z].
namespace nlohmann {
    template<glm::length_t L, typename T, glm::qualifier Q>
    struct adl_serializer<glm::vec<L, T, Q>> {
        static void to_json(json& j, const glm::vec<L, T, Q>& value) {
            j = json::array();
            for (glm::length_t i = 0; i < L; ++i)
                j.push_back(value[i]);
        }

        static void from_json(const json& j, glm::vec<L, T, Q>& value) {
            if (!j.is_array() || j.size() != static_cast<std::size_t>(L))
                GK_LOG_THROW("Expected an array of {} numbers, got {}", L, j.dump());

            for (glm::length_t i = 0; i < L; ++i)
                value[i] = j.at(static_cast<std::size_t>(i)).template get<T>();
        }
    };
} // namespace nlohmann

namespace geo_kernel::physics3D {
    template<std::floating_point T>
    void to_json(nlohmann::json& j, const Ray<T>& ray) {
        j = nlohmann::json{ { "origin", ray.origin }, { "direction", ray.dir } };
    }

    template<std::floating_point T>
    void from_json(const nlohmann::json& j, Ray<T>& ray) {
        j.at("origin").get_to(ray.origin);
        j.at("direction").get_to(ray.dir);
    }
} // namespace geo_kernel::physics3D
