#pragma once

#include "geo_kernel/core/math.hpp"

namespace geo_kernel::physics3D {

    /**
     * @brief Raio paramétrico origin + t * dir.
     *
     * A direção NÃO é normalizada: a interseção com esfera usa o comprimento real de dir,
     * e t é sempre medido nessa escala.
     */
    template<std::floating_point T>
    struct Ray {
        using Vector = math::TVec3<T>;

        Vector origin;
        Vector dir;

        Ray() = default;
        Ray(const Vector& o, const Vector& d)
            : origin(o), dir(d) {}

        Vector GetPoint(T t) const { return origin + dir * t; }

        // Origem como ponto, direção como vetor (sem translação).
        Ray Transform(const math::TMat4<T>& m) const {
            return Ray(math::TransformPoint(m, origin), math::TransformVector(m, dir));
        }

        bool operator==(const Ray& other) const = default;
    };

    using Ray3F = Ray<float>;
    using Ray3D = Ray<double>;
} // namespace geo_kernel::physics3D
