#pragma once

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/physics/ray.hpp"

namespace geo_kernel::physics3D {

    /**
     * @class BoundingVolume
     * @brief Contrato comum de volumes envolventes (caixa e esfera).
     *
     * Invariante: GetMinimum() <= GetMaximum() em cada eixo.
     */
    template<std::floating_point T>
    class BoundingVolume {
    public:
        using Vector = math::TVec3<T>;

        virtual ~BoundingVolume() = default;

        virtual Vector GetMaximum() const = 0;
        virtual Vector GetMinimum() const = 0;
        virtual Vector GetMidpoint() const { return (GetMaximum() + GetMinimum()) * T(0.5); }

        virtual Vector GetClosestPointTo(const Vector& p) const = 0;
        virtual bool Contains(const Vector& p) const = 0;

        virtual T GetSurfaceArea() const = 0;
        virtual T GetVolume() const = 0;

        /// Distância paramétrica da interseção, ou NaN se o raio não acerta.
        virtual T IntersectionT(const Ray<T>& ray) const = 0;

        bool Intersects(const Ray<T>& ray) const { return std::isfinite(IntersectionT(ray)); }

        /**
         * @brief Teste aproximado: o meu ponto mais próximo do centro do outro volume está dentro dele?
         *
         * Unilateral e incompleto (pode dar falso negativo para volumes que se sobrepõem).
         * Não é um teste de eixo separador.
         */
        bool Intersects(const BoundingVolume& other) const {
            return other.Contains(GetClosestPointTo(other.GetMidpoint()));
        }
    };
} // namespace geo_kernel::physics3D
