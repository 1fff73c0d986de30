#pragma once

#include <optional>
#include <string>

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/geometry/orthonormalBasis.hpp"
#include "geo_kernel/physics/ray.hpp"
#include "geo_kernel/shapes/intersection.hpp"
#include "geo_kernel/shapes/surfaceSample.hpp"

namespace geo_kernel::shapes3D {
    template<std::floating_point T>
    class AxisAlignedBox;

    /**
     * @class Shape
     * @brief Contrato por primitiva: interseção com raio, geometria diferencial e amostragem de superfície.
     *
     * Implementações são imutáveis após a construção e podem ser lidas de várias threads sem sincronização.
     * Ausência de interseção é sinalizada por NaN em IntersectionT(); Intersect() embrulha isso em std::optional.
     *
     * O parâmetro isCorrectlyOriented pede uma normal voltada contra o raio.
     */
    template<std::floating_point T>
    class Shape {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using Basis = geometry::OrthonormalBasis<T>;
        using RayType = physics3D::Ray<T>;

        virtual ~Shape() = default;

        /// Nome curto do tipo, usado em logs e na serialização.
        virtual std::string GetName() const = 0;

        virtual T IntersectionT(const RayType& ray) const = 0;

        virtual std::optional<Intersection<T>> Intersect(const RayType& ray) const {
            const T t = IntersectionT(ray);
            if (std::isnan(t))
                return std::nullopt;

            return std::optional<Intersection<T>>(std::in_place, ray, *this, t,
                [this, ray, t] { return CalculateOrthonormalBasis(ray, t, true); },
                [this, ray, t] { return CalculateTextureCoordinates(ray, t); },
                [this, ray, t] { return CalculateSurfaceIntersectionPoint(ray, t); },
                [this, ray, t] { return CalculateSurfaceNormal(ray, t, true); });
        }

        virtual Basis CalculateOrthonormalBasis(const RayType& ray, T t, bool isCorrectlyOriented = false) const {
            return Basis(CalculateSurfaceNormal(ray, t, isCorrectlyOriented));
        }

        virtual Vector CalculateSurfaceIntersectionPoint(const RayType& ray, T t) const {
            return ray.GetPoint(t);
        }

        virtual Vector CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented = false) const = 0;

        virtual Point2 CalculateTextureCoordinates(const RayType& ray, T t) const = 0;

        /**
         * @brief Amostra um ponto da superfície visto de referencePoint.
         * @param u, v Números uniformes em [0, 1).
         * @return Ponto, normal e PDF em medida de ângulo sólido, ou std::nullopt se a forma não puder ser amostrada.
         */
        virtual std::optional<SurfaceSample<T>> Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const = 0;

        /// PDF (ângulo sólido) que Sample() atribuiria a (point, surfaceNormal) visto de referencePoint.
        virtual T CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                         const Vector& point, const Vector& surfaceNormal) const = 0;

        virtual T GetSurfaceArea() const = 0;
        virtual T GetSurfaceAreaPdf() const { return T(1) / GetSurfaceArea(); }
        virtual T GetVolume() const = 0;

        virtual AxisAlignedBox<T> GetBounds() const = 0;

    protected:
        // Orienta a normal contra a direção do raio quando pedido.
        static Vector OrientAgainst(const Vector& normal, const Vector& direction, bool isCorrectlyOriented) {
            return isCorrectlyOriented && glm::dot(normal, direction) >= T(0) ? -normal : normal;
        }
    };
} // namespace geo_kernel::shapes3D
