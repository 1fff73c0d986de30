#pragma once

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/physics/boundingVolume.hpp"
#include "geo_kernel/shapes/shape.hpp"

namespace geo_kernel::shapes3D {

    /**
     * @class Sphere
     * @brief Esfera definida por centro e raio. É forma e volume envolvente ao mesmo tempo.
     */
    template<std::floating_point T>
    class Sphere final : public Shape<T>, public physics3D::BoundingVolume<T> {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using RayType = physics3D::Ray<T>;

        // Abaixo de radius^2 * INSIDE_FACTOR o ponto de referência é tratado como interno.
        static constexpr T INSIDE_FACTOR = static_cast<T>(1.00001);

        Sphere(const Vector& center, T radius)
            : m_center(center), m_radius(radius) {}

        const Vector& GetCenter() const { return m_center; }
        T GetRadius() const { return m_radius; }
        T GetRadiusSquared() const { return m_radius * m_radius; }
        T GetDiameter() const { return m_radius * T(2); }

        std::string GetName() const override { return "sphere"; }

        // --- Shape --- //
        T IntersectionT(const RayType& ray) const override;

        Vector CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented = false) const override;
        Point2 CalculateTextureCoordinates(const RayType& ray, T t) const override;

        std::optional<SurfaceSample<T>> Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const override;
        T CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                 const Vector& point, const Vector& surfaceNormal) const override;

        T GetSurfaceArea() const override;
        T GetVolume() const override;

        AxisAlignedBox<T> GetBounds() const override;

        // --- BoundingVolume --- //
        Vector GetMaximum() const override { return m_center + Vector(m_radius); }
        Vector GetMinimum() const override { return m_center - Vector(m_radius); }
        Vector GetMidpoint() const override { return m_center; }

        Vector GetClosestPointTo(const Vector& p) const override;
        bool Contains(const Vector& p) const override;

        /// Centro transformado como ponto; o raio não muda.
        Sphere Transform(const math::TMat4<T>& m) const;

        bool operator==(const Sphere& other) const { return m_center == other.m_center && m_radius == other.m_radius; }

    private:
        // Menor distância (ao quadrado) abaixo da qual a amostragem usa a esfera inteira.
        bool IsInsideSamplingRegion(const Vector& referencePoint) const;

        Vector m_center;
        T m_radius;
    };

    extern template class Sphere<float>;
    extern template class Sphere<double>;
} // namespace geo_kernel::shapes3D
