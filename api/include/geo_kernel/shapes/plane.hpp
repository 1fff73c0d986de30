#pragma once

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/shapes/shape.hpp"

namespace geo_kernel::shapes3D {

    /**
     * @class Plane
     * @brief Plano infinito que passa por A, B e C. Normal = normalize(cross(B - A, C - A)).
     *
     * Área e volume são infinitos; o plano não pode ser amostrado.
     */
    template<std::floating_point T>
    class Plane final : public Shape<T> {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using RayType = physics3D::Ray<T>;

        Plane(const Vector& a, const Vector& b, const Vector& c);

        const Vector& GetA() const { return m_a; }
        const Vector& GetB() const { return m_b; }
        const Vector& GetC() const { return m_c; }
        const Vector& GetSurfaceNormal() const { return m_surfaceNormal; }

        std::string GetName() const override { return "plane"; }

        T IntersectionT(const RayType& ray) const override;

        Vector CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented = false) const override;

        // Projeção no plano do eixo dominante da normal; u mede ao longo de B - A e v ao longo de C - A.
        Point2 CalculateTextureCoordinates(const RayType& ray, T t) const override;

        std::optional<SurfaceSample<T>> Sample(const Vector&, const Vector&, T, T) const override { return std::nullopt; }
        T CalculateSolidAnglePdf(const Vector&, const Vector&, const Vector&, const Vector&) const override { return T(0); }

        T GetSurfaceArea() const override { return std::numeric_limits<T>::infinity(); }
        T GetSurfaceAreaPdf() const override { return T(0); }
        T GetVolume() const override { return std::numeric_limits<T>::infinity(); }

        AxisAlignedBox<T> GetBounds() const override;

        bool operator==(const Plane& other) const { return m_a == other.m_a && m_b == other.m_b && m_c == other.m_c; }

    private:
        Vector m_a;
        Vector m_b;
        Vector m_c;
        Vector m_surfaceNormal;
    };

    extern template class Plane<float>;
    extern template class Plane<double>;
} // namespace geo_kernel::shapes3D
