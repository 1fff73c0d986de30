#pragma once

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/physics/boundingVolume.hpp"
#include "geo_kernel/shapes/shape.hpp"

namespace geo_kernel::shapes3D {

    /**
     * @class AxisAlignedBox
     * @brief Caixa alinhada aos eixos. Os cantos são reordenados na construção para que min <= max em cada eixo.
     */
    template<std::floating_point T>
    class AxisAlignedBox final : public Shape<T>, public physics3D::BoundingVolume<T> {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using RayType = physics3D::Ray<T>;

        enum class Face : int {
            None = 0,
            NegativeX,
            PositiveX,
            NegativeY,
            PositiveY,
            NegativeZ,
            PositiveZ
        };

        /// Cubo unitário centrado na origem.
        AxisAlignedBox();
        AxisAlignedBox(const Vector& a, const Vector& b);

        // -------------------------------
        // Utilitários básicos
        // -------------------------------
        Vector Center() const { return (m_min + m_max) * T(0.5); }
        Vector Extents() const { return (m_max - m_min) * T(0.5); }
        Vector Size() const { return m_max - m_min; }

        /// Menor caixa que contém as duas.
        static AxisAlignedBox Union(const AxisAlignedBox& a, const AxisAlignedBox& b) {
            return AxisAlignedBox(glm::min(a.m_min, b.m_min), glm::max(a.m_max, b.m_max));
        }

        static Vector GetFaceNormal(Face face);

        /// Face cuja distância relativa ao centro é a maior no ponto dado (Face::None se degenerado).
        Face CalculateFace(const Vector& point) const;

        std::string GetName() const override { return "box"; }

        // --- Shape --- //
        T IntersectionT(const RayType& ray) const override;

        /// Reaproveita a face encontrada no teste de slabs para normal, base e UV.
        std::optional<Intersection<T>> Intersect(const RayType& ray) const override;

        Vector CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented = false) const override;
        Point2 CalculateTextureCoordinates(const RayType& ray, T t) const override;

        std::optional<SurfaceSample<T>> Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const override;
        T CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                 const Vector& point, const Vector& surfaceNormal) const override;

        T GetSurfaceArea() const override;
        T GetVolume() const override;

        AxisAlignedBox GetBounds() const override { return *this; }

        // --- BoundingVolume --- //
        Vector GetMaximum() const override { return m_max; }
        Vector GetMinimum() const override { return m_min; }

        Vector GetClosestPointTo(const Vector& p) const override { return glm::clamp(p, m_min, m_max); }

        bool Contains(const Vector& p) const override {
            return (p.x >= m_min.x && p.x <= m_max.x &&
                    p.y >= m_min.y && p.y <= m_max.y &&
                    p.z >= m_min.z && p.z <= m_max.z);
        }

        /// Caixa que envolve os oito cantos transformados.
        AxisAlignedBox Transform(const math::TMat4<T>& m) const;

        bool operator==(const AxisAlignedBox& other) const { return m_min == other.m_min && m_max == other.m_max; }

    private:
        struct SlabHit {
            T t;
            Face face;
        };

        // Método dos slabs; face é a face que governa t (entrada, ou saída se a origem estiver dentro).
        std::optional<SlabHit> IntersectSlabs(const RayType& ray) const;

        Point2 CalculateFaceTextureCoordinates(const Vector& point, Face face) const;

        Vector m_min;
        Vector m_max;
    };

    extern template class AxisAlignedBox<float>;
    extern template class AxisAlignedBox<double>;
} // namespace geo_kernel::shapes3D
