#pragma once

#include <vector>

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/shapes/axisAlignedBox.hpp"
#include "geo_kernel/shapes/shape.hpp"
#include "geo_kernel/shapes/triangle.hpp"

namespace geo_kernel::shapes3D {

    /**
     * @class TriangleMesh
     * @brief Coleção linear de triângulos com caixa envolvente. Não é uma estrutura de aceleração.
     *
     * Intersect() devolve a interseção do triângulo mais próximo; a forma referenciada é esse triângulo.
     * A amostragem escolhe um triângulo proporcionalmente à área.
     */
    template<std::floating_point T>
    class TriangleMesh final : public Shape<T> {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using RayType = physics3D::Ray<T>;
        using TriangleType = Triangle<T>;

        /// Lança std::runtime_error se a lista estiver vazia.
        explicit TriangleMesh(std::vector<TriangleType> triangles);

        const std::vector<TriangleType>& GetTriangles() const { return m_triangles; }

        std::string GetName() const override { return "mesh"; }

        T IntersectionT(const RayType& ray) const override;
        std::optional<Intersection<T>> Intersect(const RayType& ray) const override;

        Vector CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented = false) const override;
        Point2 CalculateTextureCoordinates(const RayType& ray, T t) const override;

        std::optional<SurfaceSample<T>> Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const override;
        T CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                 const Vector& point, const Vector& surfaceNormal) const override;

        T GetSurfaceArea() const override { return m_surfaceArea; }
        T GetVolume() const override { return T(0); }

        AxisAlignedBox<T> GetBounds() const override { return m_bounds; }

        TriangleMesh Transform(const math::TMat4<T>& m) const;

    private:
        struct ClosestHit {
            const TriangleType* triangle;
            T t;
        };

        std::optional<ClosestHit> FindClosest(const RayType& ray) const;

        // Descarte conservador pela caixa: só rejeita raios que certamente não a alcançam.
        bool MayHitBounds(const RayType& ray) const;

        std::vector<TriangleType> m_triangles;
        std::vector<T> m_cumulativeAreas;
        AxisAlignedBox<T> m_bounds;
        T m_surfaceArea = T(0);
    };

    extern template class TriangleMesh<float>;
    extern template class TriangleMesh<double>;
} // namespace geo_kernel::shapes3D
