#pragma once

#include <array>

#include "geo_kernel/core/math.hpp"
#include "geo_kernel/shapes/shape.hpp"

namespace geo_kernel::shapes3D {

    /// Vértice com posição, normal de shading e coordenada de textura.
    template<std::floating_point T>
    struct Vertex {
        math::TVec2<T> textureCoordinates{ T(0) };
        math::TVec3<T> position{ T(0) };
        math::TVec3<T> normal{ T(0), T(0), T(1) };

        bool operator==(const Vertex& other) const = default;
    };

    /**
     * @class Triangle
     * @brief Triângulo com normais e UVs por vértice, interpolados por coordenadas baricêntricas.
     *
     * Pesos baricêntricos (u, v, w): u pondera B, v pondera C e w = 1 - u - v pondera A.
     */
    template<std::floating_point T>
    class Triangle final : public Shape<T> {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using RayType = physics3D::Ray<T>;
        using VertexType = Vertex<T>;

        Triangle(const VertexType& a, const VertexType& b, const VertexType& c);

        const VertexType& GetA() const { return m_a; }
        const VertexType& GetB() const { return m_b; }
        const VertexType& GetC() const { return m_c; }

        /// Normal geométrica normalizada, cross(B - A, C - A). Depende da ordem dos vértices.
        const Vector& GetFaceNormal() const { return m_faceNormal; }

        std::string GetName() const override { return "triangle"; }

        // --- Shape --- //
        T IntersectionT(const RayType& ray) const override;

        /// (u, v, w) do ponto ray(t).
        Vector CalculateBarycentricCoordinates(const RayType& ray, T t) const;

        Vector CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented = false) const override;
        Point2 CalculateTextureCoordinates(const RayType& ray, T t) const override;

        std::optional<SurfaceSample<T>> Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const override;
        T CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                 const Vector& point, const Vector& surfaceNormal) const override;

        T GetSurfaceArea() const override;
        T GetVolume() const override { return T(0); }

        AxisAlignedBox<T> GetBounds() const override;

        /// Posições como pontos, normais pela transposta da inversa.
        Triangle Transform(const math::TMat4<T>& m) const;

        bool operator==(const Triangle& other) const { return m_a == other.m_a && m_b == other.m_b && m_c == other.m_c; }

    private:
        Vector InterpolateNormal(T u, T v, T w) const;

        VertexType m_a;
        VertexType m_b;
        VertexType m_c;
        Vector m_faceNormal;
    };

    extern template class Triangle<float>;
    extern template class Triangle<double>;
} // namespace geo_kernel::shapes3D
