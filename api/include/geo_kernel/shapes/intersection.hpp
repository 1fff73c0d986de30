#pragma once

#include "geo_kernel/core/lazy.hpp"
#include "geo_kernel/core/math.hpp"
#include "geo_kernel/geometry/orthonormalBasis.hpp"
#include "geo_kernel/physics/ray.hpp"

namespace geo_kernel::shapes3D {
    template<std::floating_point T>
    class Shape;

    /**
     * @class Intersection
     * @brief Resultado de um acerto raio-forma.
     *
     * Guarda o raio, uma referência (sem posse) à forma e t. Base, UV, ponto e normal são
     * calculados sob demanda, no máximo uma vez cada, mesmo com acesso concorrente.
     * Raios de sombra normalmente só precisam de GetT().
     *
     * A forma precisa sobreviver à Intersection.
     */
    template<std::floating_point T>
    class Intersection {
    public:
        using Vector = math::TVec3<T>;
        using Point2 = math::TVec2<T>;
        using Basis = geometry::OrthonormalBasis<T>;

        Intersection(const physics3D::Ray<T>& ray,
                     const Shape<T>& shape,
                     T t,
                     typename Lazy<Basis>::Supplier orthonormalBasisSupplier,
                     typename Lazy<Point2>::Supplier textureCoordinatesSupplier,
                     typename Lazy<Vector>::Supplier surfaceIntersectionPointSupplier,
                     typename Lazy<Vector>::Supplier surfaceNormalSupplier)
            : m_ray(ray)
            , m_shape(&shape)
            , m_t(t)
            , m_orthonormalBasis(std::move(orthonormalBasisSupplier))
            , m_textureCoordinates(std::move(textureCoordinatesSupplier))
            , m_surfaceIntersectionPoint(std::move(surfaceIntersectionPointSupplier))
            , m_surfaceNormal(std::move(surfaceNormalSupplier)) {}

        Intersection(const Intersection&) = delete;
        Intersection& operator=(const Intersection&) = delete;
        Intersection(Intersection&&) noexcept = default;
        Intersection& operator=(Intersection&&) noexcept = default;

        const physics3D::Ray<T>& GetRay() const { return m_ray; }
        const Shape<T>& GetShape() const { return *m_shape; }
        T GetT() const { return m_t; }

        const Basis& GetOrthonormalBasis() const { return m_orthonormalBasis.Get(); }
        const Point2& GetTextureCoordinates() const { return m_textureCoordinates.Get(); }
        const Vector& GetSurfaceIntersectionPoint() const { return m_surfaceIntersectionPoint.Get(); }
        const Vector& GetSurfaceNormal() const { return m_surfaceNormal.Get(); }

    private:
        physics3D::Ray<T> m_ray;
        const Shape<T>* m_shape;
        T m_t;

        Lazy<Basis> m_orthonormalBasis;
        Lazy<Point2> m_textureCoordinates;
        Lazy<Vector> m_surfaceIntersectionPoint;
        Lazy<Vector> m_surfaceNormal;
    };
} // namespace geo_kernel::shapes3D
