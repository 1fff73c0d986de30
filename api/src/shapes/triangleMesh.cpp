#include "geo_kernel/shapes/triangleMesh.hpp"
#include "geo_kernel/core/debug.hpp"
#include "geo_kernel/core/sampling.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

namespace geo_kernel::shapes3D {

    namespace {
        template<std::floating_point T>
        AxisAlignedBox<T> CalculateBounds(const std::vector<Triangle<T>>& triangles) {
            if (triangles.empty())
                GK_LOG_THROW("TriangleMesh requires at least one triangle");

            AxisAlignedBox<T> bounds = triangles.front().GetBounds();
            for (const auto& triangle : triangles)
                bounds = AxisAlignedBox<T>::Union(bounds, triangle.GetBounds());

            return bounds;
        }
    }

    template<std::floating_point T>
    TriangleMesh<T>::TriangleMesh(std::vector<TriangleType> triangles)
        : m_triangles(std::move(triangles))
        , m_bounds(CalculateBounds(m_triangles)) {
        m_cumulativeAreas.reserve(m_triangles.size());

        for (const auto& triangle : m_triangles) {
            m_surfaceArea += triangle.GetSurfaceArea();
            m_cumulativeAreas.push_back(m_surfaceArea);
        }

        GK_LOG_DEBUG("TriangleMesh created with {} triangles (area {})", m_triangles.size(), m_surfaceArea);
    }

    template<std::floating_point T>
    bool TriangleMesh<T>::MayHitBounds(const RayType& ray) const {
        const Vector minimum = m_bounds.GetMinimum();
        const Vector maximum = m_bounds.GetMaximum();

        T tMin = -std::numeric_limits<T>::infinity();
        T tMax = std::numeric_limits<T>::infinity();

        for (int i = 0; i < 3; ++i) {
            const T reciprocal = T(1) / ray.dir[i];
            const T t0 = (minimum[i] - ray.origin[i]) * reciprocal;
            const T t1 = (maximum[i] - ray.origin[i]) * reciprocal;

            // 0 * inf: origem sobre o plano com direção paralela. O slab não restringe o raio,
            // e os triângulos incluem as arestas.
            if (std::isnan(t0) || std::isnan(t1))
                continue;

            tMin = std::max(tMin, std::min(t0, t1));
            tMax = std::min(tMax, std::max(t0, t1));

            if (tMin > tMax)
                return false;
        }

        return tMax >= T(0);
    }

    template<std::floating_point T>
    std::optional<typename TriangleMesh<T>::ClosestHit> TriangleMesh<T>::FindClosest(const RayType& ray) const {
        if (!MayHitBounds(ray))
            return std::nullopt;

        std::optional<ClosestHit> closest;

        for (const auto& triangle : m_triangles) {
            const T t = triangle.IntersectionT(ray);

            if (!std::isnan(t) && (!closest || t < closest->t))
                closest = ClosestHit{ &triangle, t };
        }

        return closest;
    }

    template<std::floating_point T>
    T TriangleMesh<T>::IntersectionT(const RayType& ray) const {
        const auto closest = FindClosest(ray);
        return closest ? closest->t : math::NaN<T>();
    }

    template<std::floating_point T>
    std::optional<Intersection<T>> TriangleMesh<T>::Intersect(const RayType& ray) const {
        const auto closest = FindClosest(ray);
        if (!closest)
            return std::nullopt;

        return closest->triangle->Intersect(ray);
    }

    template<std::floating_point T>
    typename TriangleMesh<T>::Vector TriangleMesh<T>::CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented) const {
        const auto closest = FindClosest(ray);
        if (!closest)
            return Vector(math::NaN<T>());

        return closest->triangle->CalculateSurfaceNormal(ray, t, isCorrectlyOriented);
    }

    template<std::floating_point T>
    typename TriangleMesh<T>::Point2 TriangleMesh<T>::CalculateTextureCoordinates(const RayType& ray, T t) const {
        const auto closest = FindClosest(ray);
        if (!closest)
            return Point2(math::NaN<T>());

        return closest->triangle->CalculateTextureCoordinates(ray, t);
    }

    template<std::floating_point T>
    std::optional<SurfaceSample<T>> TriangleMesh<T>::Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const {
        if (!(m_surfaceArea > T(0)))
            return std::nullopt;

        const T target = u * m_surfaceArea;

        auto it = std::upper_bound(m_cumulativeAreas.begin(), m_cumulativeAreas.end(), target);
        if (it == m_cumulativeAreas.end())
            --it;

        const auto index = static_cast<std::size_t>(std::distance(m_cumulativeAreas.begin(), it));
        const T previous = index == 0 ? T(0) : m_cumulativeAreas[index - 1];
        const T area = m_cumulativeAreas[index] - previous;

        // Reaproveita o resto de u dentro do triângulo escolhido.
        const T remappedU = area > T(0) ? math::Clamp((target - previous) / area, T(0), T(1)) : T(0);

        const auto sample = m_triangles[index].Sample(referencePoint, referenceSurfaceNormal, remappedU, v);
        if (!sample)
            return std::nullopt;

        const T pdf = CalculateSolidAnglePdf(referencePoint, referenceSurfaceNormal, sample->GetPoint(), sample->GetNormal());
        if (!std::isfinite(pdf))
            return std::nullopt;

        return SurfaceSample<T>(sample->GetPoint(), sample->GetNormal(), pdf);
    }

    template<std::floating_point T>
    T TriangleMesh<T>::CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                              const Vector& point, const Vector& surfaceNormal) const {
        return sampling::ConvertAreaToSolidAnglePdf(this->GetSurfaceAreaPdf(), referencePoint, point, surfaceNormal);
    }

    template<std::floating_point T>
    TriangleMesh<T> TriangleMesh<T>::Transform(const math::TMat4<T>& m) const {
        std::vector<TriangleType> transformed;
        transformed.reserve(m_triangles.size());

        for (const auto& triangle : m_triangles)
            transformed.push_back(triangle.Transform(m));

        return TriangleMesh(std::move(transformed));
    }

    template class TriangleMesh<float>;
    template class TriangleMesh<double>;
} // namespace geo_kernel::shapes3D
