#include "geo_kernel/shapes/plane.hpp"
#include "geo_kernel/shapes/axisAlignedBox.hpp"

namespace geo_kernel::shapes3D {

    template<std::floating_point T>
    Plane<T>::Plane(const Vector& a, const Vector& b, const Vector& c)
        : m_a(a), m_b(b), m_c(c)
        , m_surfaceNormal(glm::normalize(glm::cross(b - a, c - a))) {}

    template<std::floating_point T>
    T Plane<T>::IntersectionT(const RayType& ray) const {
        const T denominator = glm::dot(m_surfaceNormal, ray.dir);

        if (std::abs(denominator) <= std::numeric_limits<T>::epsilon())
            return math::NaN<T>();

        const T t = glm::dot(m_a - ray.origin, m_surfaceNormal) / denominator;

        return t > math::Epsilon<T>() ? t : math::NaN<T>();
    }

    template<std::floating_point T>
    typename Plane<T>::Vector Plane<T>::CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented) const {
        return Shape<T>::OrientAgainst(m_surfaceNormal, ray.dir, isCorrectlyOriented);
    }

    template<std::floating_point T>
    typename Plane<T>::Point2 Plane<T>::CalculateTextureCoordinates(const RayType& ray, T t) const {
        const Vector point = this->CalculateSurfaceIntersectionPoint(ray, t);
        const Vector n = glm::abs(m_surfaceNormal);

        // Eixos do plano de projeção: (y, z) se X domina, (z, x) se Y domina, senão (x, y).
        int axisU = 0;
        int axisV = 1;
        if (n.x > n.y && n.x > n.z) {
            axisU = 1;
            axisV = 2;
        } else if (n.y > n.z) {
            axisU = 2;
            axisV = 0;
        }

        const T aU = m_a[axisU];
        const T aV = m_a[axisV];
        const T bU = m_c[axisU] - aU;
        const T bV = m_c[axisV] - aV;
        const T cU = m_b[axisU] - aU;
        const T cV = m_b[axisV] - aV;

        const T determinantReciprocal = T(1) / (bU * cV - bV * cU);

        const T hU = point[axisU];
        const T hV = point[axisV];

        const T u = (hU * -bV + hV * bU + (bV * aU - bU * aV)) * determinantReciprocal;
        const T v = (hU * cV - hV * cU + (cU * aV - cV * aU)) * determinantReciprocal;

        return Point2(u, v);
    }

    template<std::floating_point T>
    AxisAlignedBox<T> Plane<T>::GetBounds() const {
        return AxisAlignedBox<T>(Vector(-std::numeric_limits<T>::infinity()), Vector(std::numeric_limits<T>::infinity()));
    }

    template class Plane<float>;
    template class Plane<double>;
} // namespace geo_kernel::shapes3D
