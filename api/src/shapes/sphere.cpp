#include "geo_kernel/shapes/sphere.hpp"
#include "geo_kernel/shapes/axisAlignedBox.hpp"
#include "geo_kernel/core/sampling.hpp"

namespace geo_kernel::shapes3D {

    template<std::floating_point T>
    T Sphere<T>::IntersectionT(const RayType& ray) const {
        const Vector centerToOrigin = ray.origin - m_center;

        const T a = glm::dot(ray.dir, ray.dir);
        const T b = T(2) * glm::dot(centerToOrigin, ray.dir);
        const T c = glm::dot(centerToOrigin, centerToOrigin) - GetRadiusSquared();

        const auto [t0, t1] = math::SolveQuadratic(a, b, c);

        // Menor raiz acima de epsilon; raízes perto de zero são a própria superfície de origem (acne).
        if (t0 > math::Epsilon<T>())
            return t0;
        if (t1 > math::Epsilon<T>())
            return t1;

        return math::NaN<T>();
    }

    template<std::floating_point T>
    typename Sphere<T>::Vector Sphere<T>::CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented) const {
        const Vector normal = glm::normalize(this->CalculateSurfaceIntersectionPoint(ray, t) - m_center);
        return Shape<T>::OrientAgainst(normal, ray.dir, isCorrectlyOriented);
    }

    template<std::floating_point T>
    typename Sphere<T>::Point2 Sphere<T>::CalculateTextureCoordinates(const RayType& ray, T t) const {
        const Vector n = CalculateSurfaceNormal(ray, t, false);

        const T u = T(0.5) + std::atan2(n.z, n.x) / math::TwoPi<T>();
        const T v = T(0.5) - std::asin(math::Clamp(n.y, T(-1), T(1))) / math::Pi<T>();

        return Point2(u, v);
    }

    template<std::floating_point T>
    bool Sphere<T>::IsInsideSamplingRegion(const Vector& referencePoint) const {
        return glm::length2(m_center - referencePoint) < GetRadiusSquared() * INSIDE_FACTOR;
    }

    template<std::floating_point T>
    std::optional<SurfaceSample<T>> Sphere<T>::Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const {
        const Vector directionToCenter = m_center - referencePoint;

        // Dentro (ou quase): amostra a esfera inteira e converte a PDF de área para ângulo sólido.
        if (IsInsideSamplingRegion(referencePoint)) {
            const Vector surfaceNormal = sampling::SampleSphereUniform(u, v);
            const Vector point = m_center + surfaceNormal * m_radius;

            const T pdf = sampling::ConvertAreaToSolidAnglePdf(this->GetSurfaceAreaPdf(), referencePoint, point, surfaceNormal);

            return SurfaceSample<T>(point, surfaceNormal, pdf);
        }

        // Fora: amostra uniformemente o cone de direções que enxerga a esfera.
        const T sinThetaMaxSquared = GetRadiusSquared() / glm::length2(directionToCenter);
        const T cosThetaMax = std::sqrt(std::max(T(0), T(1) - sinThetaMaxSquared));

        const geometry::OrthonormalBasis<T> basis(directionToCenter);

        const Vector coneLocal = sampling::SampleConeUniform(u, v, cosThetaMax);
        const Vector coneWorld = glm::normalize(basis.ToWorld(coneLocal));

        const RayType ray(referencePoint, coneWorld);

        // Direções rasantes podem não acertar numericamente: projeta no ponto tangente.
        T t = IntersectionT(ray);
        if (std::isnan(t))
            t = glm::dot(directionToCenter, coneWorld);

        const Vector point = ray.GetPoint(t);
        const Vector surfaceNormal = glm::normalize(point - m_center);

        return SurfaceSample<T>(point, surfaceNormal, sampling::ConeUniformPdf(cosThetaMax));
    }

    template<std::floating_point T>
    T Sphere<T>::CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                        const Vector& point, const Vector& surfaceNormal) const {
        if (IsInsideSamplingRegion(referencePoint))
            return sampling::ConvertAreaToSolidAnglePdf(this->GetSurfaceAreaPdf(), referencePoint, point, surfaceNormal);

        const T sinThetaMaxSquared = GetRadiusSquared() / glm::length2(m_center - referencePoint);
        const T cosThetaMax = std::sqrt(std::max(T(0), T(1) - sinThetaMaxSquared));

        return sampling::ConeUniformPdf(cosThetaMax);
    }

    template<std::floating_point T>
    T Sphere<T>::GetSurfaceArea() const {
        return T(4) * math::Pi<T>() * GetRadiusSquared();
    }

    template<std::floating_point T>
    T Sphere<T>::GetVolume() const {
        return T(4) / T(3) * math::Pi<T>() * m_radius * m_radius * m_radius;
    }

    template<std::floating_point T>
    AxisAlignedBox<T> Sphere<T>::GetBounds() const {
        return AxisAlignedBox<T>(GetMinimum(), GetMaximum());
    }

    template<std::floating_point T>
    typename Sphere<T>::Vector Sphere<T>::GetClosestPointTo(const Vector& p) const {
        const Vector direction = glm::normalize(p - m_center);
        const Vector surfacePoint = m_center + direction * m_radius;

        // p interno: ele mesmo é o ponto mais próximo. p == centro gera NaN e também cai aqui.
        return glm::length2(surfacePoint - m_center) <= glm::length2(p - m_center) ? surfacePoint : p;
    }

    template<std::floating_point T>
    bool Sphere<T>::Contains(const Vector& p) const {
        return glm::length2(p - m_center) < GetRadiusSquared();
    }

    template<std::floating_point T>
    Sphere<T> Sphere<T>::Transform(const math::TMat4<T>& m) const {
        return Sphere(math::TransformPoint(m, m_center), m_radius);
    }

    template class Sphere<float>;
    template class Sphere<double>;
} // namespace geo_kernel::shapes3D
