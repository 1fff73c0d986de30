#include "geo_kernel/shapes/triangle.hpp"
#include "geo_kernel/shapes/axisAlignedBox.hpp"
#include "geo_kernel/core/sampling.hpp"

namespace geo_kernel::shapes3D {

    template<std::floating_point T>
    Triangle<T>::Triangle(const VertexType& a, const VertexType& b, const VertexType& c)
        : m_a(a), m_b(b), m_c(c)
        , m_faceNormal(glm::normalize(glm::cross(b.position - a.position, c.position - a.position))) {}

    template<std::floating_point T>
    T Triangle<T>::IntersectionT(const RayType& ray) const {
        const Vector edgeAB = m_b.position - m_a.position;
        const Vector edgeAC = m_c.position - m_a.position;

        const Vector v0 = glm::cross(ray.dir, edgeAC);
        const T determinant = glm::dot(edgeAB, v0);

        // Raio (quase) paralelo ao plano do triângulo.
        if (determinant > -math::Epsilon<T>() && determinant < math::Epsilon<T>())
            return math::NaN<T>();

        const T determinantReciprocal = T(1) / determinant;

        const Vector v1 = ray.origin - m_a.position;
        const T u = glm::dot(v1, v0) * determinantReciprocal;
        if (u < T(0) || u > T(1))
            return math::NaN<T>();

        const Vector v2 = glm::cross(v1, edgeAB);
        const T v = glm::dot(ray.dir, v2) * determinantReciprocal;
        if (v < T(0) || u + v > T(1))
            return math::NaN<T>();

        const T t = glm::dot(edgeAC, v2) * determinantReciprocal;
        if (t < math::Epsilon<T>())
            return math::NaN<T>();

        return t;
    }

    template<std::floating_point T>
    typename Triangle<T>::Vector Triangle<T>::CalculateBarycentricCoordinates(const RayType& ray, T t) const {
        const Vector edgeAB = m_b.position - m_a.position;
        const Vector edgeAC = m_c.position - m_a.position;
        const Vector edgeAP = this->CalculateSurfaceIntersectionPoint(ray, t) - m_a.position;

        const T d00 = glm::dot(edgeAB, edgeAB);
        const T d01 = glm::dot(edgeAB, edgeAC);
        const T d11 = glm::dot(edgeAC, edgeAC);
        const T d20 = glm::dot(edgeAP, edgeAB);
        const T d21 = glm::dot(edgeAP, edgeAC);

        const T denominator = d00 * d11 - d01 * d01;

        const T u = (d11 * d20 - d01 * d21) / denominator;
        const T v = (d00 * d21 - d01 * d20) / denominator;

        return Vector(u, v, T(1) - u - v);
    }

    template<std::floating_point T>
    typename Triangle<T>::Vector Triangle<T>::InterpolateNormal(T u, T v, T w) const {
        return glm::normalize(glm::normalize(m_a.normal) * w +
                              glm::normalize(m_b.normal) * u +
                              glm::normalize(m_c.normal) * v);
    }

    template<std::floating_point T>
    typename Triangle<T>::Vector Triangle<T>::CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented) const {
        const Vector barycentric = CalculateBarycentricCoordinates(ray, t);
        const Vector normal = InterpolateNormal(barycentric.x, barycentric.y, barycentric.z);

        return Shape<T>::OrientAgainst(normal, ray.dir, isCorrectlyOriented);
    }

    template<std::floating_point T>
    typename Triangle<T>::Point2 Triangle<T>::CalculateTextureCoordinates(const RayType& ray, T t) const {
        const Vector barycentric = CalculateBarycentricCoordinates(ray, t);

        return m_a.textureCoordinates * barycentric.z +
               m_b.textureCoordinates * barycentric.x +
               m_c.textureCoordinates * barycentric.y;
    }

    template<std::floating_point T>
    std::optional<SurfaceSample<T>> Triangle<T>::Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const {
        // b0 pondera A, b1 pondera B, b2 pondera C.
        const std::array<T, 3> b = sampling::SampleTriangleUniform(u, v);

        const Vector point = m_a.position * b[0] + m_b.position * b[1] + m_c.position * b[2];

        if (glm::length2(point - referencePoint) == T(0))
            return std::nullopt;

        // Normal geométrica no mesmo hemisfério da normal de shading.
        const Vector shadingNormal = InterpolateNormal(b[1], b[2], b[0]);
        const Vector surfaceNormal = glm::dot(m_faceNormal, shadingNormal) < T(0) ? -m_faceNormal : m_faceNormal;

        const T pdf = CalculateSolidAnglePdf(referencePoint, referenceSurfaceNormal, point, surfaceNormal);
        if (!std::isfinite(pdf))
            return std::nullopt;

        return SurfaceSample<T>(point, surfaceNormal, pdf);
    }

    template<std::floating_point T>
    T Triangle<T>::CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                          const Vector& point, const Vector& surfaceNormal) const {
        return sampling::ConvertAreaToSolidAnglePdf(this->GetSurfaceAreaPdf(), referencePoint, point, surfaceNormal);
    }

    template<std::floating_point T>
    T Triangle<T>::GetSurfaceArea() const {
        return glm::length(glm::cross(m_b.position - m_a.position, m_c.position - m_a.position)) * T(0.5);
    }

    template<std::floating_point T>
    AxisAlignedBox<T> Triangle<T>::GetBounds() const {
        return AxisAlignedBox<T>(glm::min(m_a.position, glm::min(m_b.position, m_c.position)),
                                 glm::max(m_a.position, glm::max(m_b.position, m_c.position)));
    }

    template<std::floating_point T>
    Triangle<T> Triangle<T>::Transform(const math::TMat4<T>& m) const {
        const math::TMat4<T> inverse = glm::inverse(m);

        const auto transform = [&](const VertexType& vertex) {
            return VertexType{
                vertex.textureCoordinates,
                math::TransformPoint(m, vertex.position),
                glm::normalize(math::TransformVectorTranspose(inverse, vertex.normal))
            };
        };

        return Triangle(transform(m_a), transform(m_b), transform(m_c));
    }

    template class Triangle<float>;
    template class Triangle<double>;
} // namespace geo_kernel::shapes3D
