#include "geo_kernel/shapes/axisAlignedBox.hpp"
#include "geo_kernel/core/sampling.hpp"

#include <array>

namespace geo_kernel::shapes3D {

    namespace {
        template<typename Face>
        Face NegativeFace(int axis) { return static_cast<Face>(1 + 2 * axis); }

        template<typename Face>
        Face PositiveFace(int axis) { return static_cast<Face>(2 + 2 * axis); }

        template<typename Face>
        int FaceAxis(Face face) { return (static_cast<int>(face) - 1) / 2; }
    }

    template<std::floating_point T>
    AxisAlignedBox<T>::AxisAlignedBox()
        : AxisAlignedBox(Vector(T(-0.5)), Vector(T(0.5))) {}

    template<std::floating_point T>
    AxisAlignedBox<T>::AxisAlignedBox(const Vector& a, const Vector& b)
        : m_min(glm::min(a, b)), m_max(glm::max(a, b)) {}

    template<std::floating_point T>
    typename AxisAlignedBox<T>::Vector AxisAlignedBox<T>::GetFaceNormal(Face face) {
        if (face == Face::None)
            return Vector(T(0));

        Vector normal(T(0));
        normal[FaceAxis(face)] = static_cast<int>(face) % 2 == 0 ? T(1) : T(-1);
        return normal;
    }

    template<std::floating_point T>
    typename AxisAlignedBox<T>::Face AxisAlignedBox<T>::CalculateFace(const Vector& point) const {
        const Vector center = Center();
        const Vector extents = Extents();

        Face face = Face::None;
        T bestRatio = -std::numeric_limits<T>::infinity();

        for (int i = 0; i < 3; ++i) {
            const T offset = point[i] - center[i];
            const T ratio = std::abs(offset) / extents[i];

            // NaN (eixo degenerado com offset zero) nunca vence a comparação
            if (ratio > bestRatio) {
                bestRatio = ratio;
                face = offset < T(0) ? NegativeFace<Face>(i) : PositiveFace<Face>(i);
            }
        }

        return face;
    }

    template<std::floating_point T>
    std::optional<typename AxisAlignedBox<T>::SlabHit> AxisAlignedBox<T>::IntersectSlabs(const RayType& ray) const {
        T tMin = -std::numeric_limits<T>::infinity();
        T tMax = std::numeric_limits<T>::infinity();
        Face faceIn = Face::None;
        Face faceOut = Face::None;

        for (int i = 0; i < 3; ++i) {
            // Recíproco: o sinal escolhe o plano "perto" sem ramificar no sinal da direção (+-0 vira +-inf).
            const T reciprocal = T(1) / ray.dir[i];
            const T t0 = (m_min[i] - ray.origin[i]) * reciprocal;
            const T t1 = (m_max[i] - ray.origin[i]) * reciprocal;

            // 0 * inf: raio contido no plano de uma face. Tratado como erro, não como acerto.
            if (std::isnan(t0) || std::isnan(t1))
                return std::nullopt;

            const bool forward = reciprocal >= T(0);
            const T tNear = forward ? t0 : t1;
            const T tFar = forward ? t1 : t0;

            if (tNear > tMin) {
                tMin = tNear;
                faceIn = forward ? NegativeFace<Face>(i) : PositiveFace<Face>(i);
            }

            if (tFar < tMax) {
                tMax = tFar;
                faceOut = forward ? PositiveFace<Face>(i) : NegativeFace<Face>(i);
            }

            if (tMin > tMax)
                return std::nullopt;
        }

        if (tMin > math::Epsilon<T>())
            return SlabHit{ tMin, faceIn };

        // Origem dentro da caixa (ou sobre a face de entrada): o acerto visível é a saída.
        if (tMax > math::Epsilon<T>())
            return SlabHit{ tMax, faceOut };

        return std::nullopt;
    }

    template<std::floating_point T>
    T AxisAlignedBox<T>::IntersectionT(const RayType& ray) const {
        const auto hit = IntersectSlabs(ray);
        return hit ? hit->t : math::NaN<T>();
    }

    template<std::floating_point T>
    std::optional<Intersection<T>> AxisAlignedBox<T>::Intersect(const RayType& ray) const {
        const auto hit = IntersectSlabs(ray);
        if (!hit)
            return std::nullopt;

        const T t = hit->t;
        const Face face = hit->face;

        return std::optional<Intersection<T>>(std::in_place, ray, *this, t,
            [ray, face] { return geometry::OrthonormalBasis<T>(Shape<T>::OrientAgainst(GetFaceNormal(face), ray.dir, true)); },
            [this, ray, t, face] { return CalculateFaceTextureCoordinates(ray.GetPoint(t), face); },
            [ray, t] { return ray.GetPoint(t); },
            [ray, face] { return Shape<T>::OrientAgainst(GetFaceNormal(face), ray.dir, true); });
    }

    template<std::floating_point T>
    typename AxisAlignedBox<T>::Vector AxisAlignedBox<T>::CalculateSurfaceNormal(const RayType& ray, T t, bool isCorrectlyOriented) const {
        const Vector normal = GetFaceNormal(CalculateFace(this->CalculateSurfaceIntersectionPoint(ray, t)));
        return Shape<T>::OrientAgainst(normal, ray.dir, isCorrectlyOriented);
    }

    template<std::floating_point T>
    typename AxisAlignedBox<T>::Point2 AxisAlignedBox<T>::CalculateTextureCoordinates(const RayType& ray, T t) const {
        const Vector point = this->CalculateSurfaceIntersectionPoint(ray, t);
        return CalculateFaceTextureCoordinates(point, CalculateFace(point));
    }

    template<std::floating_point T>
    typename AxisAlignedBox<T>::Point2 AxisAlignedBox<T>::CalculateFaceTextureCoordinates(const Vector& point, Face face) const {
        const auto coordinate = [&](int axis) {
            return math::NormalizeRange(point[axis], m_min[axis], m_max[axis]);
        };

        switch (face) {
            case Face::NegativeX:
            case Face::PositiveX:
                return Point2(coordinate(2), coordinate(1));
            case Face::NegativeY:
            case Face::PositiveY:
                return Point2(coordinate(0), coordinate(2));
            case Face::NegativeZ:
            case Face::PositiveZ:
                return Point2(coordinate(0), coordinate(1));
            case Face::None:
                break;
        }

        return Point2(T(0.5));
    }

    template<std::floating_point T>
    std::optional<SurfaceSample<T>> AxisAlignedBox<T>::Sample(const Vector& referencePoint, const Vector& referenceSurfaceNormal, T u, T v) const {
        const Vector size = Size();
        const std::array<T, 3> faceAreas = { size.y * size.z, size.x * size.z, size.x * size.y };
        const T surfaceArea = GetSurfaceArea();

        if (!(surfaceArea > T(0)))
            return std::nullopt;

        // Escolhe a face proporcionalmente à área e reaproveita o resto de u dentro dela.
        T remaining = u * surfaceArea;
        int chosen = 5;
        for (int i = 0; i < 6; ++i) {
            const T area = faceAreas[i / 2];
            if (remaining < area) {
                chosen = i;
                break;
            }
            remaining -= area;
        }

        const int axis = chosen / 2;
        const T area = faceAreas[axis];
        const T faceU = area > T(0) ? math::Clamp(remaining / area, T(0), T(1)) : T(0);

        const int axisA = (axis + 1) % 3;
        const int axisB = (axis + 2) % 3;

        Vector point;
        point[axis] = chosen % 2 == 0 ? m_min[axis] : m_max[axis];
        point[axisA] = math::Lerp(m_min[axisA], m_max[axisA], faceU);
        point[axisB] = math::Lerp(m_min[axisB], m_max[axisB], v);

        const Vector normal = GetFaceNormal(chosen % 2 == 0 ? NegativeFace<Face>(axis) : PositiveFace<Face>(axis));

        const T pdf = sampling::ConvertAreaToSolidAnglePdf(T(1) / surfaceArea, referencePoint, point, normal);
        if (!std::isfinite(pdf))
            return std::nullopt;

        return SurfaceSample<T>(point, normal, pdf);
    }

    template<std::floating_point T>
    T AxisAlignedBox<T>::CalculateSolidAnglePdf(const Vector& referencePoint, const Vector& referenceSurfaceNormal,
                                                const Vector& point, const Vector& surfaceNormal) const {
        return sampling::ConvertAreaToSolidAnglePdf(this->GetSurfaceAreaPdf(), referencePoint, point, surfaceNormal);
    }

    template<std::floating_point T>
    T AxisAlignedBox<T>::GetSurfaceArea() const {
        const Vector size = Size();
        return T(2) * (size.x * size.y + size.y * size.z + size.z * size.x);
    }

    template<std::floating_point T>
    T AxisAlignedBox<T>::GetVolume() const {
        const Vector size = Size();
        return size.x * size.y * size.z;
    }

    template<std::floating_point T>
    AxisAlignedBox<T> AxisAlignedBox<T>::Transform(const math::TMat4<T>& m) const {
        Vector minimum(std::numeric_limits<T>::infinity());
        Vector maximum(-std::numeric_limits<T>::infinity());

        for (int corner = 0; corner < 8; ++corner) {
            const Vector p((corner & 1) ? m_max.x : m_min.x,
                           (corner & 2) ? m_max.y : m_min.y,
                           (corner & 4) ? m_max.z : m_min.z);
            const Vector transformed = math::TransformPoint(m, p);

            minimum = glm::min(minimum, transformed);
            maximum = glm::max(maximum, transformed);
        }

        return AxisAlignedBox(minimum, maximum);
    }

    template class AxisAlignedBox<float>;
    template class AxisAlignedBox<double>;
} // namespace geo_kernel::shapes3D
