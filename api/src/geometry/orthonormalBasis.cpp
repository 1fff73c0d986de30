#include "geo_kernel/geometry/orthonormalBasis.hpp"

namespace geo_kernel::geometry {

    namespace {
        // Escolhe um vetor ortogonal a w a partir do eixo onde |w| tem o menor componente,
        // evitando um produto vetorial quase paralelo.
        template<std::floating_point T>
        math::TVec3<T> CalculateCompanion(const math::TVec3<T>& w) {
            const T absX = std::abs(w.x);
            const T absY = std::abs(w.y);
            const T absZ = std::abs(w.z);

            math::TVec3<T> v;
            if (absX < absY && absX < absZ)
                v = math::TVec3<T>(T(0), w.z, -w.y);
            else if (absY < absZ)
                v = math::TVec3<T>(w.z, T(0), -w.x);
            else
                v = math::TVec3<T>(w.y, -w.x, T(0));

            return glm::normalize(v);
        }
    }

    template<std::floating_point T>
    OrthonormalBasis<T>::OrthonormalBasis()
        : m_u(T(1), T(0), T(0)), m_v(T(0), T(1), T(0)), m_w(T(0), T(0), T(1)) {}

    template<std::floating_point T>
    OrthonormalBasis<T>::OrthonormalBasis(const Vector& w)
        : m_w(glm::normalize(w)) {
        m_v = CalculateCompanion(m_w);
        m_u = glm::cross(m_v, m_w);
    }

    template<std::floating_point T>
    OrthonormalBasis<T>::OrthonormalBasis(const Vector& w, const Vector& v)
        : m_w(glm::normalize(w)) {
        m_u = glm::normalize(glm::cross(v, m_w));
        m_v = glm::cross(m_w, m_u);
    }

    template<std::floating_point T>
    OrthonormalBasis<T>::OrthonormalBasis(const Vector& w, const Vector& v, const Vector& u)
        : m_u(u), m_v(v), m_w(w) {}

    template<std::floating_point T>
    OrthonormalBasis<T> OrthonormalBasis<T>::FromLookAt(const Vector& eye, const Vector& lookAt, const Vector& up) {
        return OrthonormalBasis(eye - lookAt, up);
    }

    template<std::floating_point T>
    OrthonormalBasis<T> OrthonormalBasis<T>::Transform(const Matrix& m) const {
        return OrthonormalBasis(math::TransformVector(m, m_w), math::TransformVector(m, m_v), math::TransformVector(m, m_u));
    }

    template<std::floating_point T>
    OrthonormalBasis<T> OrthonormalBasis<T>::TransformTranspose(const Matrix& m) const {
        return OrthonormalBasis(math::TransformVectorTranspose(m, m_w),
                                math::TransformVectorTranspose(m, m_v),
                                math::TransformVectorTranspose(m, m_u));
    }

    template class OrthonormalBasis<float>;
    template class OrthonormalBasis<double>;
} // namespace geo_kernel::geometry
