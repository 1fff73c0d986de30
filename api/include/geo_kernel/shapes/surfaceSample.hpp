#pragma once

#include "geo_kernel/core/math.hpp"

namespace geo_kernel::shapes3D {

    /**
     * @brief Ponto amostrado em uma superfície, com a normal e o valor da PDF.
     *
     * A PDF é um escalar invariante ao referencial: as transformações só mudam ponto e normal.
     */
    template<std::floating_point T>
    class SurfaceSample {
    public:
        using Vector = math::TVec3<T>;
        using Matrix = math::TMat4<T>;

        SurfaceSample(const Vector& point, const Vector& normal, T pdf)
            : m_point(point), m_normal(normal), m_pdf(pdf) {}

        const Vector& GetPoint() const { return m_point; }
        const Vector& GetNormal() const { return m_normal; }
        T GetPdf() const { return m_pdf; }

        // Normais usam a transposta da inversa: a matriz inversa do par é passada para TransformVectorTranspose.
        SurfaceSample TransformToObjectSpace(const Matrix& objectToWorld, const Matrix& worldToObject) const {
            return SurfaceSample(math::TransformPoint(worldToObject, m_point),
                                 glm::normalize(math::TransformVectorTranspose(objectToWorld, m_normal)),
                                 m_pdf);
        }

        SurfaceSample TransformToWorldSpace(const Matrix& objectToWorld, const Matrix& worldToObject) const {
            return SurfaceSample(math::TransformPoint(objectToWorld, m_point),
                                 glm::normalize(math::TransformVectorTranspose(worldToObject, m_normal)),
                                 m_pdf);
        }

        bool operator==(const SurfaceSample& other) const = default;

    private:
        Vector m_point;
        Vector m_normal;
        T m_pdf;
    };
} // namespace geo_kernel::shapes3D
