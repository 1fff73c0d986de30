#pragma once

#include "geo_kernel/core/math.hpp"

namespace geo_kernel::geometry {

    /**
     * @class OrthonormalBasis
     * @brief Referencial ortonormal destro {u, v, w}; w é o eixo principal (em geral a normal da superfície).
     *
     * Usado para levar amostras de um cone/hemisfério local (+Z) para o espaço do mundo.
     * Não valida entradas paralelas ou nulas: o resultado nesses casos contém NaN.
     */
    template<std::floating_point T>
    class OrthonormalBasis {
    public:
        using Vector = math::TVec3<T>;
        using Matrix = math::TMat4<T>;

        /// Base canônica: w = +Z, v = +Y, u = +X.
        OrthonormalBasis();

        /// Constrói a partir do eixo principal; o companheiro vem do menor componente de w.
        explicit OrthonormalBasis(const Vector& w);

        /// Constrói a partir do eixo principal e de uma dica para v.
        OrthonormalBasis(const Vector& w, const Vector& v);

        /// Usa os três vetores como estão (sem normalizar).
        OrthonormalBasis(const Vector& w, const Vector& v, const Vector& u);

        /// Referencial de câmera: w aponta de lookAt para eye.
        static OrthonormalBasis FromLookAt(const Vector& eye, const Vector& lookAt, const Vector& up = Vector(T(0), T(1), T(0)));

        static OrthonormalBasis PositiveX() { return OrthonormalBasis(Vector(T(1), T(0), T(0))); }
        static OrthonormalBasis PositiveY() { return OrthonormalBasis(Vector(T(0), T(1), T(0))); }
        static OrthonormalBasis PositiveZ() { return OrthonormalBasis(Vector(T(0), T(0), T(1))); }
        static OrthonormalBasis NegativeX() { return OrthonormalBasis(Vector(T(-1), T(0), T(0))); }
        static OrthonormalBasis NegativeY() { return OrthonormalBasis(Vector(T(0), T(-1), T(0))); }
        static OrthonormalBasis NegativeZ() { return OrthonormalBasis(Vector(T(0), T(0), T(-1))); }

        const Vector& GetU() const { return m_u; }
        const Vector& GetV() const { return m_v; }
        const Vector& GetW() const { return m_w; }

        /// Local -> mundo: u * x + v * y + w * z.
        Vector ToWorld(const Vector& local) const { return m_u * local.x + m_v * local.y + m_w * local.z; }

        /// Mundo -> local: projeções em u, v e w.
        Vector ToLocal(const Vector& world) const {
            return Vector(glm::dot(world, m_u), glm::dot(world, m_v), glm::dot(world, m_w));
        }

        OrthonormalBasis FlipU() const { return OrthonormalBasis(m_w, m_v, -m_u); }
        OrthonormalBasis FlipV() const { return OrthonormalBasis(m_w, -m_v, m_u); }
        OrthonormalBasis FlipW() const { return OrthonormalBasis(-m_w, m_v, m_u); }

        OrthonormalBasis SwapUV() const { return OrthonormalBasis(m_w, m_u, m_v); }
        OrthonormalBasis SwapVW() const { return OrthonormalBasis(m_v, m_w, m_u); }
        OrthonormalBasis SwapWU() const { return OrthonormalBasis(m_u, m_v, m_w); }

        OrthonormalBasis Transform(const Matrix& m) const;
        OrthonormalBasis TransformTranspose(const Matrix& m) const;

        bool operator==(const OrthonormalBasis& other) const = default;

    private:
        Vector m_u;
        Vector m_v;
        Vector m_w;
    };

    extern template class OrthonormalBasis<float>;
    extern template class OrthonormalBasis<double>;
} // namespace geo_kernel::geometry
