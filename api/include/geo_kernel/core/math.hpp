#pragma once

#ifndef GLM_ENABLE_EXPERIMENTAL
#define GLM_ENABLE_EXPERIMENTAL
#endif
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/norm.hpp>
#include <glm/gtx/compatibility.hpp>
#include <glm/gtc/constants.hpp>

#include <concepts>
#include <cmath>
#include <limits>
#include <utility>
#include <algorithm>

namespace geo_kernel::math
{
    // --- Typedefs --- //
    template <std::floating_point T> using TVec2 = glm::vec<2, T, glm::defaultp>;
    template <std::floating_point T> using TVec3 = glm::vec<3, T, glm::defaultp>;
    template <std::floating_point T> using TVec4 = glm::vec<4, T, glm::defaultp>;
    template <std::floating_point T> using TMat3 = glm::mat<3, 3, T, glm::defaultp>;
    template <std::floating_point T> using TMat4 = glm::mat<4, 4, T, glm::defaultp>;

    using Vec2 = glm::vec2;
    using Vec3 = glm::vec3;

    using DVec2 = glm::dvec2;
    using DVec3 = glm::dvec3;

    using Mat4 = glm::mat4;
    using DMat4 = glm::dmat4;

    // --- Constantes matemáticas --- //
    template <std::floating_point T> constexpr T Pi() { return glm::pi<T>(); }
    template <std::floating_point T> constexpr T TwoPi() { return glm::two_pi<T>(); }

    // Guarda contra auto-interseção (acne) usada por todas as formas.
    template <std::floating_point T> constexpr T Epsilon() { return static_cast<T>(0.0001); }

    template <std::floating_point T> constexpr T NaN() { return std::numeric_limits<T>::quiet_NaN(); }

    // --- Clamp, Lerp --- //
    template <std::floating_point T>
    constexpr T Clamp(T v, T min, T max) { return std::clamp(v, min, max); }

    template <std::floating_point T>
    constexpr T Lerp(T a, T b, T t) { return glm::lerp(a, b, t); }

    // Mapeia value de [min, max] para [0, 1] (sem clamp).
    template <std::floating_point T>
    constexpr T NormalizeRange(T value, T min, T max)
    {
        return (value - min) / (max - min);
    }

    /**
     * @brief Resolve a*t^2 + b*t + c = 0 para raízes reais.
     *
     * Usa a forma q = -0.5 * (b + sign(b) * sqrt(disc)) para evitar cancelamento catastrófico.
     *
     * @return Par (t0, t1) com t0 <= t1, ou (NaN, NaN) quando o discriminante é negativo.
     */
    template <std::floating_point T>
    std::pair<T, T> SolveQuadratic(T a, T b, T c)
    {
        const T discriminant = b * b - static_cast<T>(4) * a * c;

        if (discriminant < T(0))
            return { NaN<T>(), NaN<T>() };

        const T root = std::sqrt(discriminant);
        const T q = b < T(0) ? static_cast<T>(-0.5) * (b - root) : static_cast<T>(-0.5) * (b + root);

        T t0 = q / a;
        T t1 = c / q;

        // b == 0 e c == 0 geram 0/0 em t1
        if (std::isnan(t1)) t1 = t0;

        if (t0 > t1) std::swap(t0, t1);
        return { t0, t1 };
    }

    // --- Transformações por matriz 4x4 --- //
    template <std::floating_point T>
    TVec3<T> TransformPoint(const TMat4<T>& m, const TVec3<T>& p)
    {
        return TVec3<T>(m * TVec4<T>(p, T(1)));
    }

    template <std::floating_point T>
    TVec3<T> TransformVector(const TMat4<T>& m, const TVec3<T>& v)
    {
        return TMat3<T>(m) * v;
    }

    // Multiplica pela transposta da parte 3x3 (usado com a inversa para transformar normais).
    template <std::floating_point T>
    TVec3<T> TransformVectorTranspose(const TMat4<T>& m, const TVec3<T>& v)
    {
        return glm::transpose(TMat3<T>(m)) * v;
    }
} // namespace geo_kernel::math
