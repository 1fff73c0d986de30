#pragma once

#include "geo_kernel/core/math.hpp"

#include <array>

// Distribuições usadas na amostragem de superfícies e direções.
// Todas recebem os números uniformes (u, v) em [0, 1) de fora, sem fonte aleatória própria.
namespace geo_kernel::sampling
{
    using geo_kernel::math::TVec2;
    using geo_kernel::math::TVec3;

    // Direção uniforme na esfera unitária.
    template <std::floating_point T>
    TVec3<T> SampleSphereUniform(T u, T v)
    {
        const T z = T(1) - T(2) * u;
        const T phi = math::TwoPi<T>() * v;
        const T r = std::sqrt(std::max(T(0), T(1) - z * z));

        return TVec3<T>(std::cos(phi) * r, std::sin(phi) * r, z);
    }

    // Direção uniforme no cone em torno de +Z com abertura cosThetaMax.
    template <std::floating_point T>
    TVec3<T> SampleConeUniform(T u, T v, T cosThetaMax)
    {
        const T cosTheta = u * (cosThetaMax - T(1)) + T(1);
        const T sinTheta = std::sqrt(std::max(T(0), T(1) - cosTheta * cosTheta));
        const T phi = math::TwoPi<T>() * v;

        return TVec3<T>(std::cos(phi) * sinTheta, std::sin(phi) * sinTheta, cosTheta);
    }

    template <std::floating_point T>
    T ConeUniformPdf(T cosThetaMax)
    {
        return cosThetaMax >= T(1) ? T(0) : T(1) / (math::TwoPi<T>() * (T(1) - cosThetaMax));
    }

    template <std::floating_point T>
    TVec3<T> SampleHemisphereUniform(T u, T v)
    {
        const T phi = math::TwoPi<T>() * v;
        const T r = std::sqrt(std::max(T(0), T(1) - u * u));

        return TVec3<T>(std::cos(phi) * r, std::sin(phi) * r, u);
    }

    template <std::floating_point T>
    TVec2<T> SampleDiskUniform(T u, T v)
    {
        const T phi = math::TwoPi<T>() * v;
        const T r = std::sqrt(u);

        return TVec2<T>(std::cos(phi) * r, std::sin(phi) * r);
    }

    // Mapeamento concêntrico de Shirley-Chiu: preserva estratificação.
    template <std::floating_point T>
    TVec2<T> SampleDiskConcentric(T u, T v, T radius = T(1))
    {
        const T a = u * T(2) - T(1);
        const T b = v * T(2) - T(1);

        if (a == T(0) && b == T(0))
            return TVec2<T>(T(0));

        const T quarterPi = math::Pi<T>() / T(4);
        const bool isAGreater = a * a > b * b;

        const T phi = isAGreater ? quarterPi * (b / a) : math::Pi<T>() / T(2) - quarterPi * (a / b);
        const T r = isAGreater ? radius * a : radius * b;

        return TVec2<T>(std::cos(phi) * r, std::sin(phi) * r);
    }

    template <std::floating_point T>
    TVec3<T> SampleHemisphereCosine(T u, T v)
    {
        const TVec2<T> p = SampleDiskConcentric(u, v);
        const T z = std::sqrt(std::max(T(0), T(1) - p.x * p.x - p.y * p.y));

        return TVec3<T>(p.x, p.y, z);
    }

    template <std::floating_point T>
    TVec3<T> SampleHemispherePowerCosine(T u, T v, T exponent = T(20))
    {
        const T z = std::pow(T(1) - u, T(1) / (exponent + T(1)));
        const T phi = math::TwoPi<T>() * v;
        const T r = std::sqrt(std::max(T(0), T(1) - z * z));

        return TVec3<T>(std::cos(phi) * r, std::sin(phi) * r, z);
    }

    /**
     * @brief Pesos baricêntricos uniformes em área (transformação da raiz quadrada).
     * @return {b0, b1, b2}, com b0 + b1 + b2 = 1.
     */
    template <std::floating_point T>
    std::array<T, 3> SampleTriangleUniform(T u, T v)
    {
        const T su = std::sqrt(u);
        const T b0 = T(1) - su;
        const T b1 = v * su;

        return { b0, b1, T(1) - b0 - b1 };
    }

    /**
     * @brief Converte uma PDF em medida de área para medida de ângulo sólido visto de referencePoint.
     *
     * pdfSolidAngle = pdfArea * dist^2 / |cos(theta)|, theta entre a direção de conexão e a normal.
     * Retorna infinito quando a conexão é rasante (cos = 0) ou NaN quando os pontos coincidem.
     */
    template <std::floating_point T>
    T ConvertAreaToSolidAnglePdf(T pdfArea, const TVec3<T>& referencePoint, const TVec3<T>& point, const TVec3<T>& normal)
    {
        const TVec3<T> toReference = referencePoint - point;
        const T distanceSquared = glm::dot(toReference, toReference);
        const T cosTheta = std::abs(glm::dot(glm::normalize(toReference), normal));

        return distanceSquared * pdfArea / cosTheta;
    }

    // --- Multiple importance sampling --- //
    template <std::floating_point T>
    T BalanceHeuristic(T pdfA, T pdfB, int sampleCountA = 1, int sampleCountB = 1)
    {
        const T a = static_cast<T>(sampleCountA) * pdfA;
        const T b = static_cast<T>(sampleCountB) * pdfB;
        return a / (a + b);
    }

    template <std::floating_point T>
    T PowerHeuristic(T pdfA, T pdfB, int sampleCountA = 1, int sampleCountB = 1)
    {
        const T a = static_cast<T>(sampleCountA) * pdfA;
        const T b = static_cast<T>(sampleCountB) * pdfB;
        return (a * a) / (a * a + b * b);
    }
} // namespace geo_kernel::sampling
