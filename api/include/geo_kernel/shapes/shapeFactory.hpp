#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "geo_kernel/core/serialization.hpp"
#include "geo_kernel/shapes/axisAlignedBox.hpp"
#include "geo_kernel/shapes/plane.hpp"
#include "geo_kernel/shapes/shape.hpp"
#include "geo_kernel/shapes/sphere.hpp"
#include "geo_kernel/shapes/surfaceSample.hpp"
#include "geo_kernel/shapes/triangle.hpp"
#include "geo_kernel/shapes/triangleMesh.hpp"

namespace geo_kernel::shapes3D {

    // --------------------------
    // JSON dos tipos de valor
    // --------------------------
    template<std::floating_point T>
    void to_json(nlohmann::json& j, const Vertex<T>& vertex) {
        j = nlohmann::json{
            { "position", vertex.position },
            { "normal", vertex.normal },
            { "uv", vertex.textureCoordinates }
        };
    }

    // Campos ausentes mantêm o valor atual; ShapeFactory decide os padrões.
    template<std::floating_point T>
    void from_json(const nlohmann::json& j, Vertex<T>& vertex) {
        j.at("position").get_to(vertex.position);
        if (j.contains("normal"))
            j.at("normal").get_to(vertex.normal);
        if (j.contains("uv"))
            j.at("uv").get_to(vertex.textureCoordinates);
    }

    template<std::floating_point T>
    void to_json(nlohmann::json& j, const SurfaceSample<T>& sample) {
        j = nlohmann::json{ { "point", sample.GetPoint() }, { "normal", sample.GetNormal() }, { "pdf", sample.GetPdf() } };
    }

    template<std::floating_point T>
    void to_json(nlohmann::json& j, const Sphere<T>& sphere) {
        j = nlohmann::json{ { "type", sphere.GetName() }, { "center", sphere.GetCenter() }, { "radius", sphere.GetRadius() } };
    }

    template<std::floating_point T>
    void to_json(nlohmann::json& j, const AxisAlignedBox<T>& box) {
        j = nlohmann::json{ { "type", box.GetName() }, { "min", box.GetMinimum() }, { "max", box.GetMaximum() } };
    }

    template<std::floating_point T>
    void to_json(nlohmann::json& j, const Plane<T>& plane) {
        j = nlohmann::json{ { "type", plane.GetName() }, { "a", plane.GetA() }, { "b", plane.GetB() }, { "c", plane.GetC() } };
    }

    template<std::floating_point T>
    void to_json(nlohmann::json& j, const Triangle<T>& triangle) {
        j = nlohmann::json{
            { "type", triangle.GetName() },
            { "vertices", nlohmann::json::array({ triangle.GetA(), triangle.GetB(), triangle.GetC() }) }
        };
    }

    template<std::floating_point T>
    void to_json(nlohmann::json& j, const TriangleMesh<T>& mesh) {
        nlohmann::json triangles = nlohmann::json::array();
        for (const auto& triangle : mesh.GetTriangles())
            triangles.push_back(nlohmann::json{ { "vertices", nlohmann::json(triangle).at("vertices") } });

        j = nlohmann::json{ { "type", mesh.GetName() }, { "triangles", std::move(triangles) } };
    }

    /**
     * @class ShapeFactory
     * @brief Cria formas a partir de descrições JSON.
     *
     * Formato: { "shapes": [ { "type": "sphere" | "box" | "plane" | "triangle" | "mesh", ... } ] }
     * Erros de formato, tipo desconhecido ou arquivo ilegível são logados e lançados como std::runtime_error.
     */
    template<std::floating_point T>
    class ShapeFactory {
    public:
        using ShapePtr = std::unique_ptr<Shape<T>>;

        /// Cria uma forma a partir de um objeto { "type": ..., ... }.
        static ShapePtr Create(const nlohmann::json& description);

        /// Cria todas as formas do array "shapes".
        static std::vector<ShapePtr> CreateAll(const nlohmann::json& scene);

        static std::vector<ShapePtr> LoadFromFile(const std::filesystem::path& path);

        /// Inverso de Create() para as formas conhecidas.
        static nlohmann::json Serialize(const Shape<T>& shape);

    private:
        static Triangle<T> CreateTriangle(const nlohmann::json& description);
    };

    extern template class ShapeFactory<float>;
    extern template class ShapeFactory<double>;
} // namespace geo_kernel::shapes3D
