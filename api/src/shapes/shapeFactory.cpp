#include "geo_kernel/shapes/shapeFactory.hpp"
#include "geo_kernel/core/debug.hpp"

#include <array>
#include <fstream>

namespace geo_kernel::shapes3D {

    template<std::floating_point T>
    Triangle<T> ShapeFactory<T>::CreateTriangle(const nlohmann::json& description) {
        const nlohmann::json& vertices = description.at("vertices");
        if (!vertices.is_array() || vertices.size() != 3)
            GK_LOG_THROW("Triangle requires exactly 3 vertices, got {}", vertices.dump());

        const std::array<math::TVec2<T>, 3> defaultTextureCoordinates = {
            math::TVec2<T>(T(0), T(0)), math::TVec2<T>(T(1), T(0)), math::TVec2<T>(T(0), T(1))
        };

        std::array<Vertex<T>, 3> parsed;
        for (std::size_t i = 0; i < 3; ++i) {
            parsed[i].textureCoordinates = defaultTextureCoordinates[i];
            vertices[i].get_to(parsed[i]);
        }

        // Vértice sem normal usa a normal da face.
        const math::TVec3<T> faceNormal = glm::normalize(glm::cross(parsed[1].position - parsed[0].position,
                                                                    parsed[2].position - parsed[0].position));
        for (std::size_t i = 0; i < 3; ++i) {
            if (!vertices[i].contains("normal"))
                parsed[i].normal = faceNormal;
        }

        return Triangle<T>(parsed[0], parsed[1], parsed[2]);
    }

    template<std::floating_point T>
    typename ShapeFactory<T>::ShapePtr ShapeFactory<T>::Create(const nlohmann::json& description) {
        if (!description.is_object() || !description.contains("type"))
            GK_LOG_THROW("Shape description must be an object with a \"type\" field: {}", description.dump());

        const std::string type = description.at("type").is_string() ? description.at("type").get<std::string>() : description.at("type").dump();

        try {
            if (type == "sphere") {
                return std::make_unique<Sphere<T>>(description.at("center").get<math::TVec3<T>>(),
                                                   description.at("radius").get<T>());
            }

            if (type == "box") {
                return std::make_unique<AxisAlignedBox<T>>(description.at("min").get<math::TVec3<T>>(),
                                                           description.at("max").get<math::TVec3<T>>());
            }

            if (type == "plane") {
                return std::make_unique<Plane<T>>(description.at("a").get<math::TVec3<T>>(),
                                                  description.at("b").get<math::TVec3<T>>(),
                                                  description.at("c").get<math::TVec3<T>>());
            }

            if (type == "triangle")
                return std::make_unique<Triangle<T>>(CreateTriangle(description));

            if (type == "mesh") {
                std::vector<Triangle<T>> triangles;
                for (const auto& entry : description.at("triangles"))
                    triangles.push_back(CreateTriangle(entry));

                return std::make_unique<TriangleMesh<T>>(std::move(triangles));
            }
        } catch (const nlohmann::json::exception& e) {
            GK_LOG_THROW("Malformed '{}' description: {}", type, e.what());
        }

        GK_LOG_THROW("Unknown shape type '{}'", type);
    }

    template<std::floating_point T>
    std::vector<typename ShapeFactory<T>::ShapePtr> ShapeFactory<T>::CreateAll(const nlohmann::json& scene) {
        if (!scene.is_object() || !scene.contains("shapes") || !scene.at("shapes").is_array())
            GK_LOG_THROW("Scene must be an object with a \"shapes\" array");

        std::vector<ShapePtr> shapes;
        shapes.reserve(scene.at("shapes").size());

        for (const auto& description : scene.at("shapes"))
            shapes.push_back(Create(description));

        GK_LOG_INFO("Created {} shapes", shapes.size());
        return shapes;
    }

    template<std::floating_point T>
    std::vector<typename ShapeFactory<T>::ShapePtr> ShapeFactory<T>::LoadFromFile(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            GK_LOG_THROW("Failed to open scene file: {}", path.string());

        nlohmann::json scene;
        try {
            scene = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            GK_LOG_THROW("Failed to parse scene file {}: {}", path.string(), e.what());
        }

        GK_LOG_INFO("Loading scene: {}", path.string());
        return CreateAll(scene);
    }

    template<std::floating_point T>
    nlohmann::json ShapeFactory<T>::Serialize(const Shape<T>& shape) {
        if (const auto* sphere = dynamic_cast<const Sphere<T>*>(&shape))
            return *sphere;
        if (const auto* box = dynamic_cast<const AxisAlignedBox<T>*>(&shape))
            return *box;
        if (const auto* plane = dynamic_cast<const Plane<T>*>(&shape))
            return *plane;
        if (const auto* triangle = dynamic_cast<const Triangle<T>*>(&shape))
            return *triangle;
        if (const auto* mesh = dynamic_cast<const TriangleMesh<T>*>(&shape))
            return *mesh;

        GK_LOG_THROW("Cannot serialize shape '{}'", shape.GetName());
    }

    template class ShapeFactory<float>;
    template class ShapeFactory<double>;
} // namespace geo_kernel::shapes3D
