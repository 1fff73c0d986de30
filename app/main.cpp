#include <iostream>
#include <random>

#include <geo_kernel/core/debug.hpp>
#include <geo_kernel/shapes/shapeFactory.hpp>

namespace {
    using namespace geo_kernel;
    using ShapeList = std::vector<shapes3D::ShapeFactory<double>::ShapePtr>;

    constexpr int GRID_SIZE = 32;
    constexpr int SAMPLE_COUNT = 4096;

    ShapeList CreateDefaultScene() {
        const nlohmann::json scene = {
            { "shapes", {
                { { "type", "sphere" }, { "center", { 0.0, 0.0, 2.0 } }, { "radius", 1.0 } },
                { { "type", "box" }, { "min", { 1.5, -0.5, 1.0 } }, { "max", { 2.5, 0.5, 2.0 } } },
                { { "type", "triangle" }, { "vertices", {
                    { { "position", { -2.5, -1.0, 1.5 } } },
                    { { "position", { -1.5, -1.0, 1.5 } } },
                    { { "position", { -2.0,  1.0, 1.5 } } }
                } } },
                { { "type", "plane" }, { "a", { 0.0, -1.5, 0.0 } }, { "b", { 1.0, -1.5, 0.0 } }, { "c", { 0.0, -1.5, 1.0 } } }
            } }
        };

        return shapes3D::ShapeFactory<double>::CreateAll(scene);
    }

    // Raios primários paralelos a +z sobre o quadrado [-3, 3]^2 em z = -5.
    void CastPrimaryRays(const ShapeList& shapes) {
        std::vector<int> hits(shapes.size(), 0);
        int misses = 0;

        for (int y = 0; y < GRID_SIZE; ++y) {
            for (int x = 0; x < GRID_SIZE; ++x) {
                const double px = -3.0 + 6.0 * (x + 0.5) / GRID_SIZE;
                const double py = -3.0 + 6.0 * (y + 0.5) / GRID_SIZE;
                const physics3D::Ray3D ray({ px, py, -5.0 }, { 0.0, 0.0, 1.0 });

                std::size_t closestIndex = shapes.size();
                double closestT = std::numeric_limits<double>::infinity();

                for (std::size_t i = 0; i < shapes.size(); ++i) {
                    const double t = shapes[i]->IntersectionT(ray);
                    if (!std::isnan(t) && t < closestT) {
                        closestT = t;
                        closestIndex = i;
                    }
                }

                if (closestIndex == shapes.size())
                    ++misses;
                else
                    ++hits[closestIndex];
            }
        }

        for (std::size_t i = 0; i < shapes.size(); ++i)
            GK_LOG_INFO("[{}] {}: {} primary hits", i, shapes[i]->GetName(), hits[i]);
        GK_LOG_INFO("Misses: {}", misses);
    }

    // E[1 / pdf] estima o ângulo sólido que a forma ocupa visto do ponto de referência.
    void EstimateSolidAngles(const ShapeList& shapes) {
        const math::DVec3 referencePoint(0.0, 0.0, -5.0);
        const math::DVec3 referenceNormal(0.0, 0.0, 1.0);

        std::mt19937 generator(1234u);
        std::uniform_real_distribution<double> distribution(0.0, 1.0);

        for (std::size_t i = 0; i < shapes.size(); ++i) {
            double sum = 0.0;
            int accepted = 0;

            for (int s = 0; s < SAMPLE_COUNT; ++s) {
                const double u = distribution(generator);
                const double v = distribution(generator);

                const auto sample = shapes[i]->Sample(referencePoint, referenceNormal, u, v);
                if (!sample || !(sample->GetPdf() > 0.0))
                    continue;

                sum += 1.0 / sample->GetPdf();
                ++accepted;
            }

            if (accepted == 0) {
                GK_LOG_WARN("[{}] {} cannot be sampled", i, shapes[i]->GetName());
                continue;
            }

            // Amostras rejeitadas contam como zero na média.
            GK_LOG_SUCCESS("[{}] {}: solid angle ~ {:.5f} sr ({} of {} samples accepted)",
                           i, shapes[i]->GetName(), sum / SAMPLE_COUNT, accepted, SAMPLE_COUNT);
        }
    }
}

int main(int argc, char** argv) {
    using namespace geo_kernel;
    try {
        const ShapeList shapes = argc > 1
            ? shapes3D::ShapeFactory<double>::LoadFromFile(argv[1])
            : CreateDefaultScene();

        CastPrimaryRays(shapes);
        EstimateSolidAngles(shapes);
    } catch(const std::exception& e){
        std::cerr << "Exception: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
