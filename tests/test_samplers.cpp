#include <gtest/gtest.h>

#include <vector>

#include "../src/element_samplers.h"
#include "test_meshes.h"

namespace {

double linear_field(const glm::dvec3 &p) {
    return 1.0 + 2.0 * p.x - 3.0 * p.y + 0.5 * p.z;
}

std::vector<double> sample_field(const std::vector<glm::dvec3> &vertices) {
    std::vector<double> values;
    for (const glm::dvec3 &v : vertices) {
        values.push_back(linear_field(v));
    }
    return values;
}

} // namespace

TEST(Q1SamplerTest, InterpolatesTrilinearly) {
    const ElementSampler &sampler = get_sampler(ElementType::HEX);
    std::vector<glm::dvec3> vertices = unit_cube_vertices();
    double field[8] = {0, 1, 2, 3, 4, 5, 6, 7};

    EXPECT_NEAR(sampler.sample(vertices.data(), field, {0.5, 0.5, 0.0}), 1.5, 1e-12);
    EXPECT_NEAR(sampler.sample(vertices.data(), field, {0.5, 0.5, 1.0}), 5.5, 1e-12);
    EXPECT_NEAR(sampler.sample(vertices.data(), field, {0.5, 0.5, 0.5}), 3.5, 1e-12);
    EXPECT_NEAR(sampler.sample(vertices.data(), field, {1.0, 1.0, 1.0}), 6.0, 1e-12);
}

TEST(Q1SamplerTest, MapsDistortedHex) {
    const ElementSampler &sampler = get_sampler(ElementType::HEX);
    std::vector<glm::dvec3> vertices = {
        {0, 0, 0}, {2, 0.1, 0}, {2.3, 1.8, 0.2}, {-0.1, 1.5, 0},
        {0.1, 0, 1.2}, {2, 0, 1}, {2.1, 2, 1.4}, {0, 1.7, 1}
    };

    // pick a reference point, push it forward, and expect the inverse map to recover it
    glm::dvec3 ref(0.3, -0.4, 0.6);
    double N[8];
    glm::dvec3 point(0.0);
    for (int i = 0; i < 8; i++) {
        double sx = (i == 1 || i == 2 || i == 5 || i == 6) ? 1 : -1;
        double sy = (i == 2 || i == 3 || i == 6 || i == 7) ? 1 : -1;
        double sz = (i >= 4) ? 1 : -1;
        N[i] = 0.125 * (1 + sx * ref.x) * (1 + sy * ref.y) * (1 + sz * ref.z);
        point += N[i] * vertices[i];
    }

    glm::dvec4 mapped = sampler.map_real_to_unit(vertices.data(), point);
    EXPECT_NEAR(mapped.x, ref.x, 1e-8);
    EXPECT_NEAR(mapped.y, ref.y, 1e-8);
    EXPECT_NEAR(mapped.z, ref.z, 1e-8);
    EXPECT_TRUE(sampler.check_inside(mapped));

    double field[8] = {3, 1, 4, 1, 5, 9, 2, 6};
    double expected = 0.0;
    for (int i = 0; i < 8; i++) expected += N[i] * field[i];
    EXPECT_NEAR(sampler.sample(vertices.data(), field, point), expected, 1e-8);
}

TEST(Q1SamplerTest, InsideAndMeshLines) {
    const ElementSampler &sampler = get_sampler(ElementType::HEX);

    EXPECT_TRUE(sampler.check_inside({0.9, -0.9, 1.0, 0.0}));
    EXPECT_FALSE(sampler.check_inside({1.1, 0.0, 0.0, 0.0}));

    EXPECT_TRUE(sampler.check_mesh_lines({1.0, -0.99, 0.2, 0.0}));
    EXPECT_FALSE(sampler.check_mesh_lines({1.0, 0.0, 0.2, 0.0}));
    EXPECT_FALSE(sampler.check_mesh_lines({0.0, 0.0, 0.0, 0.0}));
}

TEST(P1SamplerTest, BarycentricInterpolation) {
    const ElementSampler &sampler = get_sampler(ElementType::TETRA);
    std::vector<glm::dvec3> vertices = {{1, 1, 1}, {3, 1, 1}, {1, 4, 1}, {1, 1, 2}};
    std::vector<double> field = sample_field(vertices);

    glm::dvec3 point = 0.1 * vertices[0] + 0.2 * vertices[1] + 0.3 * vertices[2] + 0.4 * vertices[3];
    glm::dvec4 mapped = sampler.map_real_to_unit(vertices.data(), point);
    EXPECT_NEAR(mapped[0], 0.1, 1e-12);
    EXPECT_NEAR(mapped[1], 0.2, 1e-12);
    EXPECT_NEAR(mapped[2], 0.3, 1e-12);
    EXPECT_NEAR(mapped[3], 0.4, 1e-12);

    EXPECT_NEAR(sampler.sample(vertices.data(), field.data(), point), linear_field(point), 1e-12);
    EXPECT_TRUE(sampler.check_inside(mapped));
    EXPECT_FALSE(sampler.check_inside({1.2, -0.2, 0.0, 0.0}));
}

TEST(P1SamplerTest, MeshLinesOnEdges) {
    const ElementSampler &sampler = get_sampler(ElementType::TETRA);

    EXPECT_TRUE(sampler.check_mesh_lines({0.5, 0.5, 0.0, 0.0}));
    EXPECT_FALSE(sampler.check_mesh_lines({0.3, 0.3, 0.4, 0.0}));
    EXPECT_FALSE(sampler.check_mesh_lines({0.25, 0.25, 0.25, 0.25}));
}

TEST(W1SamplerTest, InterpolatesLinearField) {
    const ElementSampler &sampler = get_sampler(ElementType::WEDGE);
    std::vector<glm::dvec3> vertices = {
        {0, 0, 0}, {2, 0, 0}, {0, 1, 0},
        {0, 0, 3}, {2, 0, 3}, {0, 1, 3}
    };
    std::vector<double> field = sample_field(vertices);

    glm::dvec3 point(0.5, 0.25, 1.2);
    glm::dvec4 mapped = sampler.map_real_to_unit(vertices.data(), point);
    EXPECT_NEAR(mapped.x, 0.25, 1e-10);
    EXPECT_NEAR(mapped.y, 0.25, 1e-10);
    EXPECT_NEAR(mapped.z, -0.2, 1e-10);
    EXPECT_TRUE(sampler.check_inside(mapped));

    EXPECT_NEAR(sampler.sample(vertices.data(), field.data(), point), linear_field(point), 1e-10);
}

TEST(W1SamplerTest, MapsSkewedWedge) {
    const ElementSampler &sampler = get_sampler(ElementType::WEDGE);
    std::vector<glm::dvec3> vertices = {
        {0, 0, 0}, {1, 0, 0.1}, {0, 1, -0.1},
        {0.2, 0.1, 1}, {1.4, 0, 1.3}, {0.1, 1.2, 0.9}
    };
    double field[6] = {1, 2, 3, 4, 5, 6};

    glm::dvec3 ref(0.2, 0.5, 0.3);
    double L[3] = {1 - ref.x - ref.y, ref.x, ref.y};
    glm::dvec3 point(0.0);
    double expected = 0.0;
    for (int i = 0; i < 3; i++) {
        double lo = L[i] * 0.5 * (1 - ref.z);
        double hi = L[i] * 0.5 * (1 + ref.z);
        point += lo * vertices[i] + hi * vertices[i + 3];
        expected += lo * field[i] + hi * field[i + 3];
    }

    glm::dvec4 mapped = sampler.map_real_to_unit(vertices.data(), point);
    EXPECT_NEAR(mapped.x, ref.x, 1e-8);
    EXPECT_NEAR(mapped.y, ref.y, 1e-8);
    EXPECT_NEAR(mapped.z, ref.z, 1e-8);
    EXPECT_NEAR(sampler.sample(vertices.data(), field, point), expected, 1e-8);
}

TEST(W1SamplerTest, InsideAndMeshLines) {
    const ElementSampler &sampler = get_sampler(ElementType::WEDGE);

    EXPECT_TRUE(sampler.check_inside({0.3, 0.3, 0.5, 0.0}));
    EXPECT_FALSE(sampler.check_inside({0.7, 0.7, 0.0, 0.0}));
    EXPECT_FALSE(sampler.check_inside({0.3, 0.3, 1.5, 0.0}));

    // vertical edge
    EXPECT_TRUE(sampler.check_mesh_lines({0.0, 0.0, 0.3, 0.0}));
    // cap edge
    EXPECT_TRUE(sampler.check_mesh_lines({0.5, 0.0, 1.0, 0.0}));
    // middle of a quad face
    EXPECT_FALSE(sampler.check_mesh_lines({0.5, 0.0, 0.2, 0.0}));
    // middle of a cap
    EXPECT_FALSE(sampler.check_mesh_lines({0.3, 0.3, -1.0, 0.0}));
}

TEST(SamplerTest, OneInstancePerTopology) {
    EXPECT_EQ(&get_sampler(ElementType::HEX), &get_sampler(ElementType::HEX));
    EXPECT_NE(&get_sampler(ElementType::HEX), &get_sampler(ElementType::TETRA));
    EXPECT_NE(dynamic_cast<const Q1Sampler *>(&get_sampler(ElementType::HEX)), nullptr);
    EXPECT_NE(dynamic_cast<const W1Sampler *>(&get_sampler(ElementType::WEDGE)), nullptr);
    EXPECT_NE(dynamic_cast<const P1Sampler *>(&get_sampler(ElementType::TETRA)), nullptr);
}
