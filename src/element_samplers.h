#pragma once

#include <glm/glm.hpp>

#include "element_mappings.h"

constexpr int MAX_NEWTON_ITER = 10;
constexpr double NEWTON_TOL = 1e-10;

// reference-space distance from an element edge that counts as "on a mesh line"
constexpr double MESH_LINE_THRESHOLD = 5e-2;

constexpr double INSIDE_TOL = 1e-6;

// Interpolates a field inside one element. Mapped coordinates live in a dvec4:
// hex and wedge use xyz, tetrahedra use all four barycentric weights.
class ElementSampler {
public:
    virtual ~ElementSampler() = default;

    virtual glm::dvec4 map_real_to_unit(const glm::dvec3 *vertices, const glm::dvec3 &point) const = 0;

    virtual double sample_at_unit_point(const glm::dvec4 &mapped, const double *field_values) const = 0;

    virtual bool check_inside(const glm::dvec4 &mapped) const = 0;

    virtual bool check_mesh_lines(const glm::dvec4 &mapped) const = 0;

    // only meaningful for points inside the element
    double sample(const glm::dvec3 *vertices, const double *field_values, const glm::dvec3 &point) const {
        return sample_at_unit_point(map_real_to_unit(vertices, point), field_values);
    }
};

// Newton iteration on the isoparametric map, for elements whose map is not affine
class NonlinearSolveSampler3D : public ElementSampler {
public:
    glm::dvec4 map_real_to_unit(const glm::dvec3 *vertices, const glm::dvec3 &point) const override;

    double sample_at_unit_point(const glm::dvec4 &mapped, const double *field_values) const override;

protected:
    NonlinearSolveSampler3D(int n_verts, const glm::dvec3 &initial_guess)
        : n_verts(n_verts), initial_guess(initial_guess) {}

    // fills n_verts shape function values and their reference-space gradients
    virtual void shape_functions(const glm::dvec3 &x, double *N, glm::dvec3 *dN) const = 0;

    int n_verts;
    glm::dvec3 initial_guess;
};

// 8-node hexahedron, trilinear on [-1, 1]^3
class Q1Sampler : public NonlinearSolveSampler3D {
public:
    Q1Sampler() : NonlinearSolveSampler3D(HEX_NV, glm::dvec3(0.0)) {}

    bool check_inside(const glm::dvec4 &mapped) const override;
    bool check_mesh_lines(const glm::dvec4 &mapped) const override;

protected:
    void shape_functions(const glm::dvec3 &x, double *N, glm::dvec3 *dN) const override;
};

// 6-node wedge, linear triangle (xi, eta) times linear zeta in [-1, 1]
class W1Sampler : public NonlinearSolveSampler3D {
public:
    W1Sampler() : NonlinearSolveSampler3D(WEDGE_NV, glm::dvec3(1.0 / 3.0, 1.0 / 3.0, 0.0)) {}

    bool check_inside(const glm::dvec4 &mapped) const override;
    bool check_mesh_lines(const glm::dvec4 &mapped) const override;

protected:
    void shape_functions(const glm::dvec3 &x, double *N, glm::dvec3 *dN) const override;
};

// 4-node tetrahedron, barycentric coordinates from a direct solve
class P1Sampler : public ElementSampler {
public:
    glm::dvec4 map_real_to_unit(const glm::dvec3 *vertices, const glm::dvec3 &point) const override;
    double sample_at_unit_point(const glm::dvec4 &mapped, const double *field_values) const override;
    bool check_inside(const glm::dvec4 &mapped) const override;
    bool check_mesh_lines(const glm::dvec4 &mapped) const override;
};

// samplers are stateless, one shared instance per topology
const ElementSampler &get_sampler(ElementType type);
