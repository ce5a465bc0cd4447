#include <cfloat>
#include <cmath>
#include <stdexcept>

#include "element_samplers.h"

namespace {

constexpr double hex_signs[HEX_NV][3] = {
    {-1, -1, -1}, { 1, -1, -1}, { 1,  1, -1}, {-1,  1, -1},
    {-1, -1,  1}, { 1, -1,  1}, { 1,  1,  1}, {-1,  1,  1}
};

bool near_one(double x) {
    return std::fabs(1.0 - std::fabs(x)) < MESH_LINE_THRESHOLD;
}

bool near_zero(double x) {
    return std::fabs(x) < MESH_LINE_THRESHOLD;
}

} // namespace

glm::dvec4 NonlinearSolveSampler3D::map_real_to_unit(const glm::dvec3 *vertices, const glm::dvec3 &point) const {
    double N[HEX_NV];
    glm::dvec3 dN[HEX_NV];

    glm::dvec3 x = initial_guess;

    for (int iter = 0; iter < MAX_NEWTON_ITER; iter++) {
        shape_functions(x, N, dN);

        glm::dvec3 f = -point;
        glm::dvec3 col_r(0.0), col_s(0.0), col_t(0.0);
        for (int i = 0; i < n_verts; i++) {
            f += N[i] * vertices[i];
            col_r += dN[i].x * vertices[i];
            col_s += dN[i].y * vertices[i];
            col_t += dN[i].z * vertices[i];
        }

        glm::dmat3 J(col_r, col_s, col_t);
        double det = glm::determinant(J);
        if (std::fabs(det) < DBL_MIN) {
            break;
        }

        glm::dvec3 dx = glm::inverse(J) * f;
        x -= dx;

        if (glm::length(dx) < NEWTON_TOL) {
            break;
        }
    }

    return glm::dvec4(x, 0.0);
}

double NonlinearSolveSampler3D::sample_at_unit_point(const glm::dvec4 &mapped, const double *field_values) const {
    double N[HEX_NV];
    glm::dvec3 dN[HEX_NV];
    shape_functions(glm::dvec3(mapped), N, dN);

    double value = 0.0;
    for (int i = 0; i < n_verts; i++) {
        value += N[i] * field_values[i];
    }
    return value;
}

void Q1Sampler::shape_functions(const glm::dvec3 &x, double *N, glm::dvec3 *dN) const {
    for (int i = 0; i < HEX_NV; i++) {
        double a = 1.0 + hex_signs[i][0] * x.x;
        double b = 1.0 + hex_signs[i][1] * x.y;
        double c = 1.0 + hex_signs[i][2] * x.z;

        N[i] = 0.125 * a * b * c;
        dN[i] = 0.125 * glm::dvec3(
            hex_signs[i][0] * b * c,
            hex_signs[i][1] * a * c,
            hex_signs[i][2] * a * b
        );
    }
}

bool Q1Sampler::check_inside(const glm::dvec4 &mapped) const {
    return std::fabs(mapped.x) <= 1.0 + INSIDE_TOL &&
           std::fabs(mapped.y) <= 1.0 + INSIDE_TOL &&
           std::fabs(mapped.z) <= 1.0 + INSIDE_TOL;
}

// on an edge of the cube two reference coordinates sit at +-1
bool Q1Sampler::check_mesh_lines(const glm::dvec4 &mapped) const {
    bool x = near_one(mapped.x);
    bool y = near_one(mapped.y);
    bool z = near_one(mapped.z);
    return (x && y) || (x && z) || (y && z);
}

void W1Sampler::shape_functions(const glm::dvec3 &x, double *N, glm::dvec3 *dN) const {
    double L[3] = {1.0 - x.x - x.y, x.x, x.y};
    glm::dvec2 dL[3] = {{-1.0, -1.0}, {1.0, 0.0}, {0.0, 1.0}};

    double lo = 0.5 * (1.0 - x.z);
    double hi = 0.5 * (1.0 + x.z);

    for (int i = 0; i < 3; i++) {
        N[i]     = L[i] * lo;
        N[i + 3] = L[i] * hi;
        dN[i]     = glm::dvec3(dL[i].x * lo, dL[i].y * lo, -0.5 * L[i]);
        dN[i + 3] = glm::dvec3(dL[i].x * hi, dL[i].y * hi,  0.5 * L[i]);
    }
}

bool W1Sampler::check_inside(const glm::dvec4 &mapped) const {
    return mapped.x >= -INSIDE_TOL &&
           mapped.y >= -INSIDE_TOL &&
           mapped.x + mapped.y <= 1.0 + INSIDE_TOL &&
           std::fabs(mapped.z) <= 1.0 + INSIDE_TOL;
}

bool W1Sampler::check_mesh_lines(const glm::dvec4 &mapped) const {
    int near_tri_edges = 0;
    if (near_zero(mapped.x)) near_tri_edges++;
    if (near_zero(mapped.y)) near_tri_edges++;
    if (near_zero(1.0 - mapped.x - mapped.y)) near_tri_edges++;

    if (near_tri_edges >= 2) {
        return true; // vertical edge
    }
    return near_tri_edges == 1 && near_one(mapped.z);
}

glm::dvec4 P1Sampler::map_real_to_unit(const glm::dvec3 *vertices, const glm::dvec3 &point) const {
    glm::dmat3 M(
        vertices[1] - vertices[0],
        vertices[2] - vertices[0],
        vertices[3] - vertices[0]
    );
    glm::dvec3 b = glm::inverse(M) * (point - vertices[0]);
    return glm::dvec4(1.0 - b.x - b.y - b.z, b.x, b.y, b.z);
}

double P1Sampler::sample_at_unit_point(const glm::dvec4 &mapped, const double *field_values) const {
    return mapped[0] * field_values[0] +
           mapped[1] * field_values[1] +
           mapped[2] * field_values[2] +
           mapped[3] * field_values[3];
}

bool P1Sampler::check_inside(const glm::dvec4 &mapped) const {
    for (int i = 0; i < 4; i++) {
        if (mapped[i] < -INSIDE_TOL) return false;
    }
    return true;
}

// on an edge two of the four barycentric weights vanish
bool P1Sampler::check_mesh_lines(const glm::dvec4 &mapped) const {
    int n_zero = 0;
    for (int i = 0; i < 4; i++) {
        if (near_zero(mapped[i])) n_zero++;
    }
    return n_zero >= 2;
}

const ElementSampler &get_sampler(ElementType type) {
    static const Q1Sampler q1{};
    static const W1Sampler w1{};
    static const P1Sampler p1{};

    switch (type) {
        case ElementType::HEX:   return q1;
        case ElementType::WEDGE: return w1;
        case ElementType::TETRA: return p1;
    }
    throw std::invalid_argument("unknown element type");
}
