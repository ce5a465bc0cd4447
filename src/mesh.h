#pragma once

#include <fstream>
#include <ostream>
#include <tuple>
#include <vector>

#include <glm/glm.hpp>

#include "utils.h"
#include "element_mappings.h"

// Unstructured volumetric mesh as handed over by a reader: flat connectivity,
// n_verts_per_elem indices per element, and either one field value per element
// vertex (n_field_per_elem == n_verts_per_elem) or one per element.
struct Mesh {
    std::vector<glm::dvec3> vertices;
    std::vector<int64_t> indices;
    std::vector<double> field_data;

    int n_verts_per_elem;
    int n_field_per_elem;

    Mesh(
        std::vector<glm::dvec3> vertices,
        std::vector<int64_t> indices,
        int n_verts_per_elem,
        std::vector<double> field_data,
        int n_field_per_elem
    );

    uint32_t n_elem() const {
        return n_verts_per_elem > 0 ? indices.size() / n_verts_per_elem : 0;
    }

    const int64_t *elem_indices(uint32_t elem) const {
        return indices.data() + size_t(elem) * n_verts_per_elem;
    }

    const double *elem_field(uint32_t elem) const {
        return field_data.data() + size_t(elem) * n_field_per_elem;
    }

    void print_stats() const {
        cout << vertices.size() << " vertices; " << n_elem() << " elements of " << n_verts_per_elem << " vertices" << endl;
    }

    std::tuple<glm::dvec3, glm::dvec3> bounds() const {
        glm::dvec3 min(DBL_MAX);
        glm::dvec3 max(-DBL_MAX);

        for (const glm::dvec3 &vertex : vertices) {
            min = glm::min(min, vertex);
            max = glm::max(max, vertex);
        }

        return {min, max};
    }

    // element surfaces as triangles, throws UnsupportedTopology like the builder does
    bool save_to_obj(const char *filename) const;
};

// one "f" record per triangle of the element, elem_idx are 0-based vertex indices
void write_obj_faces(std::ostream &out, const int64_t *elem_idx, const ElementMapping &mapping);

// Quadratic elements are rendered with their corner nodes only:
// 20- and 27-node hexahedra keep 8 nodes, 10-node tetrahedra keep 4.
// Other element widths are returned unchanged.
Mesh demote_to_linear(const Mesh &mesh);
