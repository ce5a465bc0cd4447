#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

#include "mesh.h"

Mesh::Mesh(
    std::vector<glm::dvec3> vertices,
    std::vector<int64_t> indices,
    int n_verts_per_elem,
    std::vector<double> field_data,
    int n_field_per_elem
) : vertices(std::move(vertices)),
    indices(std::move(indices)),
    field_data(std::move(field_data)),
    n_verts_per_elem(n_verts_per_elem),
    n_field_per_elem(n_field_per_elem) {
    if (n_verts_per_elem <= 0 || this->indices.size() % n_verts_per_elem != 0) {
        throw std::invalid_argument("connectivity size is not a multiple of vertices per element");
    }
    if (n_field_per_elem <= 0 || this->field_data.size() != size_t(n_elem()) * n_field_per_elem) {
        throw std::invalid_argument(
            "field data has " + std::to_string(this->field_data.size()) + " values, expected " +
            std::to_string(size_t(n_elem()) * std::max(n_field_per_elem, 0)));
    }
}

void write_obj_faces(std::ostream &out, const int64_t *elem_idx, const ElementMapping &mapping) {
    for (int tri = 0; tri < mapping.n_tris; tri++) {
        // obj indices are 1-based
        out << "f " << elem_idx[mapping.tris[tri][0]] + 1
            << " " << elem_idx[mapping.tris[tri][1]] + 1
            << " " << elem_idx[mapping.tris[tri][2]] + 1 << "\n";
    }
}

bool Mesh::save_to_obj(const char *filename) const {
    ElementMapping mapping = get_element_mapping(n_verts_per_elem);

    std::ofstream out(filename);
    if (!out.is_open()) {
        std::cerr << "Failed to open file: " << filename << std::endl;
        return false;
    }

    for (const glm::dvec3 &vertex : vertices) {
        out << "v " << vertex.x << " " << vertex.y << " " << vertex.z << "\n";
    }

    for (uint32_t elem = 0; elem < n_elem(); elem++) {
        write_obj_faces(out, elem_indices(elem), mapping);
    }

    return true;
}

Mesh demote_to_linear(const Mesh &mesh) {
    int n_linear;
    switch (mesh.n_verts_per_elem) {
        case 20:
        case 27: n_linear = HEX_NV; break;
        case 10: n_linear = TETRA_NV; break;
        default: return mesh;
    }

    std::cerr << "Warning: " << mesh.n_verts_per_elem << "-node elements not yet supported, "
              << "dropping to 1st order (" << n_linear << " nodes)." << std::endl;

    bool per_vertex_field = mesh.n_field_per_elem == mesh.n_verts_per_elem;
    int n_field = per_vertex_field ? n_linear : mesh.n_field_per_elem;

    std::vector<int64_t> indices;
    std::vector<double> field_data;
    indices.reserve(size_t(mesh.n_elem()) * n_linear);
    field_data.reserve(size_t(mesh.n_elem()) * n_field);

    for (uint32_t elem = 0; elem < mesh.n_elem(); elem++) {
        const int64_t *elem_idx = mesh.elem_indices(elem);
        const double *elem_field = mesh.elem_field(elem);

        indices.insert(indices.end(), elem_idx, elem_idx + n_linear);
        field_data.insert(field_data.end(), elem_field, elem_field + n_field);
    }

    return Mesh(mesh.vertices, std::move(indices), n_linear, std::move(field_data), n_field);
}
