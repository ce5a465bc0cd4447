#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "build.h"

CPUBuilder::CPUBuilder(const Mesh &mesh) : mesh(mesh), mapping(get_element_mapping(mesh.n_verts_per_elem)) {
    if (mesh.n_elem() == 0) {
        throw std::invalid_argument("mesh has no elements");
    }
    if (mesh.n_field_per_elem != 1 && mesh.n_field_per_elem != mesh.n_verts_per_elem) {
        throw std::invalid_argument("field data must have one value per element or one per element vertex");
    }
}

BVHData CPUBuilder::build_bvh(uint32_t leaf_size) {
    if (leaf_size == 0) {
        throw std::invalid_argument("leaf size must be positive");
    }

    BVHData bvh;
    bvh.elem_type = mapping.type;
    bvh.n_verts_per_elem = mapping.n_verts;
    bvh.n_field_per_elem = mesh.n_field_per_elem;
    bvh.n_elem = mesh.n_elem();
    bvh.leaf_size = leaf_size;

    /* ==== flatten mesh into per-element buffers ==== */

    bvh.vertices.resize(size_t(bvh.n_elem) * mapping.n_verts);
    for (uint32_t elem = 0; elem < bvh.n_elem; elem++) {
        const int64_t *elem_idx = mesh.elem_indices(elem);
        for (int j = 0; j < mapping.n_verts; j++) {
            int64_t idx = elem_idx[j];
            if (idx < 0 || size_t(idx) >= mesh.vertices.size()) {
                throw std::invalid_argument(
                    "element " + std::to_string(elem) + " references vertex " + std::to_string(idx) +
                    " of " + std::to_string(mesh.vertices.size()));
            }
            bvh.vertices[size_t(elem) * mapping.n_verts + j] = mesh.vertices[idx];
        }
    }
    bvh.field_data = mesh.field_data;

    bvh.triangles.reserve(size_t(bvh.n_elem) * mapping.n_tris);
    for (uint32_t elem = 0; elem < bvh.n_elem; elem++) {
        const glm::dvec3 *v = bvh.elem_vertices(elem);
        for (int tri = 0; tri < mapping.n_tris; tri++) {
            bvh.triangles.emplace_back(
                v[mapping.tris[tri][0]],
                v[mapping.tris[tri][1]],
                v[mapping.tris[tri][2]],
                elem
            );
        }
    }

    /* ==== build tree ==== */

    uint32_t n_tris = bvh.triangles.size();

    // every split leaves both sides non-empty, so there are at most 2n - 1 nodes
    bvh.nodes.resize(size_t(n_tris) * 2);

    BVHNode &root = bvh.nodes[0];
    root.begin = 0;
    root.end = n_tris;
    root.update_bounds(bvh.triangles.data());

    bvh.n_nodes = 1;
    bvh.n_leaves = 0;
    bvh.depth = 1;

    split_node(bvh, 0, 1);

    bvh.nodes.resize(bvh.n_nodes);

    return bvh;
}

void CPUBuilder::split_node(BVHData &bvh, uint32_t node_idx, int cur_depth) {
    BVHNode &node = bvh.nodes[node_idx];
    std::vector<Triangle> &triangles = bvh.triangles;

    bvh.depth = std::max(bvh.depth, cur_depth);
    if (node.n_prims() <= bvh.leaf_size) {
        bvh.n_leaves++;
        return;
    }

    glm::dvec3 extent = node.bbox.diagonal();

    // ties keep the lower axis
    int axis = 0;
    if (extent.y > extent.x) axis = 1;
    if (extent.z > extent[axis]) axis = 2;

    double split_pos = node.bbox.min[axis] + extent[axis] * 0.5;

    uint32_t i = node.begin;
    uint32_t j = node.end;
    while (i < j) {
        if (triangles[i].centroid[axis] <= split_pos) {
            i++;
        } else {
            std::swap(triangles[i], triangles[--j]);
        }
    }

    // clustered centroids put everything on one side, fall back to an even split
    uint32_t mid = i;
    if (mid == node.begin || mid == node.end) {
        mid = node.begin + node.n_prims() / 2;
    }

    uint32_t left_idx = bvh.n_nodes++;
    uint32_t right_idx = bvh.n_nodes++;

    bvh.nodes[left_idx].begin = node.begin;
    bvh.nodes[left_idx].end = mid;
    bvh.nodes[left_idx].update_bounds(triangles.data());

    bvh.nodes[right_idx].begin = mid;
    bvh.nodes[right_idx].end = node.end;
    bvh.nodes[right_idx].update_bounds(triangles.data());

    node.left_child = left_idx;

    split_node(bvh, left_idx, cur_depth + 1);
    split_node(bvh, right_idx, cur_depth + 1);
}

bool BVHData::save_as_obj(const std::string &filename, int max_depth) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        std::cerr << "Failed to open file: " << filename << std::endl;
        return false;
    }

    // a box is written as a hexahedron, its corners in hex vertex order
    ElementMapping box_mapping = get_element_mapping(HEX_NV);

    std::vector<std::pair<uint32_t, int>> node_stack = {{0, 0}};
    int64_t n_boxes = 0;

    while (!node_stack.empty()) {
        auto [node_idx, depth] = node_stack.back();
        node_stack.pop_back();
        const BVHNode &node = nodes[node_idx];

        if (depth < max_depth && !node.is_leaf()) {
            node_stack.push_back({node.right(), depth + 1});
            node_stack.push_back({node.left(), depth + 1});
            continue;
        }

        const glm::dvec3 &lo = node.bbox.min;
        const glm::dvec3 &hi = node.bbox.max;
        glm::dvec3 corners[HEX_NV] = {
            {lo.x, lo.y, lo.z}, {hi.x, lo.y, lo.z}, {hi.x, hi.y, lo.z}, {lo.x, hi.y, lo.z},
            {lo.x, lo.y, hi.z}, {hi.x, lo.y, hi.z}, {hi.x, hi.y, hi.z}, {lo.x, hi.y, hi.z}
        };

        int64_t corner_idx[HEX_NV];
        for (int i = 0; i < HEX_NV; i++) {
            out << "v " << corners[i].x << " " << corners[i].y << " " << corners[i].z << "\n";
            corner_idx[i] = n_boxes * HEX_NV + i;
        }
        write_obj_faces(out, corner_idx, box_mapping);
        n_boxes++;
    }

    cout << "Saved " << n_boxes << " node boxes to " << filename << endl;
    return true;
}
