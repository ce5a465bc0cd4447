#pragma once

#include <string>
#include <utility>

#include "mesh.h"

constexpr uint32_t LEAF_SIZE = 16;

struct BVHNode {
    BBox bbox;
    uint32_t begin;
    uint32_t end;
    uint32_t left_child; // 0 for leaves; children are allocated in pairs, right is left + 1

    BVHNode() : begin(0), end(0), left_child(0) {}

    inline bool is_leaf() const {
        return left_child == 0;
    }

    inline uint32_t left() const {
        return left_child;
    }

    inline uint32_t right() const {
        return left_child + 1;
    }

    inline uint32_t n_prims() const {
        return end - begin;
    }

    void update_bounds(const Triangle *triangles) {
        bbox = BBox();

        for (uint32_t prim_i = begin; prim_i < end; prim_i++) {
            bbox.update(triangles[prim_i].bbox);
        }
    }
};

struct BVHData {
    std::vector<BVHNode> nodes;
    std::vector<Triangle> triangles;

    // flattened per element: n_verts_per_elem positions and n_field_per_elem values each
    std::vector<glm::dvec3> vertices;
    std::vector<double> field_data;

    ElementType elem_type;
    int n_verts_per_elem;
    int n_field_per_elem;
    uint32_t n_elem;
    uint32_t leaf_size;

    int depth;
    int n_nodes;
    int n_leaves;

    const glm::dvec3 *elem_vertices(int64_t elem) const {
        return vertices.data() + elem * n_verts_per_elem;
    }

    const double *elem_field(int64_t elem) const {
        return field_data.data() + elem * n_field_per_elem;
    }

    const BBox &bounds() const {
        return nodes[0].bbox;
    }

    // node boxes down to max_depth (leaves above it) as hexahedra in a .obj file
    bool save_as_obj(const std::string &filename, int max_depth) const;

    size_t nodes_memory_bytes() const {
        return nodes.size() * sizeof(nodes[0]);
    }

    void print_stats() const {
        cout << element_type_name(elem_type) << " mesh: " << n_elem << " elements; "
             << triangles.size() << " triangles" << endl;
        cout << "Depth: " << depth << "; nodes: " << n_nodes << "; leaves: " << n_leaves
             << "; node memory: " << nodes_memory_bytes() << " bytes" << endl;
    }

private:
    BVHData() {}

    friend struct CPUBuilder;
};

// Single-threaded midpoint-split builder. The mesh is only read, the BVH keeps its own copies.
struct CPUBuilder {
    const Mesh &mesh;
    ElementMapping mapping;

    // throws UnsupportedTopology for element widths other than 4, 6 and 8
    CPUBuilder(const Mesh &mesh);

    BVHData build_bvh(uint32_t leaf_size = LEAF_SIZE);
    void split_node(BVHData &bvh, uint32_t node_idx, int cur_depth);
};
