#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <vector>

#include "build.h"
#include "element_samplers.h"

struct BVHDataPointers {
    const BVHNode *nodes;
    const Triangle *triangles;
};

struct StackInfo {
    int &cur_stack_size;
    uint32_t *node_stack;
};

// Nearest-hit walk, left subtree before right, both children box-tested before they are pushed.
// Leaves ray.t_far and ray.elem_id at the closest triangle hit; elem_id stays -1 on a miss.
// The stack needs room for tree depth + 1 entries.
void bvh_traverse(Ray &ray, const BVHDataPointers &dp, StackInfo &st);

// per-ray output buffers, only values is required
struct HitResults {
    double *values;
    double *t;
    int64_t *elem_ids;
    bool *mesh_lines;

    void fill(int i, const Ray &ray) const {
        values[i] = ray.data_val;
        if (t) t[i] = ray.t_far;
        if (elem_ids) elem_ids[i] = ray.elem_id;
        if (mesh_lines) mesh_lines[i] = ray.near_boundary;
    }
};

// Read-only over a built BVHData; any number of threads may trace through one traverser.
struct CPUTraverser {
    const BVHData &bvh;
    const ElementSampler &sampler;
    int n_threads;

    // n_threads == 0 uses the OpenMP default
    CPUTraverser(const BVHData &bvh, int n_threads = 0);

    BVHDataPointers get_data_pointers() const {
        return {bvh.nodes.data(), bvh.triangles.data()};
    }

    int stack_reserve() const {
        return bvh.depth * 2 + 1;
    }

    // turns a recorded hit into a field value, no-op for a miss
    void sample_hit(Ray &ray) const;

    // traverse single ray, use local stack to be thread-safe
    void intersect(Ray &ray) const {
        std::vector<uint32_t> smol_node_stack(stack_reserve(), 0);
        int smol_stack_size = 0;
        StackInfo stack_info = {smol_stack_size, smol_node_stack.data()};

        bvh_traverse(ray, get_data_pointers(), stack_info);
        sample_hit(ray);
    }

    // one origin and one direction per ray; output i always belongs to ray i
    void cast_rays(
        const glm::dvec3 *i_ray_origs,
        const glm::dvec3 *i_ray_vecs,
        double *o_values,
        int n_rays,
        double *o_t = nullptr,
        int64_t *o_elem_ids = nullptr,
        bool *o_mesh_lines = nullptr
    ) const;

    // plane-parallel batch, every ray shares ray_vec
    void cast_parallel_rays(
        const glm::dvec3 *i_ray_origs,
        const glm::dvec3 &ray_vec,
        double *o_values,
        int n_rays,
        double *o_t = nullptr,
        int64_t *o_elem_ids = nullptr,
        bool *o_mesh_lines = nullptr
    ) const;

private:
    template <typename MakeRay>
    void cast(MakeRay make_ray, HitResults hits, int n_rays) const;
};
