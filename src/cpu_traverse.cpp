#include <omp.h>

#include "cpu_traverse.h"

void bvh_traverse(Ray &ray, const BVHDataPointers &dp, StackInfo &st) {
    st.cur_stack_size = 0;

    if (!ray_box_intersection(ray, dp.nodes[0].bbox)) {
        return;
    }
    st.node_stack[st.cur_stack_size++] = 0;

    while (st.cur_stack_size > 0) {
        uint32_t node_idx = st.node_stack[--st.cur_stack_size];
        const BVHNode &node = dp.nodes[node_idx];

        /* ==== intersect primitives in node ==== */
        if (node.is_leaf()) {
            for (uint32_t prim_i = node.begin; prim_i < node.end; prim_i++) {
                ray_triangle_intersection(ray, dp.triangles[prim_i]);
            }
            continue;
        }

        /* ==== non-leaf case ==== */
        uint32_t left = node.left();
        uint32_t right = node.right();

        bool left_hit = ray_box_intersection(ray, dp.nodes[left].bbox);
        bool right_hit = ray_box_intersection(ray, dp.nodes[right].bbox);

        // right goes in first so the left subtree is finished first
        if (right_hit) {
            st.node_stack[st.cur_stack_size++] = right;
        }

        if (left_hit) {
            st.node_stack[st.cur_stack_size++] = left;
        }
    }
}

CPUTraverser::CPUTraverser(const BVHData &bvh, int n_threads)
    : bvh(bvh),
      sampler(get_sampler(bvh.elem_type)),
      n_threads(n_threads > 0 ? n_threads : omp_get_max_threads()) {}

void CPUTraverser::sample_hit(Ray &ray) const {
    if (!ray.hit()) {
        ray.data_val = NO_DATA;
        ray.near_boundary = false;
        return;
    }

    glm::dvec3 position = ray.at(ray.t_far);
    const glm::dvec3 *vertex_ptr = bvh.elem_vertices(ray.elem_id);
    const double *field_ptr = bvh.elem_field(ray.elem_id);

    glm::dvec4 mapped = sampler.map_real_to_unit(vertex_ptr, position);

    // element-centred field, nothing to interpolate
    if (bvh.n_field_per_elem == 1) {
        ray.data_val = field_ptr[0];
    } else {
        ray.data_val = sampler.sample_at_unit_point(mapped, field_ptr);
    }
    ray.near_boundary = sampler.check_mesh_lines(mapped);
}

template <typename MakeRay>
void CPUTraverser::cast(MakeRay make_ray, HitResults hits, int n_rays) const {
    BVHDataPointers dp = get_data_pointers();

    #pragma omp parallel num_threads(n_threads)
    {
        std::vector<uint32_t> node_stack(stack_reserve(), 0);
        int stack_size = 0;
        StackInfo stack_info = {stack_size, node_stack.data()};

        #pragma omp for schedule(dynamic, 64)
        for (int i = 0; i < n_rays; i++) {
            Ray ray = make_ray(i);

            bvh_traverse(ray, dp, stack_info);
            sample_hit(ray);
            hits.fill(i, ray);
        }
    }
}

void CPUTraverser::cast_rays(
    const glm::dvec3 *i_ray_origs,
    const glm::dvec3 *i_ray_vecs,
    double *o_values,
    int n_rays,
    double *o_t,
    int64_t *o_elem_ids,
    bool *o_mesh_lines
) const {
    HitResults hits = {o_values, o_t, o_elem_ids, o_mesh_lines};

    cast([&](int i) { return Ray(i_ray_origs[i], i_ray_vecs[i]); }, hits, n_rays);
}

void CPUTraverser::cast_parallel_rays(
    const glm::dvec3 *i_ray_origs,
    const glm::dvec3 &ray_vec,
    double *o_values,
    int n_rays,
    double *o_t,
    int64_t *o_elem_ids,
    bool *o_mesh_lines
) const {
    HitResults hits = {o_values, o_t, o_elem_ids, o_mesh_lines};

    cast([&](int i) { return Ray(i_ray_origs[i], ray_vec); }, hits, n_rays);
}
