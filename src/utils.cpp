#include <iostream>
#include <vector>
#include <chrono>
#include <algorithm>

#include <glm/glm.hpp>

#include "utils.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

// https://en.wikipedia.org/wiki/M%C3%B6ller%E2%80%93Trumbore_intersection_algorithm
bool ray_triangle_intersection(Ray &ray, const Triangle &tri) {
    glm::dvec3 edge1 = tri.p1 - tri.p0;
    glm::dvec3 edge2 = tri.p2 - tri.p0;
    glm::dvec3 ray_cross_e2 = glm::cross(ray.direction, edge2);
    double det = glm::dot(edge1, ray_cross_e2);
    if (det > -DETERMINANT_EPS && det < DETERMINANT_EPS) {
        return false; // This ray is parallel to this triangle.
    }

    double inv_det = 1.0 / det;
    glm::dvec3 s = ray.origin - tri.p0;
    double u = inv_det * glm::dot(s, ray_cross_e2);
    if (u < 0.0 || u > 1.0) {
        return false;
    }

    glm::dvec3 s_cross_e1 = glm::cross(s, edge1);
    double v = inv_det * glm::dot(ray.direction, s_cross_e1);
    if (v < 0.0 || u + v > 1.0) {
        return false;
    }

    double t = inv_det * glm::dot(edge2, s_cross_e1);
    if (t > DETERMINANT_EPS && t > ray.t_near && t < ray.t_far) {
        ray.t_far = t;
        ray.elem_id = tri.elem_id;
        return true;
    }

    return false;
}

// a zero direction component leaves that slab unbounded in t, so the origin has to lie
// inside it; this also keeps 0 * inf out of the interval when the origin is on a face plane
bool ray_box_intersection(const Ray &ray, const BBox &bbox) {
    double t_min = ray.t_near;
    double t_max = INFINITY;

    for (int i = 0; i < 3; i++) {
        if (ray.direction[i] == 0.0) {
            if (ray.origin[i] < bbox.min[i] || ray.origin[i] > bbox.max[i]) {
                return false;
            }
            continue;
        }

        double t1 = (bbox.min[i] - ray.origin[i]) * ray.inv_dir[i];
        double t2 = (bbox.max[i] - ray.origin[i]) * ray.inv_dir[i];
        t_min = std::max(t_min, std::min(t1, t2));
        t_max = std::min(t_max, std::max(t1, t2));
    }

    return t_max >= t_min;
}

bool save_to_png(const double *values, int width, int height, const char *filename) {
    if (width <= 0 || height <= 0) return false;

    size_t n_pixels = size_t(width) * size_t(height);

    double lo = DBL_MAX;
    double hi = -DBL_MAX;
    for (size_t i = 0; i < n_pixels; i++) {
        if (is_no_data(values[i]) || !std::isfinite(values[i])) continue;
        lo = std::min(lo, values[i]);
        hi = std::max(hi, values[i]);
    }
    double range = (hi > lo) ? hi - lo : 1.0;

    std::vector<uint8_t> gray(n_pixels, 0);
    for (size_t i = 0; i < n_pixels; i++) {
        if (is_no_data(values[i]) || !std::isfinite(values[i])) continue;
        double c = (values[i] - lo) / range;
        gray[i] = (uint8_t) std::lround(32.0 + 223.0 * std::clamp(c, 0.0, 1.0));
    }

    if (!stbi_write_png(filename, width, height, 1, gray.data(), width)) {
        std::cerr << "Failed to write image: " << filename << std::endl;
        return false;
    }

    return true;
}

int timer(bool start) {
    static std::chrono::time_point<std::chrono::high_resolution_clock> start_time;
    if (start) {
        start_time = std::chrono::high_resolution_clock::now();
        return 0;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    return duration.count();
}

void timer_start() {
    timer(true);
}

int timer_stop() {
    return timer(false);
}
