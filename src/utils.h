#pragma once

#include <iostream>
#include <vector>
#include <chrono>
#include <cfloat>
#include <cmath>
#include <cstdint>
#include <limits>

#include <glm/glm.hpp>

using std::cout, std::endl;

// any |det| or hit distance below this is treated as a miss
constexpr double DETERMINANT_EPS = 1e-10;

// value written for rays that hit nothing
constexpr double NO_DATA = std::numeric_limits<double>::quiet_NaN();

inline bool is_no_data(double value) {
    return std::isnan(value);
}

struct Ray {
    glm::dvec3 origin;
    glm::dvec3 direction;
    glm::dvec3 inv_dir;

    double t_near;
    double t_far;

    // result slot, filled in by traversal
    int64_t elem_id;
    double data_val;
    bool near_boundary;

    // t_near bounds hits from below, 0 starts at the origin
    Ray(const glm::dvec3 &origin, const glm::dvec3 &direction)
        : origin(origin),
          direction(direction),
          inv_dir(1.0 / direction.x, 1.0 / direction.y, 1.0 / direction.z),
          t_near(0.0),
          t_far(INFINITY),
          elem_id(-1),
          data_val(NO_DATA),
          near_boundary(false) {}

    bool hit() const {
        return elem_id >= 0;
    }

    glm::dvec3 at(double t) const {
        return origin + t * direction;
    }
};

struct BBox {
    glm::dvec3 min, max;

    BBox() : min(DBL_MAX), max(-DBL_MAX) {}

    BBox(const glm::dvec3 &min, const glm::dvec3 &max) : min(min), max(max) {}

    void update(const glm::dvec3 &point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    void update(const BBox &other) {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    bool inside(const glm::dvec3 &point) const {
        return point.x >= min.x && point.x <= max.x &&
                point.y >= min.y && point.y <= max.y &&
                point.z >= min.z && point.z <= max.z;
    }

    bool contains(const BBox &other) const {
        return inside(other.min) && inside(other.max);
    }

    glm::dvec3 diagonal() const {
        return max - min;
    }

    glm::dvec3 center() const {
        return (min + max) * 0.5;
    }
};

struct Triangle {
    glm::dvec3 p0, p1, p2;
    glm::dvec3 centroid;
    BBox bbox;
    int64_t elem_id;

    Triangle() : elem_id(-1) {}

    Triangle(const glm::dvec3 &p0, const glm::dvec3 &p1, const glm::dvec3 &p2, int64_t elem_id)
        : p0(p0), p1(p1), p2(p2), centroid((p0 + p1 + p2) / 3.0), elem_id(elem_id) {
        bbox.update(p0);
        bbox.update(p1);
        bbox.update(p2);
    }

    const glm::dvec3 &operator[](int i) const {
        switch (i) {
            case 0: return p0;
            case 1: return p1;
            default: return p2;
        }
    }
};

// Moller-Trumbore; on a hit inside (t_near, t_far), updates t_far and elem_id
bool ray_triangle_intersection(Ray &ray, const Triangle &tri);

// slab test, hit iff the box overlaps the ray between t_near and infinity
bool ray_box_intersection(const Ray &ray, const BBox &bbox);

// greyscale png, normalised to the finite range of values, no-data pixels are black
bool save_to_png(const double *values, int width, int height, const char *filename);

int timer(bool start);
void timer_start();
int timer_stop();
