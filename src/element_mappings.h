#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

enum class ElementType {
    TETRA,
    WEDGE,
    HEX
};

struct UnsupportedTopology : std::runtime_error {
    int n_verts_per_elem;

    explicit UnsupportedTopology(int n_verts_per_elem)
        : std::runtime_error(
              "unsupported element topology: " + std::to_string(n_verts_per_elem) +
              " vertices per element (expected 4, 6 or 8)"),
          n_verts_per_elem(n_verts_per_elem) {}
};

constexpr int HEX_NV = 8;
constexpr int HEX_NT = 12;
constexpr int WEDGE_NV = 6;
constexpr int WEDGE_NT = 8;
constexpr int TETRA_NV = 4;
constexpr int TETRA_NT = 4;

// local vertex triples, one row per triangle, exodus vertex ordering
constexpr int triangulate_hex[HEX_NT][3] = {
    {0, 2, 1}, {0, 3, 2}, // face 3 2 1 0
    {4, 5, 6}, {4, 6, 7}, // face 4 5 6 7
    {0, 1, 5}, {0, 5, 4}, // face 0 1 5 4
    {1, 2, 6}, {1, 6, 5}, // face 1 2 6 5
    {0, 7, 3}, {0, 4, 7}, // face 0 4 7 3
    {3, 6, 2}, {3, 7, 6}  // face 2 3 7 6
};

constexpr int triangulate_wedge[WEDGE_NT][3] = {
    {3, 0, 1}, {4, 3, 1}, // face 0 1 4 3
    {2, 5, 4}, {2, 4, 1}, // face 1 2 5 4
    {0, 3, 2}, {2, 3, 5}, // face 2 0 3 5
    {3, 4, 5},            // top
    {0, 2, 1}             // bottom
};

constexpr int triangulate_tetra[TETRA_NT][3] = {
    {0, 1, 3}, {2, 3, 1}, {0, 3, 2}, {0, 2, 1}
};

struct ElementMapping {
    ElementType type;
    int n_verts;
    int n_tris;
    const int (*tris)[3];
};

// throws UnsupportedTopology unless n_verts_per_elem is 4, 6 or 8
ElementMapping get_element_mapping(int n_verts_per_elem);

const char *element_type_name(ElementType type);
