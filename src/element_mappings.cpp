#include "element_mappings.h"

ElementMapping get_element_mapping(int n_verts_per_elem) {
    switch (n_verts_per_elem) {
        case HEX_NV:   return {ElementType::HEX, HEX_NV, HEX_NT, triangulate_hex};
        case WEDGE_NV: return {ElementType::WEDGE, WEDGE_NV, WEDGE_NT, triangulate_wedge};
        case TETRA_NV: return {ElementType::TETRA, TETRA_NV, TETRA_NT, triangulate_tetra};
        default:       throw UnsupportedTopology(n_verts_per_elem);
    }
}

const char *element_type_name(ElementType type) {
    switch (type) {
        case ElementType::HEX:   return "hex8";
        case ElementType::WEDGE: return "wedge6";
        case ElementType::TETRA: return "tet4";
    }
    return "unknown";
}
