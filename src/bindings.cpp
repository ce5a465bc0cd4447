#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>

#include <cstring>
#include <stdexcept>
#include <string>

#include "cpu_traverse.h"

namespace nb = nanobind;

using h_double3 = nb::ndarray<double, nb::shape<3>, nb::numpy>;
using h_double3_in = nb::ndarray<double, nb::shape<3>, nb::device::cpu, nb::c_contig>;

using h_double3_batch = nb::ndarray<double, nb::shape<-1, 3>, nb::device::cpu, nb::c_contig>;
using h_doubleN_batch = nb::ndarray<double, nb::shape<-1, -1>, nb::device::cpu, nb::c_contig>;
using h_double_batch = nb::ndarray<double, nb::shape<-1>, nb::device::cpu, nb::c_contig>;
using h_int64N_batch = nb::ndarray<int64_t, nb::shape<-1, -1>, nb::device::cpu, nb::c_contig>;
using h_int64_batch = nb::ndarray<int64_t, nb::shape<-1>, nb::device::cpu, nb::c_contig>;
using h_bool_batch = nb::ndarray<bool, nb::shape<-1>, nb::device::cpu, nb::c_contig>;

static void check_batch(size_t n_rays, size_t n, const char *name) {
    if (n != n_rays) {
        throw std::runtime_error(std::string(name) + " has incorrect shape");
    }
}

NB_MODULE(mesh_bvh_impl, m) {
    nb::exception<UnsupportedTopology>(m, "UnsupportedTopology", PyExc_ValueError);

    m.attr("LEAF_SIZE") = LEAF_SIZE;

    nb::class_<Mesh>(m, "Mesh")
        .def_static("from_data", [](const h_double3_batch &vertices, const h_int64N_batch &indices, const h_doubleN_batch &field_data) {
            if (field_data.shape(0) != indices.shape(0)) {
                throw std::runtime_error("field_data and indices must have one row per element");
            }

            std::vector<glm::dvec3> verts_vec(vertices.shape(0));
            std::memcpy(verts_vec.data(), vertices.data(), sizeof(glm::dvec3) * vertices.shape(0));

            std::vector<int64_t> indices_vec(indices.data(), indices.data() + indices.size());
            std::vector<double> field_vec(field_data.data(), field_data.data() + field_data.size());

            return Mesh(
                std::move(verts_vec),
                std::move(indices_vec),
                (int) indices.shape(1),
                std::move(field_vec),
                (int) field_data.shape(1)
            );
        }, nb::arg("vertices"), nb::arg("indices"), nb::arg("field_data"))
        .def_prop_ro("n_elem", &Mesh::n_elem)
        .def_ro("n_verts_per_elem", &Mesh::n_verts_per_elem)
        .def_ro("n_field_per_elem", &Mesh::n_field_per_elem)
        .def("print_stats", &Mesh::print_stats)
        .def("save_to_obj", &Mesh::save_to_obj)
        .def("get_bounds", [](Mesh& self) {
            auto [min, max] = self.bounds();
            return nb::make_tuple(
                h_double3(&min).cast(),
                h_double3(&max).cast()
            );
        })
    ;

    m.def("demote_to_linear", &demote_to_linear, nb::arg("mesh"));

    nb::class_<BVHData>(m, "BVHData")
        .def_ro("depth", &BVHData::depth)
        .def_ro("n_nodes", &BVHData::n_nodes)
        .def_ro("n_leaves", &BVHData::n_leaves)
        .def_ro("n_elem", &BVHData::n_elem)
        .def_ro("leaf_size", &BVHData::leaf_size)
        .def("save_as_obj", &BVHData::save_as_obj, nb::arg("filename"), nb::arg("max_depth"))
        .def("nodes_memory_bytes", &BVHData::nodes_memory_bytes)
        .def("print_stats", &BVHData::print_stats)
        .def("get_bounds", [](BVHData& self) {
            glm::dvec3 min = self.bounds().min;
            glm::dvec3 max = self.bounds().max;
            return nb::make_tuple(
                h_double3(&min).cast(),
                h_double3(&max).cast()
            );
        })
    ;

    nb::class_<CPUBuilder>(m, "CPUBuilder")
        .def(nb::init<const Mesh&>(), nb::keep_alive<1, 2>())
        .def("build_bvh", &CPUBuilder::build_bvh, nb::arg("leaf_size") = LEAF_SIZE,
             "Triangulate the mesh provided in constructor and build BVH with given leaf size. Returns BVHData.")
    ;

    nb::class_<CPUTraverser>(m, "CPUTraverser")
        .def(nb::init<const BVHData&, int>(), nb::keep_alive<1, 2>(), nb::arg("bvh"), nb::arg("n_threads") = 0)
        .def_ro("n_threads", &CPUTraverser::n_threads)
        .def("cast_rays", [](
            CPUTraverser& self,
            h_double3_batch& i_ray_origs,
            h_double3_batch& i_ray_vecs,
            h_double_batch& o_values,
            h_double_batch& o_t,
            h_int64_batch& o_elem_ids,
            h_bool_batch& o_mesh_lines
        ) {
            size_t n_rays = i_ray_origs.shape(0);
            check_batch(n_rays, i_ray_vecs.shape(0), "i_ray_vecs");
            check_batch(n_rays, o_values.shape(0), "o_values");
            check_batch(n_rays, o_t.shape(0), "o_t");
            check_batch(n_rays, o_elem_ids.shape(0), "o_elem_ids");
            check_batch(n_rays, o_mesh_lines.shape(0), "o_mesh_lines");

            nb::gil_scoped_release release;
            self.cast_rays(
                (const glm::dvec3 *) i_ray_origs.data(),
                (const glm::dvec3 *) i_ray_vecs.data(),
                o_values.data(),
                (int) n_rays,
                o_t.data(),
                o_elem_ids.data(),
                o_mesh_lines.data()
            );
        })
        .def("cast_parallel_rays", [](
            CPUTraverser& self,
            h_double3_batch& i_ray_origs,
            const h_double3_in& i_ray_vec,
            h_double_batch& o_values,
            h_double_batch& o_t,
            h_int64_batch& o_elem_ids,
            h_bool_batch& o_mesh_lines
        ) {
            size_t n_rays = i_ray_origs.shape(0);
            check_batch(n_rays, o_values.shape(0), "o_values");
            check_batch(n_rays, o_t.shape(0), "o_t");
            check_batch(n_rays, o_elem_ids.shape(0), "o_elem_ids");
            check_batch(n_rays, o_mesh_lines.shape(0), "o_mesh_lines");

            const double *vec = i_ray_vec.data();
            glm::dvec3 ray_vec(vec[0], vec[1], vec[2]);

            nb::gil_scoped_release release;
            self.cast_parallel_rays(
                (const glm::dvec3 *) i_ray_origs.data(),
                ray_vec,
                o_values.data(),
                (int) n_rays,
                o_t.data(),
                o_elem_ids.data(),
                o_mesh_lines.data()
            );
        })
    ;
}
