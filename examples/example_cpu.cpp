#include <cmath>
#include <cstdlib>
#include <memory>
#include <vector>

#include "../src/cpu_traverse.h"

// n^3 unit hexahedra filling [0, n]^3, field = distance of each vertex from the grid center
static Mesh make_hex_grid(int n) {
    int nv = n + 1;
    auto vid = [&](int i, int j, int k) { return (int64_t) (i * nv + j) * nv + k; };

    std::vector<glm::dvec3> vertices;
    for (int i = 0; i < nv; i++) {
        for (int j = 0; j < nv; j++) {
            for (int k = 0; k < nv; k++) {
                vertices.push_back({(double) i, (double) j, (double) k});
            }
        }
    }

    glm::dvec3 center(n * 0.5);

    std::vector<int64_t> indices;
    std::vector<double> field_data;
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            for (int k = 0; k < n; k++) {
                int64_t hex[8] = {
                    vid(i, j, k), vid(i + 1, j, k), vid(i + 1, j + 1, k), vid(i, j + 1, k),
                    vid(i, j, k + 1), vid(i + 1, j, k + 1), vid(i + 1, j + 1, k + 1), vid(i, j + 1, k + 1)
                };
                for (int64_t v : hex) {
                    indices.push_back(v);
                    field_data.push_back(glm::length(vertices[v] - center));
                }
            }
        }
    }

    return Mesh(std::move(vertices), std::move(indices), HEX_NV, std::move(field_data), HEX_NV);
}

int main(int argc, char **argv) {
    int grid_size = argc > 1 ? std::atoi(argv[1]) : 32;
    int img_size = argc > 2 ? std::atoi(argv[2]) : 800;
    int n_threads = argc > 3 ? std::atoi(argv[3]) : 0;

    /* ==== Prepare mesh and BVH ==== */

    cout << "Generating mesh..." << endl;
    Mesh mesh = make_hex_grid(grid_size);
    mesh.print_stats();

    cout << endl;

    CPUBuilder builder(mesh);
    cout << "Building BVH..." << endl;
    timer_start();
    BVHData bvh_data = builder.build_bvh(LEAF_SIZE);
    cout << "Elapsed time: " << timer_stop() << " ms" << endl;
    bvh_data.print_stats();
    bvh_data.save_as_obj("bvh.obj", 5);

    CPUTraverser traverser(bvh_data, n_threads);

    cout << endl;

    /* ==== Setting up plane-parallel rays ==== */

    auto [min, max] = mesh.bounds();
    glm::dvec3 center = (max + min) * 0.5;
    double max_extent = std::fmax(max.x - min.x, std::fmax(max.y - min.y, max.z - min.z));

    glm::dvec3 ray_dir = glm::normalize(glm::dvec3(-1.0, 1.5, -0.5));
    glm::dvec3 x_dir = glm::normalize(glm::cross(ray_dir, glm::dvec3(0, 0, 1))) * max_extent;
    glm::dvec3 y_dir = -glm::normalize(glm::cross(x_dir, ray_dir)) * max_extent;
    glm::dvec3 plane_center = center - ray_dir * (2.0 * max_extent);

    int n_rays = img_size * img_size;
    std::vector<glm::dvec3> ray_origs(n_rays);

    #pragma omp parallel for
    for (int y = 0; y < img_size; y++) {
        for (int x = 0; x < img_size; x++) {
            double x_f = ((double) x / img_size - 0.5);
            double y_f = ((double) y / img_size - 0.5);
            ray_origs[y * img_size + x] = plane_center + x_dir * x_f + y_dir * y_f;
        }
    }

    /* ==== Rendering image ==== */

    std::vector<double> values(n_rays);
    std::vector<double> t(n_rays);
    std::vector<int64_t> elem_ids(n_rays);
    std::unique_ptr<bool[]> mesh_lines(new bool[n_rays]);

    cout << "Casting " << n_rays << " rays on " << traverser.n_threads << " threads..." << endl;
    timer_start();
    traverser.cast_parallel_rays(ray_origs.data(), ray_dir, values.data(), n_rays, t.data(), elem_ids.data(),
                                 mesh_lines.get());
    cout << "Elapsed time: " << timer_stop() << " ms" << endl;

    int n_hits = 0;
    for (int i = 0; i < n_rays; i++) {
        if (elem_ids[i] >= 0) n_hits++;
    }
    cout << "Hit rays: " << n_hits << " / " << n_rays << endl;

    // outline elements
    for (int i = 0; i < n_rays; i++) {
        if (mesh_lines[i]) values[i] = 0.0;
    }

    cout << endl;

    /* ==== Saving image ==== */

    cout << "Saving image..." << endl;
    if (!save_to_png(values.data(), img_size, img_size, "output.png")) {
        return 1;
    }

    return 0;
}
