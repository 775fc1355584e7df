#include <chrono>
#include <cstdio>
#include <random>
#include <spatial/spatial.hpp>
#include <vector>

#include <glm/gtc/constants.hpp>

using namespace spatial;

// Timer utility
struct Timer {
    using Clock = std::chrono::high_resolution_clock;
    Clock::time_point start;

    Timer() : start(Clock::now()) {}

    double elapsed_ms() const {
        auto end = Clock::now();
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
};

// Keeps the optimizer from dropping results
static volatile size_t sink = 0;

// Objects scattered in a 400 unit cube around the origin, randomly turned and scaled
static std::vector<CullObject> make_scene(size_t n) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> pos(-200.0, 200.0);
    std::uniform_real_distribution<double> angle(0.0, glm::two_pi<double>());
    std::uniform_real_distribution<double> size(0.5, 3.0);

    std::vector<CullObject> objects(n);
    for (auto& o : objects) {
        o.bounds = Aabb{DVec3(0.0), DVec3(size(rng), size(rng), size(rng))};
        LocalTransform l = LocalTransform::from_xyz(pos(rng), pos(rng), pos(rng));
        l.rotate_y(angle(rng));
        l.rotate_local_x(angle(rng));
        o.world = WorldTransform(l);
    }
    return objects;
}

static WorldTransform make_view() {
    return WorldTransform(LocalTransform::from_xyz(0.0, 20.0, 150.0).looking_at(DVec3(0.0), unit_y()));
}

static void bench_frustum_from_view(size_t n) {
    WorldTransform view = make_view();
    DMat4 proj = perspective_infinite_reverse(glm::quarter_pi<double>(), 16.0 / 9.0, 0.1);
    Timer t;
    size_t count = 0;
    for (size_t i = 0; i < n; ++i)
        count += Frustum::from_view(view, proj, 100.0 + double(i & 7)).contains_point(DVec3(0.0), true);
    double ms = t.elapsed_ms();
    sink = count;
    std::printf("  frustum from view       %zu frusta: %.2f ms (%.0f /ms)\n", n, ms, n / ms);
}

static void bench_cull_sphere(size_t n) {
    auto objects = make_scene(n);
    Frustum f = Frustum::from_view(
        make_view(), perspective_infinite_reverse(glm::quarter_pi<double>(), 16.0 / 9.0, 0.1), 300.0);

    Timer t;
    size_t visible = 0;
    for (const auto& o : objects)
        visible += f.intersects_sphere(world_bounding_sphere(o.bounds, o.world), true);
    double ms = t.elapsed_ms();
    sink = visible;
    std::printf("  sphere cull             %zu objects: %.2f ms (%.0f obj/ms, %zu visible)\n", n, ms,
                n / ms, visible);
}

static void bench_cull_obb(size_t n) {
    auto objects = make_scene(n);
    Frustum f = Frustum::from_view(
        make_view(), perspective_infinite_reverse(glm::quarter_pi<double>(), 16.0 / 9.0, 0.1), 300.0);

    Timer t;
    size_t visible = 0;
    for (const auto& o : objects)
        visible += f.intersects_obb(o.bounds, o.world, true);
    double ms = t.elapsed_ms();
    sink = visible;
    std::printf("  obb cull                %zu objects: %.2f ms (%.0f obj/ms, %zu visible)\n", n, ms,
                n / ms, visible);
}

static void bench_collect_visible(size_t n) {
    auto objects = make_scene(n);
    WorldTransform view = make_view();
    Frustum f = Frustum::from_view(
        view, perspective_infinite_reverse(glm::quarter_pi<double>(), 16.0 / 9.0, 0.1), 300.0);
    ViewRangefinder r = ViewRangefinder::from_view(view);

    std::vector<VisibleEntry> visible;
    Timer t;
    collect_visible(f, objects, r, visible);
    sort_by_depth(visible, DepthOrder::FrontToBack);
    double ms = t.elapsed_ms();
    sink = visible.size();
    std::printf("  collect + sort          %zu objects: %.2f ms (%.0f obj/ms)\n", n, ms, n / ms);
}

static void bench_point_light(size_t n) {
    auto objects = make_scene(n);
    DVec3 light(10.0, 5.0, -20.0);
    CubemapFrusta cube = CubemapFrusta::from_point_light(light, 0.1, 60.0);
    BoundingSphere range{light, 60.0};

    Timer t;
    size_t lit = 0;
    size_t face_hits = 0;
    for (const auto& o : objects) {
        if (!is_lit_by_point_light(range, o.bounds, o.world))
            continue;
        ++lit;
        uint8_t faces = cube.visible_faces_obb(o.bounds, o.world, true);
        for (; faces != 0; faces &= faces - 1)
            ++face_hits;
    }
    double ms = t.elapsed_ms();
    sink = face_hits;
    std::printf("  point light cubemap     %zu objects: %.2f ms (%.0f obj/ms, %zu lit)\n", n, ms,
                n / ms, lit);
}

static void bench_propagation(size_t n) {
    // Chains of depth 4 under each root
    std::vector<TransformNode> nodes(n);
    for (size_t i = 0; i < n; ++i) {
        nodes[i].local = LocalTransform::from_xyz(1.0, 0.0, 0.0);
        nodes[i].local.rotate_y(0.1);
        if (i % 4 != 0)
            nodes[i].parent = i - 1;
    }

    std::vector<WorldTransform> world;
    Timer t;
    propagate_transforms(nodes, world);
    double ms = t.elapsed_ms();
    sink = world.size();
    std::printf("  propagate (depth 4)     %zu nodes: %.2f ms (%.0f node/ms)\n", n, ms, n / ms);
}

static void bench_rangefinder(size_t n) {
    auto objects = make_scene(n);
    ViewRangefinder r = ViewRangefinder::from_view(make_view());

    Timer t;
    double total = 0.0;
    for (const auto& o : objects)
        total += r.distance(o.world);
    double ms = t.elapsed_ms();
    sink = static_cast<size_t>(total != 0.0);
    std::printf("  view distance           %zu objects: %.2f ms (%.0f obj/ms)\n", n, ms, n / ms);
}

int main() {
    constexpr size_t N_SMALL = 10'000;
    constexpr size_t N_LARGE = 100'000;

    std::printf("=== Spatial Benchmarks ===\n\n");

    std::printf("Frustum Construction:\n");
    bench_frustum_from_view(N_SMALL);

    std::printf("\nCulling:\n");
    bench_cull_sphere(N_SMALL);
    bench_cull_sphere(N_LARGE);
    bench_cull_obb(N_SMALL);
    bench_cull_obb(N_LARGE);
    bench_collect_visible(N_LARGE);

    std::printf("\nPoint Lights:\n");
    bench_point_light(N_LARGE);

    std::printf("\nHierarchy:\n");
    bench_propagation(N_LARGE);

    std::printf("\nSorting:\n");
    bench_rangefinder(N_LARGE);

    std::printf("\nDone.\n");
    return 0;
}
