#include <spatial/spatial.hpp>
#include <spatial/integration/raylib.hpp>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "raylib.h"

// ---------------------------------------------------------------------------
// Harness-local data (not part of the library)
// ---------------------------------------------------------------------------

struct Body {
    double radius;
    uint8_t r, g, b;
    double speed;
    double orbit_radius;
    double angle;
};

// ---------------------------------------------------------------------------
// Globals
// ---------------------------------------------------------------------------

// nodes[i] and bodies[i] describe the same body
static std::vector<spatial::TransformNode> nodes;
static std::vector<Body> bodies;
static std::vector<spatial::WorldTransform> world;
static std::vector<spatial::CullObject> cull_objects;
static std::vector<spatial::VisibleEntry> visible;
static std::vector<bool> lit;

static bool paused = false;
static bool wireframe = false;
static bool show_help = true;
static bool view_from_probe = false;
static bool cull_far = true;

static size_t dynamic_planets = 0;
static double probe_angle = 0.0;
static double sun_depth = 0.0;

static const double PROBE_FAR = 9.0;
static const double LIGHT_RANGE = 7.0;

// ---------------------------------------------------------------------------
// Scene setup
// ---------------------------------------------------------------------------

static size_t make_body(size_t parent, double orbit_r, double speed, double radius, uint8_t r,
                        uint8_t g, uint8_t b) {
    spatial::TransformNode node;
    node.local = spatial::LocalTransform::from_xyz(orbit_r, 0.0, 0.0);
    node.parent = parent;
    nodes.push_back(node);
    bodies.push_back(Body{radius, r, g, b, speed, orbit_r, 0.0});
    return nodes.size() - 1;
}

static void build_scene() {
    // Sun (root)
    size_t sun = make_body(spatial::NO_PARENT, 0.0, 0.0, 2.0, 255, 220, 50);

    size_t earth = make_body(sun, 5.0, 1.0, 0.8, 50, 100, 255);
    make_body(earth, 1.5, 2.5, 0.3, 180, 180, 180); // moon

    size_t mars = make_body(sun, 8.0, 0.6, 0.6, 220, 80, 50);
    make_body(mars, 1.2, 3.0, 0.2, 160, 160, 160); // phobos
    make_body(mars, 1.8, 2.0, 0.25, 140, 140, 140); // deimos

    // Tilted ring world to exercise rotated parents
    size_t ring = make_body(sun, 12.0, 0.3, 1.0, 120, 200, 140);
    nodes[ring].local.rotate_local_z(0.5);
    make_body(ring, 2.0, 1.5, 0.35, 200, 200, 120);
}

static void reset_scene() {
    nodes.clear();
    bodies.clear();
    dynamic_planets = 0;
    build_scene();
}

// Planets added at runtime are leaves appended after the fixed scene
static void add_random_planet() {
    double orbit_r = 3.0 + static_cast<double>(rand() % 120) / 10.0;
    double speed = 0.3 + static_cast<double>(rand() % 20) / 10.0;
    double radius = 0.3 + static_cast<double>(rand() % 5) / 10.0;
    auto r = static_cast<uint8_t>(80 + rand() % 176);
    auto g = static_cast<uint8_t>(80 + rand() % 176);
    auto b = static_cast<uint8_t>(80 + rand() % 176);

    make_body(0, orbit_r, speed, radius, r, g, b);
    ++dynamic_planets;
}

static void remove_last_planet() {
    if (dynamic_planets == 0)
        return;
    nodes.pop_back();
    bodies.pop_back();
    --dynamic_planets;
}

// ---------------------------------------------------------------------------
// Update
// ---------------------------------------------------------------------------

static void orbital_motion(double dt) {
    for (size_t i = 0; i < bodies.size(); ++i) {
        Body& body = bodies[i];
        if (nodes[i].parent == spatial::NO_PARENT)
            continue;
        body.angle += body.speed * dt;
        nodes[i].local.translation = spatial::DVec3(std::cos(body.angle) * body.orbit_radius, 0.0,
                                                    std::sin(body.angle) * body.orbit_radius);
    }
}

// The probe circles the sun and looks at it; its frustum does the culling
static spatial::WorldTransform probe_transform() {
    spatial::DVec3 pos(std::cos(probe_angle) * 16.0, 4.0, std::sin(probe_angle) * 16.0);
    return spatial::WorldTransform(spatial::LocalTransform::from_translation(pos).looking_at(
        spatial::DVec3(0.0), spatial::unit_y()));
}

static spatial::DMat4 probe_projection() {
    double aspect = static_cast<double>(GetScreenWidth()) / static_cast<double>(GetScreenHeight());
    return spatial::perspective_infinite_reverse(50.0 * DEG2RAD, aspect, 0.5);
}

static spatial::Frustum update_visibility(const spatial::WorldTransform& probe) {
    spatial::propagate_transforms(nodes, world);

    cull_objects.resize(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        cull_objects[i].bounds = spatial::Aabb{spatial::DVec3(0.0), spatial::DVec3(bodies[i].radius)};
        cull_objects[i].world = world[i];
    }

    spatial::Frustum frustum = spatial::Frustum::from_view(probe, probe_projection(), PROBE_FAR);
    spatial::ViewRangefinder rangefinder = spatial::ViewRangefinder::from_view(probe);
    spatial::collect_visible(frustum, cull_objects, rangefinder, visible, cull_far);
    spatial::sort_by_depth(visible, spatial::DepthOrder::FrontToBack);

    // The sun is the point light
    spatial::BoundingSphere light{world[0].translation(), LIGHT_RANGE};
    lit.assign(nodes.size(), false);
    for (size_t i = 1; i < nodes.size(); ++i)
        lit[i] = spatial::is_lit_by_point_light(light, cull_objects[i].bounds, cull_objects[i].world);

    return frustum;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

static void draw_bodies() {
    std::vector<bool> seen(nodes.size(), false);
    for (const auto& v : visible)
        seen[v.index] = true;

    for (size_t i = 0; i < nodes.size(); ++i) {
        const Body& body = bodies[i];
        Vector3 pos = spatial::to_raylib(world[i].translation());
        auto radius = static_cast<float>(body.radius);

        if (!seen[i]) {
            DrawSphereWires(pos, radius, 8, 8, Color{90, 90, 90, 255});
            continue;
        }

        Color col = {body.r, body.g, body.b, 255};
        if (i != 0 && !lit[i])
            col = Color{static_cast<uint8_t>(body.r / 3), static_cast<uint8_t>(body.g / 3),
                        static_cast<uint8_t>(body.b / 3), 255};

        if (wireframe) {
            DrawSphereWires(pos, radius, 12, 12, col);
        } else {
            DrawSphere(pos, radius, col);
            DrawSphereWires(pos, radius, 12, 12,
                            Color{static_cast<uint8_t>(col.r / 2), static_cast<uint8_t>(col.g / 2),
                                  static_cast<uint8_t>(col.b / 2), 255});
        }
    }
}

static void draw_orbit_rings() {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].parent == spatial::NO_PARENT)
            continue;
        const spatial::WorldTransform& parent = world[nodes[i].parent];
        const double orbit = bodies[i].orbit_radius;

        // Orbits live in the parent's XZ plane
        int segments = 64;
        for (int s = 0; s < segments; ++s) {
            double a0 = (static_cast<double>(s) / segments) * 2.0 * PI;
            double a1 = (static_cast<double>(s + 1) / segments) * 2.0 * PI;
            spatial::DVec3 p0 =
                parent.transform_point(spatial::DVec3(std::cos(a0) * orbit, 0.0, std::sin(a0) * orbit));
            spatial::DVec3 p1 =
                parent.transform_point(spatial::DVec3(std::cos(a1) * orbit, 0.0, std::sin(a1) * orbit));
            DrawLine3D(spatial::to_raylib(p0), spatial::to_raylib(p1), Color{80, 80, 80, 255});
        }
    }
}

static void draw_frustum(const spatial::Frustum& frustum) {
    auto c = frustum.corners();
    Color col = {255, 140, 0, 255};
    for (int i = 0; i < 4; ++i) {
        int j = (i + 1) % 4;
        DrawLine3D(spatial::to_raylib(c[i]), spatial::to_raylib(c[j]), col);         // near
        DrawLine3D(spatial::to_raylib(c[i + 4]), spatial::to_raylib(c[j + 4]), col); // far
        DrawLine3D(spatial::to_raylib(c[i]), spatial::to_raylib(c[i + 4]), col);     // edge
    }
}

static void draw_ui() {
    DrawFPS(10, 10);

    char buf[256];
    std::snprintf(buf, sizeof(buf), "Bodies: %zu  Visible: %zu  Far culling: %s", nodes.size(),
                  visible.size(), cull_far ? "on" : "off");
    DrawText(buf, 10, 35, 18, LIGHTGRAY);

    if (!visible.empty()) {
        std::snprintf(buf, sizeof(buf), "Nearest: body %zu at depth %.2f", visible.front().index,
                      -visible.front().distance);
        DrawText(buf, 10, 55, 18, LIGHTGRAY);
    }
    std::snprintf(buf, sizeof(buf), "Sun depth from view: %.2f", -sun_depth);
    DrawText(buf, 10, 75, 18, LIGHTGRAY);

    if (paused)
        DrawText("PAUSED", GetScreenWidth() / 2 - 40, 10, 24, RED);

    if (show_help) {
        int y = 105;
        int sz = 16;
        Color c = LIGHTGRAY;
        DrawText("--- Controls ---", 10, y, sz, c);
        y += 20;
        DrawText("Mouse: rotate camera  Scroll: zoom", 10, y, sz, c);
        y += 18;
        DrawText("1: Add planet   2: Remove last added planet", 10, y, sz, c);
        y += 18;
        DrawText("C: Toggle probe view   F: Toggle far-plane culling", 10, y, sz, c);
        y += 18;
        DrawText("P: Pause/unpause   Space: Toggle wireframe", 10, y, sz, c);
        y += 18;
        DrawText("R: Reset scene   H: Toggle help", 10, y, sz, c);
        y += 18;
        DrawText("Gray wire: culled   Dim: outside the sun's light range", 10, y, sz, c);
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    srand(42);

    InitWindow(1280, 720, "Spatial Visual Harness - Frustum Culling");
    SetTargetFPS(60);

    Camera3D camera = {};
    camera.position = Vector3{22.0f, 18.0f, 22.0f};
    camera.target = Vector3{0.0f, 0.0f, 0.0f};
    camera.up = Vector3{0.0f, 1.0f, 0.0f};
    camera.fovy = 45.0f;
    camera.projection = CAMERA_PERSPECTIVE;

    build_scene();

    while (!WindowShouldClose()) {
        // Input
        if (!view_from_probe)
            UpdateCamera(&camera, CAMERA_ORBITAL);

        if (IsKeyPressed(KEY_ONE))
            add_random_planet();
        if (IsKeyPressed(KEY_TWO))
            remove_last_planet();
        if (IsKeyPressed(KEY_C))
            view_from_probe = !view_from_probe;
        if (IsKeyPressed(KEY_F))
            cull_far = !cull_far;
        if (IsKeyPressed(KEY_P))
            paused = !paused;
        if (IsKeyPressed(KEY_R))
            reset_scene();
        if (IsKeyPressed(KEY_SPACE))
            wireframe = !wireframe;
        if (IsKeyPressed(KEY_H))
            show_help = !show_help;

        // Update
        if (!paused) {
            double dt = GetFrameTime();
            orbital_motion(dt);
            probe_angle += 0.2 * dt;
        }
        spatial::WorldTransform probe = probe_transform();
        spatial::Frustum frustum = update_visibility(probe);

        Camera3D active = camera;
        if (view_from_probe) {
            active.position = spatial::to_raylib(probe.translation());
            active.target = spatial::to_raylib(probe.translation() + probe.forward());
            active.up = spatial::to_raylib(probe.up());
            active.fovy = 50.0f;
        }
        sun_depth = spatial::ViewRangefinder::from_view(spatial::camera_world_transform(active))
                        .distance(world[0]);

        // Draw
        BeginDrawing();
        ClearBackground(Color{20, 20, 30, 255});

        BeginMode3D(active);
        DrawGrid(30, 1.0f);
        draw_orbit_rings();
        draw_bodies();
        if (!view_from_probe) {
            draw_frustum(frustum);
            DrawSphereWires(spatial::to_raylib(probe.translation()), 0.3f, 6, 6, ORANGE);
        }
        EndMode3D();

        draw_ui();
        EndDrawing();
    }

    CloseWindow();
    return 0;
}
