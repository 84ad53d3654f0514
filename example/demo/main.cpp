// main.cpp - Traversal Example
//
// Edits a small scene built from immer containers through traversals:
// offsets every entity, renames the lights, and validates the result.

#include <lager_optics/lager_optics.h>

#include <immer/flex_vector.hpp>
#include <immer/map.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <variant>

using namespace lager_optics;

// ============================================================
// Scene Model
// ============================================================

struct Vec2 {
    float x = 0;
    float y = 0;
    bool operator==(const Vec2&) const = default;
};

struct Mesh {
    std::string asset;
    bool operator==(const Mesh&) const = default;
};

struct Light {
    float intensity = 1;
    bool operator==(const Light&) const = default;
};

using Component = std::variant<Mesh, Light>;

struct Entity {
    std::string name;
    Vec2 position;
    Component component;
    std::optional<std::string> parent;
    bool operator==(const Entity&) const = default;
};

struct Scene {
    immer::map<std::string, immer::flex_vector<Entity>> layers;
    bool operator==(const Scene&) const = default;
};

// ============================================================
// Reusable traversals
// ============================================================

const auto entities = id<Scene>() |
                      compose_lens(lager::lenses::attr(&Scene::layers)) |
                      compose_traversal(each<immer::map<std::string, immer::flex_vector<Entity>>>()) |
                      compose_traversal(each<immer::flex_vector<Entity>>());

const auto positions = entities | prop(&Entity::position);

const auto lights = entities | prop(&Entity::component) | filter<Light>();

// ============================================================
// Output
// ============================================================

void print_scene(const char* title, const Scene& scene) {
    std::cout << "--- " << title << " ---\n";
    for (const auto& entity : get_all(entities)(scene)) {
        std::cout << "  " << entity.name << " @ (" << entity.position.x << ", " << entity.position.y << ")";
        if (const auto* light = std::get_if<Light>(&entity.component)) {
            std::cout << " light " << light->intensity;
        } else {
            std::cout << " mesh " << std::get<Mesh>(entity.component).asset;
        }
        if (entity.parent) {
            std::cout << " parent=" << *entity.parent;
        }
        std::cout << "\n";
    }
}

int main() {
    Scene scene;
    scene.layers = scene.layers
        .set("background", immer::flex_vector<Entity>{
            Entity{"sky", {0, 0}, Mesh{"sky.mesh"}, std::nullopt},
            Entity{"sun", {10, 40}, Light{2.0f}, std::string{"sky"}},
        })
        .set("props", immer::flex_vector<Entity>{
            Entity{"crate", {3, 1}, Mesh{"crate.mesh"}, std::nullopt},
            Entity{"lamp", {4, 2}, Light{0.5f}, std::string{"crate"}},
        });

    print_scene("initial", scene);

    std::cout << "\nentities: " << length(entities)(scene)
              << ", lights: " << length(lights)(scene) << "\n\n";

    // Offset everything
    auto moved = modify([](const Vec2& p) { return Vec2{p.x + 1, p.y - 1}; })(positions)(scene);
    print_scene("moved", moved);

    // Dim the lights
    auto dimmed = modify([](const Light& l) { return Light{l.intensity * 0.5f}; })(lights)(moved);
    print_scene("dimmed", dimmed);

    // Detach children of "crate"
    auto parents = entities | prop(&Entity::parent) | some() |
                   filter([](const std::string& p) { return p == "crate"; });
    auto detached = set(std::string{"root"})(parents)(dimmed);
    print_scene("detached", detached);

    // Validate: every light must stay above 0.3
    using Check = ValidationApplicative<std::string>;
    auto check = traverse(Check{}, [](const Light& l) {
        if (l.intensity < 0.3f) {
            return Check::fail<Light>("light too dim: " + std::to_string(l.intensity));
        }
        return Check::pure(l);
    })(lights);

    auto verdict = check(detached);
    if (verdict) {
        std::cout << "\nscene is valid\n";
    } else {
        std::cout << "\nscene has " << verdict.errors.size() << " error(s):\n";
        for (const auto& error : verdict.errors) {
            std::cout << "  " << error << "\n";
        }
    }

    return 0;
}
