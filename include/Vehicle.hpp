#pragma once

#include "Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trafficscenario
{
    struct Blueprint
    {
        std::string name;
        double extent_x;         // half length, meters
        double extent_y;         // half width, meters
        double max_acceleration; // m/s² at full throttle
        double max_deceleration; // m/s² at full brake
        double max_speed;        // m/s
    };

    inline const std::vector<Blueprint> &blueprintCatalog()
    {
        static const std::vector<Blueprint> catalog = {
            {"vehicle.lincoln.mkz2017", 2.45, 1.05, 3.5, 8.0, 50.0},
            {"vehicle.tesla.model3", 2.40, 1.00, 4.0, 8.0, 60.0},
            {"vehicle.audi.tt", 2.10, 1.00, 4.0, 8.0, 60.0},
            {"vehicle.diamondback.century", 0.80, 0.35, 2.0, 5.0, 12.0},
            {"walker.pedestrian.0001", 0.30, 0.30, 1.5, 3.0, 3.0}};
        return catalog;
    }

    inline std::optional<Blueprint> findBlueprint(const std::string &name)
    {
        const auto &catalog = blueprintCatalog();
        auto it = std::find_if(catalog.begin(), catalog.end(),
                               [&name](const Blueprint &entry)
                               { return entry.name == name; });
        if (it == catalog.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    struct VehicleControl
    {
        double throttle = 0.0; // [0, 1]
        double brake = 0.0;    // [0, 1]
        bool hand_brake = false;
        std::optional<double> target_speed;
        double target_acceleration = 0.0; // <= 0 holds the target speed immediately
        bool follow_lane = false;
    };

    struct Vehicle
    {
        uint32_t id;
        Blueprint blueprint;
        Pose pose;
        double current_speed; // m/s along the heading
        VehicleControl control;
        std::size_t collisions;

        Vehicle(uint32_t vid, Blueprint model, const Pose &spawn_pose)
            : id(vid), blueprint(std::move(model)), pose(spawn_pose),
              current_speed(0.0), collisions(0) {}

        Vector3 velocity() const
        {
            return forwardVector(pose.rotation) * current_speed;
        }

        void updateSpeed(double dt_seconds)
        {
            if (control.hand_brake)
            {
                current_speed = 0.0;
                return;
            }

            if (control.brake > 0.0)
            {
                const double decel = control.brake * blueprint.max_deceleration;
                current_speed = std::max(0.0, current_speed - decel * dt_seconds);
                return;
            }

            if (control.target_speed.has_value())
            {
                const double target = std::max(0.0, std::min(blueprint.max_speed, *control.target_speed));
                if (control.target_acceleration <= 0.0)
                {
                    current_speed = target;
                    return;
                }

                const double delta = target - current_speed;
                const double max_change = control.target_acceleration * dt_seconds;
                if (std::abs(delta) <= max_change)
                    current_speed = target;
                else if (delta > 0.0)
                    current_speed += max_change;
                else
                    current_speed -= max_change;
                return;
            }

            if (control.throttle > 0.0)
            {
                current_speed = std::min(blueprint.max_speed,
                                         current_speed + control.throttle * blueprint.max_acceleration * dt_seconds);
            }
        }
    };

} // namespace trafficscenario
