#include "RunConfigJson.hpp"

#include "Scenarios.hpp"
#include "Vehicle.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace trafficscenario
{
    namespace
    {
        using nlohmann::json;

        constexpr uint16_t MAX_LANES_PER_DIRECTION = 8;
        constexpr int64_t MAX_LANE_ID = MAX_LANES_PER_DIRECTION;
        // Smallest step the tick loop accepts, in seconds.
        constexpr double MIN_TIME_STEP = 1e-3;

        // Leaves value untouched when the key is absent.
        void readNumber(const json &object, const char *key, const std::string &path, double &value,
                        std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            if (!object[key].is_number())
            {
                errors.push_back(path + key + " must be a number");
                return;
            }
            value = object[key].get<double>();
        }

        void readString(const json &object, const char *key, const std::string &path, std::string &value,
                        std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            if (!object[key].is_string())
            {
                errors.push_back(path + key + " must be a string");
                return;
            }
            value = object[key].get<std::string>();
        }

        void parseRoad(const json &road_json, RoadConfig &road, std::vector<std::string> &errors)
        {
            if (!road_json.is_object())
            {
                errors.push_back("road must be an object");
                return;
            }

            readNumber(road_json, "length", "road.", road.length, errors);
            readNumber(road_json, "lane_width", "road.", road.lane_width, errors);
            readNumber(road_json, "heading", "road.", road.heading, errors);

            if (road_json.contains("lanes_per_direction"))
            {
                if (!road_json["lanes_per_direction"].is_number_unsigned())
                {
                    errors.push_back("road.lanes_per_direction must be an unsigned number");
                }
                else
                {
                    road.lanes_per_direction = static_cast<uint16_t>(
                        std::min<uint64_t>(road_json["lanes_per_direction"].get<uint64_t>(), MAX_LANES_PER_DIRECTION));
                }
            }

            if (road_json.contains("origin"))
            {
                const json &origin_json = road_json["origin"];
                if (!origin_json.is_object())
                {
                    errors.push_back("road.origin must be an object");
                }
                else
                {
                    readNumber(origin_json, "x", "road.origin.", road.origin.x, errors);
                    readNumber(origin_json, "y", "road.origin.", road.origin.y, errors);
                    readNumber(origin_json, "z", "road.origin.", road.origin.z, errors);
                }
            }

            if (road.length <= 0.0)
            {
                errors.push_back("road.length must be positive");
            }
            if (road.lane_width <= 0.0)
            {
                errors.push_back("road.lane_width must be positive");
            }
            if (road.lanes_per_direction == 0)
            {
                errors.push_back("road.lanes_per_direction must be at least 1");
            }
        }

        void parseEgo(const json &ego_json, EgoConfig &ego, std::vector<std::string> &errors)
        {
            if (!ego_json.is_object())
            {
                errors.push_back("ego must be an object");
                return;
            }

            readString(ego_json, "blueprint", "ego.", ego.blueprint, errors);
            readNumber(ego_json, "spawn_s", "ego.", ego.spawn_s, errors);
            readNumber(ego_json, "cruise_speed", "ego.", ego.cruise_speed, errors);

            if (ego_json.contains("lane_id"))
            {
                const json &lane_json = ego_json["lane_id"];
                if (!lane_json.is_number_integer())
                {
                    errors.push_back("ego.lane_id must be an integer");
                }
                else if (lane_json.is_number_unsigned()
                             ? lane_json.get<uint64_t>() > static_cast<uint64_t>(MAX_LANE_ID)
                             : (lane_json.get<int64_t>() < -MAX_LANE_ID || lane_json.get<int64_t>() > MAX_LANE_ID))
                {
                    errors.push_back("ego.lane_id is out of range");
                }
                else
                {
                    ego.lane_id = static_cast<int32_t>(lane_json.get<int64_t>());
                }
            }
        }

        void validateEgo(const EgoConfig &ego, const RoadConfig &road, std::vector<std::string> &errors)
        {
            if (!findBlueprint(ego.blueprint).has_value())
            {
                errors.push_back("unknown ego blueprint: " + ego.blueprint);
            }
            if (ego.lane_id == 0 || std::abs(ego.lane_id) > road.lanes_per_direction)
            {
                errors.push_back("ego.lane_id " + std::to_string(ego.lane_id) + " is not a lane of the road");
            }
            if (ego.spawn_s < 0.0 || ego.spawn_s > road.length)
            {
                errors.push_back("ego.spawn_s must lie on the road");
            }
            if (ego.cruise_speed < 0.0)
            {
                errors.push_back("ego.cruise_speed must not be negative");
            }
        }
    }

    std::string runConfigToJson(const RunConfig &config)
    {
        json root;
        root["scenario"] = config.scenario;

        json road_json;
        road_json["length"] = config.road.length;
        road_json["lane_width"] = config.road.lane_width;
        road_json["lanes_per_direction"] = config.road.lanes_per_direction;
        road_json["origin"] = {{"x", config.road.origin.x}, {"y", config.road.origin.y}, {"z", config.road.origin.z}};
        road_json["heading"] = config.road.heading;
        root["road"] = road_json;

        json ego_json;
        ego_json["blueprint"] = config.ego.blueprint;
        ego_json["lane_id"] = config.ego.lane_id;
        ego_json["spawn_s"] = config.ego.spawn_s;
        ego_json["cruise_speed"] = config.ego.cruise_speed;
        root["ego"] = ego_json;

        root["time_step"] = config.time_step;
        if (config.timeout.has_value())
        {
            root["timeout"] = *config.timeout;
        }
        root["recording_path"] = config.recording_path;
        root["metric_output"] = config.metric_output;

        return root.dump(2);
    }

    ConfigParseResult runConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultRunConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        readString(root, "scenario", "", result.config.scenario, result.errors);
        const auto &names = scenarioNames();
        if (std::find(names.begin(), names.end(), result.config.scenario) == names.end())
        {
            result.errors.push_back("unknown scenario: " + result.config.scenario);
        }

        if (root.contains("road"))
        {
            parseRoad(root["road"], result.config.road, result.errors);
        }
        if (root.contains("ego"))
        {
            parseEgo(root["ego"], result.config.ego, result.errors);
        }
        validateEgo(result.config.ego, result.config.road, result.errors);

        readNumber(root, "time_step", "", result.config.time_step, result.errors);
        if (result.config.time_step <= 0.0)
        {
            result.errors.push_back("time_step must be positive");
        }
        else if (result.config.time_step < MIN_TIME_STEP)
        {
            result.errors.push_back("time_step must be at least 0.001");
        }

        if (root.contains("timeout"))
        {
            const double timeout = root["timeout"].is_number() ? root["timeout"].get<double>() : 0.0;
            if (timeout <= 0.0)
            {
                result.errors.push_back("timeout must be a positive number");
            }
            else
            {
                result.config.timeout = timeout;
            }
        }

        readString(root, "recording_path", "", result.config.recording_path, result.errors);
        readString(root, "metric_output", "", result.config.metric_output, result.errors);

        if (!result.config.metric_output.empty() && result.config.recording_path.empty())
        {
            result.errors.push_back("metric_output requires recording_path");
        }

        result.ok = result.errors.empty();
        return result;
    }
} // namespace trafficscenario
