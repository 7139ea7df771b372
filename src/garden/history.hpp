#pragma once

#include "plant/plant.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <entt/entt.hpp>

namespace garden {

using Date = std::chrono::sys_seconds;

enum class Activity : uint8_t {
    study,
    rest
};

struct SessionComponent final {
    Activity activity;
    // when the session ended
    Date date;
    // minutes
    double duration;
};

struct PlantComponent final {
    plant::Plant plant;
};

struct Study final {
    Date date;
    double duration;
    std::optional<plant::Plant> plant;
};

// UTC, "YYYY-MM-DD HH:MM:SS"
std::string format_date(Date date);
std::optional<Date> parse_date(std::string_view text);

// Record of past study sessions and breaks. Each session is an entity; studies that grew
// something also carry the plant they grew, so it can be replayed later.
class History final {
  public:
    History() = default;
    // Loads the file if it exists; every add_* writes it back.
    explicit History(std::string path);

    entt::entity add_study(Date date, double duration, std::optional<plant::Plant> grown);
    entt::entity add_break(Date date, double duration);

    double total_studied_time() const;
    double total_break_time() const;
    std::size_t total_plants_grown() const;

    // oldest first
    std::vector<Study> studies() const;

    std::string to_yaml() const;
    // Replaces the current contents. Malformed input is logged and leaves the history empty.
    void from_yaml(std::string_view text);

    bool save() const;
    bool save(std::string_view file) const;
    void load(std::string_view file);

    void clear();

    const std::string& file() const noexcept {
        return path;
    }

    entt::registry reg;

  private:
    double total_time(Activity activity) const;

    std::string path;
};

} // namespace garden
