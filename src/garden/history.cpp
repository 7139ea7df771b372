#include "history.hpp"

#include "plant/record.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>
#include <yaml-cpp/yaml.h>

namespace garden {

static constexpr const char* DATE_FORMAT = "%Y-%m-%d %H:%M:%S";

std::string format_date(Date date) {
    const std::time_t t = std::chrono::system_clock::to_time_t(date);
    std::tm tm = {};
    gmtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
}

std::optional<Date> parse_date(std::string_view text) {
    std::tm tm = {};
    std::istringstream ss{std::string{text}};
    ss >> std::get_time(&tm, DATE_FORMAT);
    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    return Date{std::chrono::seconds{timegm(&tm)}};
}

History::History(std::string path) : path{std::move(path)} {
    load(this->path);
}

entt::entity History::add_study(Date date, double duration, std::optional<plant::Plant> grown) {
    const entt::entity e = reg.create();
    reg.emplace<SessionComponent>(e, Activity::study, date, duration);
    if (grown) {
        reg.emplace<PlantComponent>(e, std::move(*grown));
    }

    if (!path.empty() && !save()) {
        spdlog::warn("study of {:.1f} minutes was recorded but not saved", duration);
    }
    return e;
}

entt::entity History::add_break(Date date, double duration) {
    const entt::entity e = reg.create();
    reg.emplace<SessionComponent>(e, Activity::rest, date, duration);

    if (!path.empty() && !save()) {
        spdlog::warn("break of {:.1f} minutes was recorded but not saved", duration);
    }
    return e;
}

double History::total_time(Activity activity) const {
    double total = 0.0;
    for (auto [e, session] : reg.view<const SessionComponent>().each()) {
        if (session.activity == activity)
            total += session.duration;
    }
    return total;
}

double History::total_studied_time() const {
    return total_time(Activity::study);
}

double History::total_break_time() const {
    return total_time(Activity::rest);
}

std::size_t History::total_plants_grown() const {
    return reg.view<const PlantComponent>().size();
}

std::vector<Study> History::studies() const {
    std::vector<std::pair<entt::entity, Study>> found;
    for (auto [e, session] : reg.view<const SessionComponent>().each()) {
        if (session.activity != Activity::study)
            continue;

        Study study{session.date, session.duration, std::nullopt};
        if (const PlantComponent* grown = reg.try_get<PlantComponent>(e)) {
            study.plant = grown->plant;
        }
        found.emplace_back(e, std::move(study));
    }

    // same dates keep the order they were added in
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.second.date != b.second.date)
            return a.second.date < b.second.date;
        return entt::to_integral(a.first) < entt::to_integral(b.first);
    });

    std::vector<Study> out;
    out.reserve(found.size());
    for (auto& [e, study] : found) {
        out.push_back(std::move(study));
    }
    return out;
}

std::string History::to_yaml() const {
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);

    out << YAML::BeginMap;

    out << YAML::Key << "studies" << YAML::Value << YAML::BeginSeq;
    for (const Study& study : studies()) {
        out << YAML::BeginMap;
        out << YAML::Key << "date" << YAML::Value << format_date(study.date);
        out << YAML::Key << "duration" << YAML::Value << study.duration;
        out << YAML::Key << "plant" << YAML::Value;
        if (study.plant) {
            plant::serialize(out, *study.plant);
        } else {
            out << YAML::Null;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    std::vector<SessionComponent> breaks;
    for (auto [e, session] : reg.view<const SessionComponent>().each()) {
        if (session.activity == Activity::rest)
            breaks.push_back(session);
    }
    std::stable_sort(breaks.begin(), breaks.end(), [](const SessionComponent& a, const SessionComponent& b) { return a.date < b.date; });

    out << YAML::Key << "breaks" << YAML::Value << YAML::BeginSeq;
    for (const SessionComponent& session : breaks) {
        out << YAML::BeginMap;
        out << YAML::Key << "date" << YAML::Value << format_date(session.date);
        out << YAML::Key << "duration" << YAML::Value << session.duration;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

static std::optional<SessionComponent> load_session(const YAML::Node& node, Activity activity) {
    if (!node.IsMap() || !node["date"] || !node["duration"]) {
        return std::nullopt;
    }

    try {
        const std::optional<Date> date = parse_date(node["date"].as<std::string>());
        if (!date) {
            return std::nullopt;
        }
        return SessionComponent{activity, *date, node["duration"].as<double>()};
    } catch (const YAML::Exception& e) {
        spdlog::warn("skipping malformed history entry: {}", e.what());
        return std::nullopt;
    }
}

void History::from_yaml(std::string_view text) {
    clear();

    YAML::Node root;
    try {
        root = YAML::Load(std::string{text});
    } catch (const YAML::Exception& e) {
        spdlog::warn("history is not valid yaml, starting over: {}", e.what());
        return;
    }

    // anything that isn't a map is not a history we wrote
    if (!root.IsMap()) {
        if (root.IsDefined() && !root.IsNull())
            spdlog::warn("history is not a map, starting over");
        return;
    }

    if (const YAML::Node studies = root["studies"]; studies && studies.IsSequence()) {
        for (const YAML::Node& node : studies) {
            const std::optional<SessionComponent> session = load_session(node, Activity::study);
            if (!session) {
                spdlog::warn("skipping malformed study entry");
                continue;
            }

            std::optional<plant::Plant> grown;
            if (const YAML::Node p = node["plant"]; p && !p.IsNull()) {
                try {
                    grown = plant::deserialize(p);
                } catch (const plant::RecordError& e) {
                    spdlog::warn("study from {} has an unreadable plant: {}", format_date(session->date), e.what());
                }
            }

            const entt::entity e = reg.create();
            reg.emplace<SessionComponent>(e, *session);
            if (grown) {
                reg.emplace<PlantComponent>(e, std::move(*grown));
            }
        }
    }

    if (const YAML::Node breaks = root["breaks"]; breaks && breaks.IsSequence()) {
        for (const YAML::Node& node : breaks) {
            const std::optional<SessionComponent> session = load_session(node, Activity::rest);
            if (!session) {
                spdlog::warn("skipping malformed break entry");
                continue;
            }

            const entt::entity e = reg.create();
            reg.emplace<SessionComponent>(e, *session);
        }
    }

    spdlog::debug("loaded history with {} plants grown", total_plants_grown());
}

bool History::save() const {
    return save(path);
}

bool History::save(std::string_view file) const {
    std::ofstream f{std::string{file}, std::ios::out | std::ios::trunc};
    if (!f) {
        spdlog::error("failed to open history file {}", file);
        return false;
    }

    f << to_yaml() << '\n';
    f.close();

    if (!f) {
        spdlog::error("failed to write history file {}", file);
        return false;
    }
    return true;
}

void History::load(std::string_view file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        clear();
        return;
    }

    std::ifstream f{std::string{file}};
    if (!f) {
        spdlog::warn("failed to open history file {}, starting over", file);
        clear();
        return;
    }

    const std::string text{std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};
    from_yaml(text);
}

void History::clear() {
    reg.clear();
}

} // namespace garden
