#include "app/config.hpp"
#include "garden/history.hpp"
#include "plant/plant.hpp"
#include "plant/render.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <random>
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>

struct LevelFormatter : public spdlog::custom_flag_formatter {
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        std::string s;
        switch (msg.level) {
        case spdlog::level::level_enum::debug: {
            s = "DBUG";
            break;
        }
        case spdlog::level::level_enum::info: {
            s = "INFO";
            break;
        }
        case spdlog::level::level_enum::warn: {
            s = "WARN";
            break;
        }
        case spdlog::level::level_enum::err: {
            s = "FAIL";
            break;
        }
        default:
            break;
        }

        dest.append(s.data(), s.data() + s.length());
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFormatter>();
    }
};

static std::string frame_file(const std::string& output, uint32_t frame) {
    const std::filesystem::path p{output};
    std::filesystem::path name = p.stem();
    name += fmt::format("_{}", frame);
    name += p.extension();
    return (p.parent_path() / name).string();
}

static int run(const app::ExportConfig& cfg) {
    const uint64_t seed = cfg.seed ? *cfg.seed : std::random_device{}();
    plant::Plant::Rng rng{seed};

    plant::Plant p = cfg.kind ? plant::Plant::generate(*cfg.kind, rng) : plant::Plant::generate_random(rng);
    spdlog::info("growing a {} from seed {}", plant::kind_name(p.kind()), seed);

    if (cfg.frames == 1) {
        p.set_age(cfg.age);
        if (!plant::export_svg(p, cfg.output, cfg.width, cfg.height))
            return 1;
        spdlog::info("saved {} at {:.1f} minutes to {}", plant::kind_name(p.kind()), cfg.age, cfg.output);
    } else {
        for (uint32_t i = 0; i < cfg.frames; ++i) {
            const double progress = static_cast<double>(i) / (cfg.frames - 1);
            p.set_age(p.age_at_progress(cfg.duration, progress));

            const std::string file = frame_file(cfg.output, i);
            if (!plant::export_svg(p, file, cfg.width, cfg.height))
                return 1;
        }
        spdlog::info("saved {} frames of a {:.0f} minute session", cfg.frames, cfg.duration);
    }

    if (!cfg.history.empty()) {
        garden::History history{cfg.history};

        const garden::Date now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
        history.add_study(now, cfg.duration, p);

        spdlog::info("{} plants grown over {:.0f} minutes of study", history.total_plants_grown(), history.total_studied_time());
    }

    return 0;
}

int main(int argc, char** argv) {
    std::unique_ptr<spdlog::pattern_formatter> formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFormatter>('y').set_pattern("%^[%y]%$ %v");
    spdlog::set_formatter(std::move(formatter));

    if (std::getenv("FLORABOX_DEBUG"))
        spdlog::set_level(spdlog::level::debug);

    app::ExportConfig cfg;
    try {
        if (argc > 1) {
            cfg = app::load_config(argv[1]);
        } else {
            spdlog::info("no config given, using defaults");
        }
    } catch (const app::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return run(cfg);
}
