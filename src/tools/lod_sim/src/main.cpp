#include "app/render_core.hpp"
#include "cache/resource_pool.hpp"
#include "core/log.hpp"
#include "core/scheduler.hpp"
#include "testing/manual_clock.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Headless replay of a synthetic frame-rate trace through RenderCore. Prints
// every quality transition and a diagnostics summary at the end.

namespace {

struct Phase { double fps = 60.0; int frames = 0; };

struct SimMarker final : mrc::cache::VisualObject {
    std::string id;
    bool selected = false;
};

struct SimIcon { std::string name; };

class SimFactory final : public mrc::cache::IVisualFactory {
public:
    std::shared_ptr<mrc::cache::VisualObject> build(const mrc::cache::EntityUpdate& u,
                                                    const mrc::cache::BuildContext& ctx) override {
        ++built;
        auto m = std::make_shared<SimMarker>();
        m->id = u.id;
        m->selected = ctx.selected;
        return m;
    }
    void dispose(const mrc::cache::VisualObject&) override { ++disposed; }
    uint64_t built = 0;
    uint64_t disposed = 0;
};

class SimWarmer final : public mrc::warmup::IAssetWarmer {
public:
    explicit SimWarmer(mrc::cache::ResourcePool<SimIcon>& icons) : icons_(icons) {}
    void prebuild_fixed_assets() override {
        for(const char* n : {"vehicle", "truck", "bike", "pin", "cluster"}) {
            icons_.put(n, std::make_shared<SimIcon>(SimIcon{n}), 64 * 1024);
        }
    }
    void prebuild_selection_variants() override {
        for(const char* n : {"vehicle:selected", "truck:selected", "bike:selected"}) {
            icons_.put(n, std::make_shared<SimIcon>(SimIcon{n}), 96 * 1024);
        }
    }
    void prefetch_tile(const mrc::warmup::TileCoord&) override { ++tiles; }
    int tiles = 0;
private:
    mrc::cache::ResourcePool<SimIcon>& icons_;
};

// "65:300,48:400" -> {{65,300},{48,400}}
bool parse_trace(const std::string& text, std::vector<Phase>& out) {
    std::stringstream ss(text);
    std::string item;
    while(std::getline(ss, item, ',')) {
        auto colon = item.find(':');
        if(colon == std::string::npos) return false;
        char* end = nullptr;
        Phase p;
        p.fps = std::strtod(item.substr(0, colon).c_str(), &end);
        if(!end || *end != '\0' || !(p.fps > 0.0)) return false;
        p.frames = std::atoi(item.substr(colon + 1).c_str());
        if(p.frames <= 0) return false;
        out.push_back(p);
    }
    return !out.empty();
}

bool parse_level(const std::string& s, mrc::log::Level& lvl) {
    using mrc::log::Level;
    for(Level l : {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Critical}) {
        if(s == mrc::log::level_name(l)) { lvl = l; return true; }
    }
    return false;
}

void usage() {
    std::cout << "Usage: lod_sim [--profile standard|low_end|high_end] [--trace fps:frames,...]\n"
                 "               [--entities N] [--batch-every N] [--log-level LEVEL] [--diagnostics] [--json]\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace mrc;

    std::string profile = "standard";
    std::string trace = "65:300,48:400,40:400,30:300,62:600,65:600";
    int entity_count = 1200;
    int batch_every = 5;
    bool json = false;
    bool diagnostics = false;
    log::Level level = log::Level::Info;

    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if(i + 1 >= argc) { std::cerr << flag << " needs a value\n"; std::exit(1); }
            return argv[++i];
        };
        if(a == "--help" || a == "-h") { usage(); return 0; }
        else if(a == "--profile") profile = next("--profile");
        else if(a == "--trace") trace = next("--trace");
        else if(a == "--entities") entity_count = std::atoi(next("--entities").c_str());
        else if(a == "--batch-every") batch_every = std::atoi(next("--batch-every").c_str());
        else if(a == "--log-level") {
            if(!parse_level(next("--log-level"), level)) { std::cerr << "Unknown log level\n"; return 1; }
        }
        else if(a == "--diagnostics") diagnostics = true;
        else if(a == "--json") json = true;
        else { std::cerr << "Unknown argument: " << a << "\n"; usage(); return 1; }
    }

    std::vector<Phase> phases;
    if(!parse_trace(trace, phases)) { std::cerr << "Bad --trace, expected fps:frames[,fps:frames...]\n"; return 1; }
    if(entity_count < 0) entity_count = 0;
    if(batch_every < 1) batch_every = 1;

    app::RenderCoreConfig cfg;
    if(profile == "standard") cfg = app::RenderCoreConfig::standard();
    else if(profile == "low_end") cfg = app::RenderCoreConfig::low_end();
    else if(profile == "high_end") cfg = app::RenderCoreConfig::high_end();
    else { std::cerr << "Unknown profile: " << profile << "\n"; return 1; }
    cfg.enable_diagnostics = diagnostics;

    log::set_level(level);
    log::set_json_mode(json);
    log::info("lod_sim starting (" + profile + " profile, " + std::to_string(phases.size()) + " phases)");

    testing::ManualClock clock;
    core::FrameDrivenScheduler scheduler(clock);
    SimFactory factory;
    cache::ResourcePool<SimIcon> icons("icons", 100, 30LL * 1024 * 1024);
    app::RenderCore core(clock, scheduler, factory, cfg);

    core.pools().register_pool(icons);
    core.controller().set_transition_callback([&](quality::LodMode from, quality::LodMode to, double fps) {
        std::cout << "t=" << static_cast<long long>(clock.now_ms()) << "ms " << quality::to_string(from) << " -> "
                  << quality::to_string(to) << " at " << fps << " fps\n";
    });

    SimWarmer warmer(icons);
    core.start();
    core.start_warmup(warmer, app::Viewport{{52.52, 13.405}, 12.0});

    std::vector<cache::EntityUpdate> batch(static_cast<size_t>(entity_count));
    for(int i = 0; i < entity_count; ++i) {
        auto& u = batch[static_cast<size_t>(i)];
        u.id = "veh-" + std::to_string(i);
        u.position = {52.0 + 0.001 * (i % 500), 13.0 + 0.001 * (i / 500)};
        u.state["status"] = std::string(i % 3 ? "moving" : "idle");
    }
    const std::unordered_set<std::string> selected{"veh-0", "veh-1"};

    long long frame = 0;
    for(const auto& phase : phases) {
        const double frame_ms = 1000.0 / phase.fps;
        for(int f = 0; f < phase.frames; ++f, ++frame) {
            clock.advance(frame_ms);
            scheduler.advance();
            core.on_frame(frame_ms);
            if(frame % batch_every == 0) {
                // A tenth of the fleet moves every batch.
                for(size_t i = static_cast<size_t>(frame) % 10; i < batch.size(); i += 10) batch[i].position.lon += 2e-5;
                core.offer_batch(batch, selected);
            }
            // Half a frame of the trace is treated as already spent when the idle slot runs.
            scheduler.run_idle(frame_ms * 0.5);
        }
    }

    const auto d = core.diagnostics();
    core.stop();

    if(json) {
        std::ostringstream oss;
        oss << '{'
            << "\"frames\":" << frame << ','
            << "\"fps\":" << d.fps << ','
            << "\"mode\":\"" << quality::to_string(d.mode) << "\","
            << "\"mode_changes\":" << d.mode_changes << ','
            << "\"entities\":" << d.entities.size << ','
            << "\"efficiency\":" << d.entities.efficiency << ','
            << "\"built\":" << factory.built << ','
            << "\"disposed\":" << factory.disposed << ','
            << "\"tiles\":" << warmer.tiles << ','
            << "\"idle_overrun_rate\":" << d.idle.overrun_rate() << ','
            << "\"pools\":[";
        for(size_t i = 0; i < d.pools.size(); ++i) {
            const auto& p = d.pools[i];
            oss << "{\"name\":\"" << p.name << "\",\"entries\":" << p.entries << ",\"bytes\":" << p.bytes
                << ",\"evictions\":" << p.evictions << '}';
            if(i + 1 < d.pools.size()) oss << ',';
        }
        oss << "]}";
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << "Frames: " << frame << "\n";
        std::cout << d.to_string() << "\n";
        for(const auto& p : d.pools) std::cout << "  " << cache::to_string(p) << "\n";
        for(const auto& t : d.throttles) {
            std::cout << "  throttle " << t.channel << ": " << t.accepted << " accepted, " << t.skipped
                      << " skipped, interval " << t.interval_ms << "ms\n";
        }
        std::cout << "  visuals built " << factory.built << ", disposed " << factory.disposed << ", tiles prefetched "
                  << warmer.tiles << "\n";
    }

    log::info("lod_sim finished.");
    return 0;
}
