// Ant Colony Simulation with OpenMP + SDL2 Visualization
// Draws the same engine the headless runners use, one snapshot per frame

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <omp.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include "../src_headless/common/config.hpp"
#include "../src_headless/common/simulation.hpp"
#include "color.hpp"
#include "config.hpp"

using colony::EntityKind;
using colony::EntityView;
using colony::SimConfig;
using colony::SimStats;
using colony::Simulation;
using colony::TaskState;
using colony::TraceKind;

// ============================================================================
// View Class - SDL2 Visualization
// ============================================================================

class View {
   public:
    SDL_Window* window;
    SDL_Renderer* renderer;
    TTF_Font* font;
    bool running;
    bool paused;
    bool show_home_bound;
    bool show_food_bound;
    bool reported;
    int simulation_speed;
    int cell_size;
    double simulation_time_ms;

    SimConfig config;
    std::unique_ptr<Simulation> sim;

    explicit View(const SimConfig& config_in)
        : window(nullptr),
          renderer(nullptr),
          font(nullptr),
          running(true),
          paused(false),
          show_home_bound(true),
          show_food_bound(true),
          reported(false),
          simulation_speed(1),
          cell_size(std::max(1, WINDOW_SIZE / std::max(config_in.width, config_in.height))),
          simulation_time_ms(0),
          config(config_in),
          sim(std::make_unique<Simulation>(config_in)) {}

    ~View() {
        cleanup();
    }

    bool init() {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
            return false;
        }

        if (TTF_Init() < 0) {
            std::cerr << "TTF init failed: " << TTF_GetError() << std::endl;
            return false;
        }

        window = SDL_CreateWindow(
            "Ant Colony Simulation (Visualization)",
            SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
            cell_size * config.width, cell_size * config.height + HUD_HEIGHT,
            SDL_WINDOW_SHOWN);

        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
        if (!renderer) {
            renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

        const char* font_paths[] = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
            nullptr};

        for (int i = 0; font_paths[i] != nullptr; ++i) {
            font = TTF_OpenFont(font_paths[i], 14);
            if (font)
                break;
        }

        if (!font) {
            std::cerr << "Warning: Could not load font, HUD will be disabled" << std::endl;
        }

        return true;
    }

    void cleanup() {
        if (font)
            TTF_CloseFont(font);
        if (renderer)
            SDL_DestroyRenderer(renderer);
        if (window)
            SDL_DestroyWindow(window);
        font = nullptr;
        renderer = nullptr;
        window = nullptr;
        TTF_Quit();
        SDL_Quit();
    }

    void reset() {
        sim = std::make_unique<Simulation>(config);
        simulation_time_ms = 0;
        reported = false;
    }

    void handleEvents() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN) {
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                    case SDLK_q:
                        running = false;
                        break;
                    case SDLK_SPACE:
                        paused = !paused;
                        break;
                    case SDLK_r:
                        reset();
                        break;
                    case SDLK_h:
                        show_home_bound = !show_home_bound;
                        break;
                    case SDLK_f:
                        show_food_bound = !show_food_bound;
                        break;
                    case SDLK_UP:
                        simulation_speed = std::min(simulation_speed * 2, MAX_SPEED);
                        break;
                    case SDLK_DOWN:
                        simulation_speed = std::max(simulation_speed / 2, 1);
                        break;
                }
            }
        }
    }

    void step() {
        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < simulation_speed && !sim->is_simulation_over(); ++i) {
            sim->nextgen();
        }
        auto end = std::chrono::high_resolution_clock::now();
        simulation_time_ms += std::chrono::duration<double, std::milli>(end - start).count();

        if (sim->is_simulation_over() && !reported) {
            SimStats stats = sim->stats();
            std::cout << "\n=== Simulation Complete ===" << std::endl;
            std::cout << "Collected " << stats.food_collected << "/" << stats.food_available << " food in "
                      << stats.generation << " generations" << std::endl;
            std::cout << "Total simulation time: " << simulation_time_ms << " ms" << std::endl;
            if (stats.generation > 0) {
                std::cout << "Average time per generation: " << (simulation_time_ms / stats.generation) << " ms"
                          << std::endl;
            }
            reported = true;
        }
    }

    void fillCell(const colony::Position& p, const rgb& color, int inset = 0) {
        SDL_Rect rect = {p.x * cell_size + inset, HUD_HEIGHT + p.y * cell_size + inset,
                         cell_size - 2 * inset, cell_size - 2 * inset};
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
        SDL_RenderFillRect(renderer, &rect);
    }

    void drawEntity(const EntityView& entity) {
        const double max_concentration = sim->trace_field().max_concentration();
        switch (entity.kind) {
            case EntityKind::TRACE: {
                bool visible = entity.scent == TraceKind::HOME_BOUND ? show_home_bound : show_food_bound;
                if (!visible || entity.concentration < max_concentration * TRACE_DRAW_THRESHOLD)
                    return;
                fillCell(entity.position, trace_color(entity.scent, entity.concentration, max_concentration));
                break;
            }
            case EntityKind::NEST:
                // Nest - brown
                fillCell(entity.position, rgb(139, 69, 19));
                break;
            case EntityKind::MORSEL:
                fillCell(entity.position, morsel_color(entity.food, (std::uint64_t)config.morsel_food), 1);
                break;
            case EntityKind::AGENT:
                // Carrying food - yellow, foraging - white
                fillCell(entity.position,
                         entity.task == TaskState::CARRYING ? rgb(255, 200, 0) : rgb(255, 255, 255),
                         cell_size / 4);
                break;
        }
    }

    void render() {
        SDL_SetRenderDrawColor(renderer, 20, 20, 20, 255);
        SDL_RenderClear(renderer);

        // Traces underneath, then landmarks, then agents on top
        std::vector<EntityView> entities = sim->snapshot();
        std::stable_sort(entities.begin(), entities.end(), [](const EntityView& a, const EntityView& b) {
            return layer(a.kind) < layer(b.kind);
        });
        for (const EntityView& entity : entities) {
            drawEntity(entity);
        }

        renderHUD();

        SDL_RenderPresent(renderer);
    }

    static int layer(EntityKind kind) {
        switch (kind) {
            case EntityKind::TRACE:
                return 0;
            case EntityKind::NEST:
                return 1;
            case EntityKind::MORSEL:
                return 2;
            case EntityKind::AGENT:
                return 3;
        }
        return 4;
    }

    void renderHUD() {
        if (!font)
            return;

        SDL_Color white = {255, 255, 255, 255};
        SDL_Color yellow = {255, 255, 0, 255};
        SimStats stats = sim->stats();
        bool over = sim->is_simulation_over();

        char text[256];
        snprintf(text, sizeof(text),
                 "Generation: %llu | Food: %llu/%llu (%llu carried) | Speed: %dx | %s",
                 (unsigned long long)stats.generation, (unsigned long long)stats.food_collected,
                 (unsigned long long)stats.food_available, (unsigned long long)stats.food_in_transit,
                 simulation_speed, over ? "OVER" : (paused ? "PAUSED" : "RUNNING"));
        renderText(text, 10, 10, over ? yellow : white);

        snprintf(text, sizeof(text),
                 "Controls: SPACE=Pause, R=Reset, H/F=Home/Food traces, UP/DOWN=Speed, Q=Quit");
        renderText(text, 10, 30, white);

        if (stats.generation > 0) {
            snprintf(text, sizeof(text), "Avg generation: %.3f ms | Threads: %d | Traces: %s%s",
                     simulation_time_ms / stats.generation, omp_get_max_threads(),
                     show_home_bound ? "home " : "", show_food_bound ? "food" : "");
            renderText(text, 10, 50, white);
        }
    }

    void renderText(const char* text, int x, int y, SDL_Color color) {
        SDL_Surface* surface = TTF_RenderText_Blended(font, text, color);
        if (surface) {
            SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
            if (texture) {
                SDL_Rect dst = {x, y, surface->w, surface->h};
                SDL_RenderCopy(renderer, texture, nullptr, &dst);
                SDL_DestroyTexture(texture);
            }
            SDL_FreeSurface(surface);
        }
    }

    void run() {
        const int FRAME_DELAY = 1000 / TARGET_FPS;

        std::cout << "=== Ant Colony Simulation (Visualization) ===" << std::endl;
        std::cout << "Grid: " << config.width << "x" << config.height << std::endl;
        std::cout << "Ants: " << config.num_ants << std::endl;
        std::cout << "Morsels: " << config.morsel_count() << std::endl;
        std::cout << "Food per morsel: " << config.morsel_food << std::endl;
        std::cout << "Seed: " << config.seed << std::endl;
        std::cout << "OpenMP threads: " << omp_get_max_threads() << std::endl;
        std::cout << std::endl;
        std::cout << "Controls:" << std::endl;
        std::cout << "  SPACE - Pause/Resume" << std::endl;
        std::cout << "  R     - Reset simulation" << std::endl;
        std::cout << "  H     - Toggle home-bound traces" << std::endl;
        std::cout << "  F     - Toggle food-bound traces" << std::endl;
        std::cout << "  UP    - Increase speed" << std::endl;
        std::cout << "  DOWN  - Decrease speed" << std::endl;
        std::cout << "  Q/ESC - Quit" << std::endl;
        std::cout << "==============================================" << std::endl;

        while (running) {
            Uint32 frame_start = SDL_GetTicks();

            handleEvents();

            if (!paused && !sim->is_simulation_over()) {
                step();
            }

            render();

            Uint32 frame_time = SDL_GetTicks() - frame_start;
            if (frame_time < static_cast<Uint32>(FRAME_DELAY)) {
                SDL_Delay(FRAME_DELAY - frame_time);
            }
        }
    }
};

// Usage: colony_viewer [seed] [threads] [ants]
int main(int argc, char* argv[]) {
    SimConfig config;
    int num_threads = omp_get_max_threads();

    if (argc > 1) {
        config.seed = std::strtoull(argv[1], nullptr, 10);
    }
    if (argc > 2) {
        num_threads = std::atoi(argv[2]);
        if (num_threads > 0)
            omp_set_num_threads(num_threads);
    }
    if (argc > 3) {
        config.num_ants = std::atoi(argv[3]);
    }

    std::cout << "Starting with " << num_threads << " OpenMP threads" << std::endl;

    try {
        View view(config);
        if (!view.init()) {
            std::cerr << "Failed to initialize view" << std::endl;
            return 1;
        }

        view.run();
    } catch (const colony::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
