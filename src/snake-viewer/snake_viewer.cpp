#include "snake_viewer.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace snake_viewer {

using snake_evolution::GenerationSummary;
using snake_evolution::SimulationConfig;
using snake_evolution::SimulationDriver;

SnakeViewer::SnakeViewer(const SimulationConfig& config)
    : window_(nullptr), renderer_(nullptr), running_(false), paused_(false),
      config_(config), driver_(config),
      replay_(config.game_config(), config.random_seed),
      step_delay_ms_(60) {
    driver_.set_generation_callback(
        [this](const GenerationSummary& summary, const snakenet::NeuralNetwork& best) {
            replay_.offer(summary, best);
            history_.record(summary);
        });
}

SnakeViewer::~SnakeViewer() {
    cleanup();
}

bool SnakeViewer::initialize() {
    if (config_.low_detail) {
        spdlog::info("Low detail mode, replays are logged as text");
        return true;
    }

    spdlog::info("Initializing Snake Viewer...");

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        spdlog::error("SDL initialization failed: {}", SDL_GetError());
        return false;
    }
    spdlog::debug("SDL initialized successfully");

    const int board_pixels = config_.board_size * CELL_SIZE;
    const int width = board_pixels + PANEL_WIDTH + MARGIN * 3;
    const int panel_height = LIVE_BOARD_TOP + PANEL_WIDTH + (GRAPH_HEIGHT + MARGIN) * 2;
    const int height = std::max(board_pixels, panel_height) + MARGIN * 2;

    window_ = SDL_CreateWindow("Snake Evolution",
                               SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
                               width, height, SDL_WINDOW_SHOWN);
    if (!window_) {
        spdlog::error("Window creation failed: {}", SDL_GetError());
        return false;
    }
    spdlog::debug("Window created: {}x{}", width, height);

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer_) {
        spdlog::error("Renderer creation failed: {}", SDL_GetError());
        return false;
    }

    spdlog::info("Viewer initialization complete");
    return true;
}

bool SnakeViewer::evolution_finished() const {
    return config_.max_generations > 0 && driver_.get_generation() >= config_.max_generations;
}

void SnakeViewer::evolve_for(uint32_t budget_ms) {
    const uint32_t start = SDL_GetTicks();
    while (!evolution_finished() && SDL_GetTicks() - start < budget_ms) {
        driver_.tick();
    }
}

void SnakeViewer::run(const std::atomic<bool>& interrupted) {
    if (config_.low_detail) {
        run_low_detail(interrupted);
    } else {
        run_window(interrupted);
    }
    spdlog::info("Viewer stopped after {} generations, best score {}",
                 driver_.get_generation(), driver_.get_best_score());
}

void SnakeViewer::run_window(const std::atomic<bool>& interrupted) {
    running_ = true;
    uint32_t last_step = SDL_GetTicks();

    while (running_ && !interrupted) {
        handle_events();

        evolve_for(EVOLUTION_BUDGET_MS);

        uint32_t now = SDL_GetTicks();
        if (!paused_ && now - last_step >= step_delay_ms_) {
            replay_.step();
            last_step = now;
        }

        update_title();
        render();
        SDL_Delay(16);
    }
}

void SnakeViewer::run_low_detail(const std::atomic<bool>& interrupted) {
    while (!interrupted && !evolution_finished()) {
        while (!driver_.tick()) {
        }

        // Play the new best network through one full game
        while (replay_.step() && replay_.get_game().is_running()) {
        }
        log_replay_result();
    }
}

void SnakeViewer::log_replay_result() const {
    const auto& game = replay_.get_game();
    const auto& summary = replay_.get_summary();

    std::string reason = "unknown";
    if (auto death = game.get_death_reason()) {
        reason = snakegame::death_reason_name(*death);
    }
    spdlog::info("Replay of generation {}: score {} in {} steps ({})",
                 summary ? summary->generation : 0, game.get_score(), game.get_total_steps(), reason);
    spdlog::info("\n{}", snakegame::board_to_text(game));
}

void SnakeViewer::handle_events() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                running_ = false;
                break;

            case SDL_KEYDOWN:
                handle_keypress(event.key.keysym.sym);
                break;
        }
    }
}

void SnakeViewer::handle_keypress(SDL_Keycode key) {
    switch (key) {
        case SDLK_ESCAPE:
            running_ = false;
            break;

        case SDLK_SPACE:
            paused_ = !paused_;
            spdlog::info("Replay {}", paused_ ? "paused" : "resumed");
            break;

        case SDLK_UP:
            step_delay_ms_ = std::max(MIN_STEP_DELAY_MS, step_delay_ms_ / 2);
            break;

        case SDLK_DOWN:
            step_delay_ms_ = std::min(MAX_STEP_DELAY_MS, step_delay_ms_ * 2);
            break;
    }
}

void SnakeViewer::update_title() {
    std::ostringstream title;
    title << "Snake Evolution";

    const auto& summary = replay_.get_summary();
    if (summary) {
        const auto& game = replay_.get_game();
        title << " - generation " << summary->generation
              << " | replay score " << game.get_score()
              << " | best score " << summary->best_score_so_far
              << " | best fitness " << static_cast<int64_t>(summary->best_fitness);
    } else {
        title << " - waiting for generation 0";
    }
    if (paused_) {
        title << " [paused]";
    }

    SDL_SetWindowTitle(window_, title.str().c_str());
}

void SnakeViewer::render() {
    SDL_SetRenderDrawColor(renderer_, 20, 20, 28, 255);
    SDL_RenderClear(renderer_);

    render_board();
    render_panel();

    SDL_RenderPresent(renderer_);
}

void SnakeViewer::render_board() {
    const int size = config_.board_size;

    SDL_SetRenderDrawColor(renderer_, 35, 35, 45, 255);
    SDL_Rect background = {MARGIN, MARGIN, size * CELL_SIZE, size * CELL_SIZE};
    SDL_RenderFillRect(renderer_, &background);

    SDL_SetRenderDrawColor(renderer_, 45, 45, 58, 255);
    for (int i = 0; i <= size; ++i) {
        int offset = i * CELL_SIZE;
        SDL_RenderDrawLine(renderer_, MARGIN + offset, MARGIN, MARGIN + offset, MARGIN + size * CELL_SIZE);
        SDL_RenderDrawLine(renderer_, MARGIN, MARGIN + offset, MARGIN + size * CELL_SIZE, MARGIN + offset);
    }

    if (!replay_.has_network()) {
        return;
    }

    const auto& game = replay_.get_game();

    auto fill_cell = [this](const snakegame::Point& p, int inset) {
        SDL_Rect cell = {MARGIN + p.x * CELL_SIZE + inset, MARGIN + p.y * CELL_SIZE + inset,
                         CELL_SIZE - inset * 2, CELL_SIZE - inset * 2};
        SDL_RenderFillRect(renderer_, &cell);
    };

    SDL_SetRenderDrawColor(renderer_, 220, 60, 60, 255);
    fill_cell(game.get_food(), 6);

    const bool alive = game.is_running();
    bool head = true;
    for (const auto& segment : game.get_body()) {
        if (head) {
            SDL_SetRenderDrawColor(renderer_, alive ? 140 : 120, alive ? 230 : 120, alive ? 140 : 120, 255);
            head = false;
        } else {
            SDL_SetRenderDrawColor(renderer_, alive ? 60 : 90, alive ? 170 : 90, alive ? 80 : 90, 255);
        }
        fill_cell(segment, 2);
    }
}

void SnakeViewer::render_bar(int x, int y, int width, double fraction, uint8_t r, uint8_t g, uint8_t b) {
    constexpr int BAR_HEIGHT = 14;
    fraction = std::clamp(fraction, 0.0, 1.0);

    SDL_SetRenderDrawColor(renderer_, 50, 50, 60, 255);
    SDL_Rect back = {x, y, width, BAR_HEIGHT};
    SDL_RenderFillRect(renderer_, &back);

    SDL_SetRenderDrawColor(renderer_, r, g, b, 255);
    SDL_Rect front = {x, y, static_cast<int>(width * fraction), BAR_HEIGHT};
    SDL_RenderFillRect(renderer_, &front);
}

void SnakeViewer::render_panel() {
    const int x = MARGIN * 2 + config_.board_size * CELL_SIZE;
    const int width = PANEL_WIDTH;
    const double capacity = static_cast<double>(config_.board_size) * config_.board_size -
                            snakegame::INITIAL_SNAKE_LENGTH;

    const auto& game = replay_.get_game();
    const auto& summary = replay_.get_summary();

    // Replay score, best score of the run, hunger, live genomes in the current generation
    render_bar(x, MARGIN, width, game.get_score() / capacity, 90, 200, 90);
    render_bar(x, MARGIN + 24, width,
               summary ? summary->best_score_so_far / capacity : 0.0, 230, 200, 60);

    const uint32_t limit = std::max<uint32_t>(1, game.get_starvation_threshold());
    render_bar(x, MARGIN + 48, width,
               static_cast<double>(game.get_steps_since_food()) / limit, 220, 90, 60);

    snake_evolution::RenderSnapshot live = driver_.snapshot();
    render_bar(x, MARGIN + 72, width,
               static_cast<double>(live.alive_count) / std::max<uint32_t>(1, config_.population_size),
               90, 140, 230);

    render_live_board(x, MARGIN + LIVE_BOARD_TOP, width, live);

    // Best score and duration of recent generations
    const int graphs_top = MARGIN + LIVE_BOARD_TOP + width + MARGIN;
    render_sparkline(x, graphs_top, width, history_.get_scores(),
                     std::max<double>(1.0, history_.max_score()), 120, 220, 120);
    render_sparkline(x, graphs_top + GRAPH_HEIGHT + MARGIN, width, history_.get_times(),
                     history_.max_time(), 100, 200, 220);
}

template <typename Values>
void SnakeViewer::render_sparkline(int x, int y, int width, const Values& values, double max_value,
                                   uint8_t r, uint8_t g, uint8_t b) {
    SDL_SetRenderDrawColor(renderer_, 50, 50, 60, 255);
    SDL_Rect back = {x, y, width, GRAPH_HEIGHT};
    SDL_RenderFillRect(renderer_, &back);

    if (values.empty() || max_value <= 0.0) {
        return;
    }

    const int column = std::max(1, width / static_cast<int>(history_.get_capacity()));
    SDL_SetRenderDrawColor(renderer_, r, g, b, 255);
    int column_x = x;
    for (const auto& value : values) {
        const double fraction = std::clamp(static_cast<double>(value) / max_value, 0.0, 1.0);
        const int height = std::max(1, static_cast<int>(GRAPH_HEIGHT * fraction));
        SDL_Rect bar = {column_x, y + GRAPH_HEIGHT - height, column, height};
        SDL_RenderFillRect(renderer_, &bar);
        column_x += column;
    }
}

void SnakeViewer::render_live_board(int x, int y, int width, const snake_evolution::RenderSnapshot& live) {
    const int cell = std::max(1, width / live.board_size);

    SDL_SetRenderDrawColor(renderer_, 35, 35, 45, 255);
    SDL_Rect background = {x, y, cell * live.board_size, cell * live.board_size};
    SDL_RenderFillRect(renderer_, &background);

    SDL_SetRenderDrawColor(renderer_, 220, 60, 60, 255);
    SDL_Rect food = {x + live.food.x * cell, y + live.food.y * cell, cell, cell};
    SDL_RenderFillRect(renderer_, &food);

    SDL_SetRenderDrawColor(renderer_, 90, 140, 230, 255);
    for (const auto& segment : live.body) {
        SDL_Rect rect = {x + segment.x * cell, y + segment.y * cell, cell, cell};
        SDL_RenderFillRect(renderer_, &rect);
    }
}

void SnakeViewer::cleanup() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    if (!config_.low_detail) {
        SDL_Quit();
    }
}

} // namespace snake_viewer
