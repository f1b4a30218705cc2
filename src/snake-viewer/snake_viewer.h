#ifndef SNAKE_VIEWER_SNAKE_VIEWER_H
#define SNAKE_VIEWER_SNAKE_VIEWER_H

#include "generation_history.h"
#include "replay_player.h"
#include "simulation_config.h"
#include "simulation_driver.h"
#include <SDL2/SDL.h>
#include <atomic>
#include <cstdint>

namespace snake_viewer {

// Evolves between frames and replays the best network of each finished
// generation.
class SnakeViewer {
private:
    SDL_Window* window_;
    SDL_Renderer* renderer_;
    bool running_;
    bool paused_;

    snake_evolution::SimulationConfig config_;
    snake_evolution::SimulationDriver driver_;
    snake_evolution::ReplayPlayer replay_;
    snake_evolution::GenerationHistory history_;

    uint32_t step_delay_ms_;

    static constexpr int CELL_SIZE = 32;
    static constexpr int PANEL_WIDTH = 220;
    static constexpr int MARGIN = 16;
    static constexpr int LIVE_BOARD_TOP = 100;
    static constexpr int GRAPH_HEIGHT = 48;
    static constexpr uint32_t EVOLUTION_BUDGET_MS = 12;
    static constexpr uint32_t MIN_STEP_DELAY_MS = 5;
    static constexpr uint32_t MAX_STEP_DELAY_MS = 500;

public:
    explicit SnakeViewer(const snake_evolution::SimulationConfig& config);
    ~SnakeViewer();

    // Opens the window; nothing to open in low detail mode.
    bool initialize();

    // Returns when the window is closed or interrupted is set.
    void run(const std::atomic<bool>& interrupted);

private:
    bool evolution_finished() const;
    void evolve_for(uint32_t budget_ms);

    void run_window(const std::atomic<bool>& interrupted);
    void run_low_detail(const std::atomic<bool>& interrupted);
    void log_replay_result() const;

    void handle_events();
    void handle_keypress(SDL_Keycode key);
    void update_title();

    void render();
    void render_board();
    void render_panel();
    void render_live_board(int x, int y, int width, const snake_evolution::RenderSnapshot& live);
    void render_bar(int x, int y, int width, double fraction, uint8_t r, uint8_t g, uint8_t b);

    template <typename Values>
    void render_sparkline(int x, int y, int width, const Values& values, double max_value,
                          uint8_t r, uint8_t g, uint8_t b);

    void cleanup();
};

} // namespace snake_viewer

#endif // SNAKE_VIEWER_SNAKE_VIEWER_H
