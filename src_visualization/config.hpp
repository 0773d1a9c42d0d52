#pragma once

// Window configuration - the grid is scaled to fit
#define WINDOW_SIZE 900
#define HUD_HEIGHT 90

#define TARGET_FPS 60
#define MAX_SPEED 64  // Generations per frame

// Trace cells fainter than this fraction of the maximum are not drawn
#define TRACE_DRAW_THRESHOLD 0.02

// Hues (degrees) of the two trace layers
#define HOME_BOUND_HUE 210.0
#define FOOD_BOUND_HUE 0.0
