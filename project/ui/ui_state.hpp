#pragma once

// Everything the overlay widgets can toggle lives here.
struct UIState {
    bool show_panels = false;

    // clicks per panel button, for the stats line and tests
    int scene_clicks     = 0;
    int inspector_clicks = 0;
    int assets_clicks    = 0;
    int menu_clicks      = 0;
};
