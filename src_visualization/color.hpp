#pragma once

#include <algorithm>

#include "../src_headless/common/types.hpp"
#include "config.hpp"

struct hsv {
    double h;  // angle in degrees
    double s;  // a fraction between 0 and 1
    double v;  // a fraction between 0 and 1
};

struct rgb {
    int r, g, b, a;

    rgb() : r(255), g(255), b(255), a(255) {}
    rgb(int r_in, int g_in, int b_in, int alpha = 255) : r(r_in), g(g_in), b(b_in), a(alpha) {}

    rgb(hsv c, int alpha = 255) : a(alpha) {
        double r_, g_, b_;

        if (c.s <= 0.0) {
            r_ = g_ = b_ = c.v;
        } else {
            double hh = c.h >= 360.0 ? 0.0 : c.h / 60.0;
            long i = (long)hh;
            double ff = hh - i;
            double p = c.v * (1.0 - c.s);
            double q = c.v * (1.0 - (c.s * ff));
            double t = c.v * (1.0 - (c.s * (1.0 - ff)));

            switch (i) {
                case 0:
                    r_ = c.v, g_ = t, b_ = p;
                    break;
                case 1:
                    r_ = q, g_ = c.v, b_ = p;
                    break;
                case 2:
                    r_ = p, g_ = c.v, b_ = t;
                    break;
                case 3:
                    r_ = p, g_ = q, b_ = c.v;
                    break;
                case 4:
                    r_ = t, g_ = p, b_ = c.v;
                    break;
                default:
                    r_ = c.v, g_ = p, b_ = q;
                    break;
            }
        }
        r = (int)(r_ * 255);
        g = (int)(g_ * 255);
        b = (int)(b_ * 255);
    }
};

// Trace cell colour: hue by kind, brightness and alpha by concentration
// relative to the configured maximum.
inline rgb trace_color(colony::TraceKind kind, double concentration, double max_concentration) {
    double level = max_concentration > 0 ? std::min(1.0, concentration / max_concentration) : 0.0;
    double hue = kind == colony::TraceKind::HOME_BOUND ? HOME_BOUND_HUE : FOOD_BOUND_HUE;
    return rgb(hsv{hue, 0.8, 0.35 + 0.65 * level}, (int)(60 + 140 * level));
}

// Morsels fade from bright to dark green as they empty.
inline rgb morsel_color(std::uint64_t remaining, std::uint64_t initial) {
    double level = initial > 0 ? std::min(1.0, (double)remaining / (double)initial) : 0.0;
    return rgb(hsv{120.0, 0.9, 0.4 + 0.6 * level});
}
