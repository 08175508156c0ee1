#include <gridseries/engine/cell_weighter.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace gridseries::engine {

namespace {

// Clipped area below this fraction of a cell is treated as boundary contact.
constexpr double kMinOverlap = 1e-12;

enum class Axis : std::uint8_t { U, V };

auto coord(const Point& p, Axis axis) noexcept -> double {
    return axis == Axis::U ? p.x : p.y;
}

// Sutherland-Hodgman against one axis-aligned half plane. `ring` is open
// (no repeated closing vertex); keeps the side where coord >= bound when
// `keep_above`, coord <= bound otherwise.
auto clip_half_plane(const std::vector<Point>& ring, Axis axis, double bound, bool keep_above)
    -> std::vector<Point> {
    std::vector<Point> out;
    if (ring.empty()) {
        return out;
    }
    out.reserve(ring.size() + 4);
    auto inside = [&](const Point& p) {
        double c = coord(p, axis);
        return keep_above ? c >= bound : c <= bound;
    };
    auto cross = [&](const Point& p, const Point& q) {
        double t = (bound - coord(p, axis)) / (coord(q, axis) - coord(p, axis));
        if (axis == Axis::U) {
            return Point{bound, p.y + t * (q.y - p.y)};
        }
        return Point{p.x + t * (q.x - p.x), bound};
    };
    const Point* prev = &ring.back();
    bool prev_in = inside(*prev);
    for (const auto& cur : ring) {
        bool cur_in = inside(cur);
        if (cur_in) {
            if (!prev_in) {
                out.push_back(cross(*prev, cur));
            }
            out.push_back(cur);
        } else if (prev_in) {
            out.push_back(cross(*prev, cur));
        }
        prev = &cur;
        prev_in = cur_in;
    }
    return out;
}

auto clip_band(const std::vector<Point>& ring, Axis axis, double lo, double hi)
    -> std::vector<Point> {
    auto lower = clip_half_plane(ring, axis, lo, true);
    if (lower.size() < 3) {
        return {};
    }
    auto both = clip_half_plane(lower, axis, hi, false);
    if (both.size() < 3) {
        return {};
    }
    return both;
}

auto open_area(const std::vector<Point>& ring) noexcept -> double {
    double a = 0.0;
    for (std::size_t i = 0, n = ring.size(); i < n; ++i) {
        const auto& p = ring[i];
        const auto& q = ring[(i + 1) % n];
        a += p.x * q.y - q.x * p.y;
    }
    return 0.5 * a;
}

// Window of cells a geography's bounds can reach, in index space.
struct Window {
    std::size_t row0 = 0;
    std::size_t row1 = 0;  // exclusive
    std::size_t col0 = 0;
    std::size_t col1 = 0;  // exclusive

    [[nodiscard]] auto empty() const noexcept -> bool { return row0 >= row1 || col0 >= col1; }
    [[nodiscard]] auto width() const noexcept -> std::size_t { return col1 - col0; }
};

auto clamp_span(double lo, double hi, std::size_t n, std::size_t& first, std::size_t& last)
    -> void {
    double a = std::max(std::floor(lo), 0.0);
    double b = std::min(std::ceil(hi), static_cast<double>(n));
    if (!(a < b)) {
        first = last = 0;
        return;
    }
    first = static_cast<std::size_t>(a);
    last = static_cast<std::size_t>(b);
}

}  // namespace

CellWeighter::CellWeighter(GridGeometry geometry, Strategy strategy)
    : geometry_(geometry),
      strategy_(strategy == Strategy::Downscale ? Strategy::AllTouched : strategy) {}

auto CellWeighter::weights(const Geography& geography) const -> CellWeightMap {
    if (geography.kind() == ShapeKind::Point || strategy_ == Strategy::Default) {
        return single_cell(geography.representative_point());
    }
    auto map = overlap(geography);
    if (map.empty() && geography.area() <= 0.0) {
        // Degenerate polygon: fall back to the cell under its vertices' mean.
        return single_cell(geography.representative_point());
    }
    return map;
}

auto CellWeighter::single_cell(const Point& point) const -> CellWeightMap {
    auto cell = geometry_.locate(point.x, point.y);
    if (!cell) {
        return {};
    }
    return {CellWeight{.row = cell->row, .col = cell->col, .weight = 1.0}};
}

auto CellWeighter::overlap(const Geography& geography) const -> CellWeightMap {
    // Project into index space: u = fractional column, v = fractional row.
    auto to_index = [this](const Ring& ring) {
        std::vector<Point> out;
        out.reserve(ring.size());
        for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
            out.push_back(Point{geometry_.column_coordinate(ring[i].x),
                                geometry_.row_coordinate(ring[i].y)});
        }
        return out;
    };

    auto bounds = geography.bounds();
    Window win;
    {
        double u0 = geometry_.column_coordinate(bounds.min_x);
        double u1 = geometry_.column_coordinate(bounds.max_x);
        double v0 = geometry_.row_coordinate(bounds.min_y);
        double v1 = geometry_.row_coordinate(bounds.max_y);
        clamp_span(std::min(v0, v1), std::max(v0, v1), geometry_.rows, win.row0, win.row1);
        clamp_span(std::min(u0, u1), std::max(u0, u1), geometry_.cols, win.col0, win.col1);
    }
    if (win.empty()) {
        return {};
    }

    std::vector<double> areas((win.row1 - win.row0) * win.width(), 0.0);

    // Outer rings add, holes subtract, whatever their winding.
    auto add_ring = [&](const Ring& ring, double sign) {
        auto projected = to_index(ring);
        double total = open_area(projected);
        if (total == 0.0) {
            return;
        }
        double s = total > 0.0 ? sign : -sign;
        for (std::size_t r = win.row0; r < win.row1; ++r) {
            auto strip = clip_band(projected, Axis::V, static_cast<double>(r),
                                   static_cast<double>(r + 1));
            if (strip.empty()) {
                continue;
            }
            double umin = strip.front().x;
            double umax = strip.front().x;
            for (const auto& p : strip) {
                umin = std::min(umin, p.x);
                umax = std::max(umax, p.x);
            }
            std::size_t c0 = 0;
            std::size_t c1 = 0;
            clamp_span(umin, umax, geometry_.cols, c0, c1);
            // Hole vertices may stray past the outer ring's window.
            c0 = std::max(c0, win.col0);
            c1 = std::min(c1, win.col1);
            for (std::size_t c = c0; c < c1; ++c) {
                auto piece = clip_band(strip, Axis::U, static_cast<double>(c),
                                       static_cast<double>(c + 1));
                if (piece.empty()) {
                    continue;
                }
                areas[(r - win.row0) * win.width() + (c - win.col0)] += s * open_area(piece);
            }
        }
    };

    for (const auto& part : geography.parts()) {
        add_ring(part.outer, 1.0);
        for (const auto& hole : part.holes) {
            add_ring(hole, -1.0);
        }
    }

    CellWeightMap map;
    double total = 0.0;
    for (std::size_t r = win.row0; r < win.row1; ++r) {
        for (std::size_t c = win.col0; c < win.col1; ++c) {
            double a = areas[(r - win.row0) * win.width() + (c - win.col0)];
            if (a > kMinOverlap) {
                map.push_back(CellWeight{.row = r, .col = c, .weight = a});
                total += a;
            }
        }
    }
    if (map.empty()) {
        return map;
    }

    if (strategy_ == Strategy::AllTouched) {
        const double w = 1.0 / static_cast<double>(map.size());
        for (auto& cw : map) {
            cw.weight = w;
        }
    } else {
        for (auto& cw : map) {
            cw.weight /= total;
        }
    }
    return map;
}

auto fold_weights(const CellWeightMap& fine, std::size_t factor) -> CellWeightMap {
    if (factor <= 1) {
        return fine;
    }
    CellWeightMap folded;
    folded.reserve(fine.size() / factor + 1);
    for (const auto& cw : fine) {
        folded.push_back(
            CellWeight{.row = cw.row / factor, .col = cw.col / factor, .weight = cw.weight});
    }
    std::stable_sort(folded.begin(), folded.end(), [](const CellWeight& a, const CellWeight& b) {
        return a.row != b.row ? a.row < b.row : a.col < b.col;
    });
    CellWeightMap out;
    out.reserve(folded.size());
    for (const auto& cw : folded) {
        if (!out.empty() && out.back().row == cw.row && out.back().col == cw.col) {
            out.back().weight += cw.weight;
        } else {
            out.push_back(cw);
        }
    }
    return out;
}

}  // namespace gridseries::engine
