#include <gridseries/core/geography.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace gridseries {

namespace {

auto close_ring(Ring& ring) -> bool {
    if (ring.empty()) {
        return false;
    }
    if (ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
    // closed ring: at least three distinct vertices plus the closing one
    return ring.size() >= 4;
}

struct Moments {
    double area = 0.0;
    double cx = 0.0;
    double cy = 0.0;
};

auto ring_moments(const Ring& ring) noexcept -> Moments {
    Moments m;
    for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
        const auto& p = ring[i];
        const auto& q = ring[i + 1];
        double cross = p.x * q.y - q.x * p.y;
        m.area += cross;
        m.cx += (p.x + q.x) * cross;
        m.cy += (p.y + q.y) * cross;
    }
    m.area *= 0.5;
    m.cx /= 6.0;
    m.cy /= 6.0;
    return m;
}

}  // namespace

auto signed_area(const Ring& ring) noexcept -> double {
    return ring_moments(ring).area;
}

auto Geography::polygon(std::string id, std::vector<Polygon> parts) -> Result<Geography> {
    if (parts.empty()) {
        return invalid_parameter(fmt::format("geography '{}' has no polygon parts", id));
    }
    for (auto& part : parts) {
        if (!close_ring(part.outer)) {
            return invalid_parameter(
                fmt::format("geography '{}' has an outer ring with fewer than 3 vertices", id));
        }
        for (auto& hole : part.holes) {
            if (!close_ring(hole)) {
                return invalid_parameter(
                    fmt::format("geography '{}' has a hole with fewer than 3 vertices", id));
            }
        }
    }
    Geography g;
    g.id_ = std::move(id);
    g.kind_ = ShapeKind::Polygon;
    g.parts_ = std::move(parts);
    return g;
}

auto Geography::point(std::string id, Point location) -> Geography {
    Geography g;
    g.id_ = std::move(id);
    g.kind_ = ShapeKind::Point;
    g.location_ = location;
    return g;
}

auto Geography::bounds() const noexcept -> Box {
    if (kind_ == ShapeKind::Point) {
        return Box{location_.x, location_.y, location_.x, location_.y};
    }
    constexpr double inf = std::numeric_limits<double>::infinity();
    Box box{inf, inf, -inf, -inf};
    for (const auto& part : parts_) {
        for (const auto& p : part.outer) {
            box.min_x = std::min(box.min_x, p.x);
            box.min_y = std::min(box.min_y, p.y);
            box.max_x = std::max(box.max_x, p.x);
            box.max_y = std::max(box.max_y, p.y);
        }
    }
    return box;
}

auto Geography::area() const noexcept -> double {
    double total = 0.0;
    for (const auto& part : parts_) {
        double a = std::abs(signed_area(part.outer));
        for (const auto& hole : part.holes) {
            a -= std::abs(signed_area(hole));
        }
        total += a;
    }
    return std::max(total, 0.0);
}

auto Geography::representative_point() const noexcept -> Point {
    if (kind_ == ShapeKind::Point) {
        return location_;
    }
    // Orientation-independent: outer rings add area, holes remove it.
    Moments sum;
    auto accumulate = [&sum](const Ring& ring, double sign) {
        auto m = ring_moments(ring);
        double s = m.area < 0.0 ? -sign : sign;
        sum.area += s * m.area;
        sum.cx += s * m.cx;
        sum.cy += s * m.cy;
    };
    for (const auto& part : parts_) {
        accumulate(part.outer, 1.0);
        for (const auto& hole : part.holes) {
            accumulate(hole, -1.0);
        }
    }
    if (sum.area > 0.0 && std::isfinite(sum.cx / sum.area)) {
        return Point{sum.cx / sum.area, sum.cy / sum.area};
    }

    double x = 0.0;
    double y = 0.0;
    std::size_t n = 0;
    for (const auto& part : parts_) {
        // skip the closing vertex
        for (std::size_t i = 0; i + 1 < part.outer.size(); ++i) {
            x += part.outer[i].x;
            y += part.outer[i].y;
            ++n;
        }
    }
    if (n == 0) {
        return Point{};
    }
    return Point{x / static_cast<double>(n), y / static_cast<double>(n)};
}

auto GeographySet::add(Geography geography) -> Result<void> {
    if (index_.count(geography.id()) != 0) {
        return invalid_parameter(fmt::format("duplicate geography id '{}'", geography.id()));
    }
    index_.emplace(geography.id(), items_.size());
    items_.push_back(std::move(geography));
    return {};
}

auto GeographySet::find(std::string_view id) const -> const Geography* {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return nullptr;
    }
    return &items_[it->second];
}

}  // namespace gridseries
