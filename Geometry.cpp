#include "Game.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace hexword {

int Geometry::HalfGridWidth(const Grid& grid) {
  int widest = 0;
  for (int y = 0; y < grid.height(); ++y) {
    int last = 0;
    for (int x = grid.width() - 1; x >= 0; --x) {
      if (grid.IsPresent({x, y})) {
        last = x;
        break;
      }
    }
    int width = (last + 1) * 2;
    if (y & 1) {
      ++width;
    }
    widest = std::max(widest, width);
  }
  return widest;
}

Geometry::Geometry(const Grid& grid, double width) : grid_(grid) {
  const int half_width = std::max(1, HalfGridWidth(grid));
  step_x_ = width * 2.0 / half_width;
  radius_ = step_x_ / std::sqrt(3.0);
  step_y_ = radius_ * 1.5;
  origin_ = Eigen::Vector2d(step_x_ / 2.0, radius_);
  height_ = origin_.y() + (std::max(1, grid.height()) - 1) * step_y_ + radius_;
}

Eigen::Vector2d Geometry::CellCenter(Coord cell) const {
  double x = origin_.x() + cell.x * step_x_;
  if (cell.y & 1) {
    x += step_x_ / 2.0;
  }
  return Eigen::Vector2d(x, origin_.y() + cell.y * step_y_);
}

bool Geometry::CellAt(const Eigen::Vector2d& point, Coord* out) const {
  double best = std::numeric_limits<double>::infinity();
  Coord best_cell;
  for (int y = 0; y < grid_.height(); ++y) {
    for (int x = 0; x < grid_.width(); ++x) {
      if (!grid_.IsPresent({x, y})) {
        continue;
      }
      double distance = (point - CellCenter({x, y})).norm();
      if (distance < best) {
        best = distance;
        best_cell = {x, y};
      }
    }
  }
  // The nearest centre owns the point as long as it lies within the hexagon's
  // outer radius.
  if (best > radius_) {
    return false;
  }
  if (out) {
    *out = best_cell;
  }
  return true;
}

}  // namespace hexword
